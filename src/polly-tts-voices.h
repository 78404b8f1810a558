#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <utility>
#include <vector>

namespace polly_tts {

using json = nlohmann::ordered_json;

struct voice_descriptor {
    std::string id;       // provider voice id, e.g. "Zeina"
    std::string name;     // display name
    std::string language; // provider language code
    std::string gender;
    std::string engine;   // default engine
};

class voice_registry {
public:
    voice_registry(std::vector<std::pair<std::string, voice_descriptor>> voices, std::string default_key);

    // Built-in Arabic voice table.
    static voice_registry arabic();

    const voice_descriptor * find(const std::string & key) const;
    bool contains(const std::string & key) const;

    std::vector<std::string> keys() const;
    const std::string & default_key() const;
    const voice_descriptor & default_voice() const;

    json to_json() const;

private:
    std::vector<std::pair<std::string, voice_descriptor>> voices_;
    std::string default_key_;
};

bool is_known_engine(const std::string & engine);

} // namespace polly_tts
