#include "polly-tts-voices.h"

#include <stdexcept>

namespace polly_tts {

voice_registry::voice_registry(std::vector<std::pair<std::string, voice_descriptor>> voices, std::string default_key)
    : voices_(std::move(voices)), default_key_(std::move(default_key)) {
    if (find(default_key_) == nullptr) {
        throw std::invalid_argument("default voice '" + default_key_ + "' is not in the registry");
    }
}

voice_registry voice_registry::arabic() {
    return voice_registry({
        {"zeina", {"Zeina", "Zeina (Female, Modern Standard Arabic)", "arb", "Female", "standard"}},
        {"hala",  {"Hala",  "Hala (Female, Gulf Arabic)",             "ar-AE", "Female", "neural"}},
    }, "zeina");
}

const voice_descriptor * voice_registry::find(const std::string & key) const {
    for (const auto & kv : voices_) {
        if (kv.first == key) {
            return &kv.second;
        }
    }
    return nullptr;
}

bool voice_registry::contains(const std::string & key) const {
    return find(key) != nullptr;
}

std::vector<std::string> voice_registry::keys() const {
    std::vector<std::string> out;
    out.reserve(voices_.size());
    for (const auto & kv : voices_) {
        out.push_back(kv.first);
    }
    return out;
}

const std::string & voice_registry::default_key() const {
    return default_key_;
}

const voice_descriptor & voice_registry::default_voice() const {
    return *find(default_key_);
}

json voice_registry::to_json() const {
    json out = json::object();
    for (const auto & kv : voices_) {
        out[kv.first] = {
            {"id", kv.second.id},
            {"name", kv.second.name},
            {"language", kv.second.language},
            {"gender", kv.second.gender},
            {"engine", kv.second.engine},
        };
    }
    return out;
}

bool is_known_engine(const std::string & engine) {
    return engine == "standard" || engine == "neural";
}

} // namespace polly_tts
