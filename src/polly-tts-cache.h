#pragma once

#include <cstddef>
#include <string>

namespace polly_tts {

// MD5 of "text_voice_engine", lowercase hex.
std::string compute_cache_key(const std::string & text, const std::string & voice, const std::string & engine);

std::string default_cache_dir();

// Flat directory of <key>.mp3 files. File existence is the index; there is
// no locking, so two writers of the same key race to produce identical bytes.
// store() writes a temp file and renames it into place, so readers see
// either no entry or a complete one.
class audio_cache {
public:
    explicit audio_cache(std::string dir);

    // Creates the directory if missing.
    bool init(std::string & err);

    const std::string & dir() const;
    std::string path_for(const std::string & key) const;

    bool contains(const std::string & key) const;

    // Returns false on miss; err is set only when the file exists but can't be read.
    bool lookup(const std::string & key, std::string & audio_out, std::string & err) const;
    bool store(const std::string & key, const std::string & audio, std::string & err) const;

    bool clear(std::string & err) const;
    size_t count() const;

private:
    std::string dir_;
};

} // namespace polly_tts
