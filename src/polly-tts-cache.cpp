#include "polly-tts-cache.h"

#include <openssl/evp.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

namespace polly_tts {

static const char * k_cache_suffix = ".mp3";

std::string compute_cache_key(const std::string & text, const std::string & voice, const std::string & engine) {
    const std::string material = text + "_" + voice + "_" + engine;

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int n_digest = 0;
    if (EVP_Digest(material.data(), material.size(), digest, &n_digest, EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(md5) failed");
    }

    static const char * hex = "0123456789abcdef";
    std::string out;
    out.reserve((size_t) n_digest * 2);
    for (unsigned int i = 0; i < n_digest; ++i) {
        out.push_back(hex[digest[i] >> 4]);
        out.push_back(hex[digest[i] & 0x0f]);
    }
    return out;
}

std::string default_cache_dir() {
    std::error_code ec;
    std::filesystem::path tmp = std::filesystem::temp_directory_path(ec);
    if (ec) {
        tmp = "/tmp";
    }
    return (tmp / "arabic_tutor_cache").string();
}

audio_cache::audio_cache(std::string dir) : dir_(std::move(dir)) {
}

bool audio_cache::init(std::string & err) {
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) {
        err = "failed to create cache dir " + dir_ + ": " + ec.message();
        return false;
    }
    return true;
}

const std::string & audio_cache::dir() const {
    return dir_;
}

std::string audio_cache::path_for(const std::string & key) const {
    return (std::filesystem::path(dir_) / (key + k_cache_suffix)).string();
}

bool audio_cache::contains(const std::string & key) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(path_for(key), ec);
}

bool audio_cache::lookup(const std::string & key, std::string & audio_out, std::string & err) const {
    if (!contains(key)) {
        return false;
    }

    const std::string path = path_for(key);
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        err = "failed to open file for read: " + path;
        return false;
    }
    file.seekg(0, std::ios::end);
    const auto end_pos = file.tellg();
    if (end_pos < 0) {
        err = "failed to seek file: " + path;
        return false;
    }
    audio_out.resize((size_t) end_pos);
    file.seekg(0, std::ios::beg);
    if (!audio_out.empty()) {
        file.read(&audio_out[0], (std::streamsize) audio_out.size());
        if (!file.good()) {
            err = "failed to read file: " + path;
            audio_out.clear();
            return false;
        }
    }
    return true;
}

// <key>.mp3.tmp.<thread>.<seq>; the extension no longer matches so count() skips it
static std::string make_temp_name(const std::string & key) {
    static std::atomic<unsigned long> seq{0};
    const size_t tid = std::hash<std::thread::id>()(std::this_thread::get_id());
    const auto ts = std::chrono::steady_clock::now().time_since_epoch().count();
    return key + k_cache_suffix + ".tmp." + std::to_string(tid) + "-" + std::to_string((long long) ts) + "." +
           std::to_string(seq.fetch_add(1));
}

bool audio_cache::store(const std::string & key, const std::string & audio, std::string & err) const {
    const std::string path = path_for(key);
    {
        std::error_code ec;
        std::filesystem::create_directories(dir_, ec);
    }

    // written aside and renamed over the entry, so a failed write never leaves a partial hit
    const std::filesystem::path tmp_path = std::filesystem::path(dir_) / make_temp_name(key);
    {
        std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            err = "failed to open file for write: " + tmp_path.string();
            return false;
        }
        file.write(audio.data(), (std::streamsize) audio.size());
        file.close();
        if (file.fail()) {
            std::error_code ec;
            std::filesystem::remove(tmp_path, ec);
            err = "failed to write file: " + tmp_path.string();
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        std::error_code rm_ec;
        std::filesystem::remove(tmp_path, rm_ec);
        err = "failed to move " + tmp_path.string() + " to " + path + ": " + ec.message();
        return false;
    }
    return true;
}

bool audio_cache::clear(std::string & err) const {
    std::error_code ec;
    if (std::filesystem::exists(dir_, ec)) {
        std::filesystem::remove_all(dir_, ec);
        if (ec) {
            err = "failed to remove cache dir " + dir_ + ": " + ec.message();
            return false;
        }
    }
    std::filesystem::create_directories(dir_, ec);
    if (ec) {
        err = "failed to recreate cache dir " + dir_ + ": " + ec.message();
        return false;
    }
    return true;
}

size_t audio_cache::count() const {
    std::error_code ec;
    size_t n = 0;
    for (std::filesystem::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && it->path().extension() == k_cache_suffix) {
            ++n;
        }
    }
    return n;
}

} // namespace polly_tts
