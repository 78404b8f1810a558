#pragma once

#include "polly-tts-synth.h"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <sys/resource.h>

// Records every call; replies with canned bytes or a canned error.
class stub_provider : public polly_tts::speech_provider {
public:
    const char * name() const override { return "stub"; }

    bool synthesize(const polly_tts::provider_request & req, std::string & audio_out, polly_tts::provider_error & err) override {
        calls.push_back(req);
        if (throw_on_call) {
            throw std::runtime_error("stub provider exploded");
        }
        if (fail) {
            err = error;
            return false;
        }
        audio_out = "ID3-" + req.voice_id + "-" + req.engine + "-" + req.text;
        return true;
    }

    size_t call_count() const { return calls.size(); }

    std::vector<polly_tts::provider_request> calls;
    bool fail = false;
    bool throw_on_call = false;
    polly_tts::provider_error error;
};

// Unique directory under the system temp dir, removed on scope exit.
class scoped_temp_dir {
public:
    explicit scoped_temp_dir(const std::string & tag) {
        const auto ts = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() / ("polly-tts-test-" + tag + "-" + std::to_string(ts));
    }
    ~scoped_temp_dir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    scoped_temp_dir(const scoped_temp_dir &) = delete;
    scoped_temp_dir & operator=(const scoped_temp_dir &) = delete;

    std::string str() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

// Lowers RLIMIT_FSIZE for the current process so large writes fail with EFBIG
// instead of raising SIGXFSZ. Restores both on scope exit.
class scoped_file_size_limit {
public:
    explicit scoped_file_size_limit(rlim_t bytes) {
        prev_handler_ = std::signal(SIGXFSZ, SIG_IGN);
        active_ = getrlimit(RLIMIT_FSIZE, &prev_) == 0;
        if (active_) {
            struct rlimit lim = prev_;
            lim.rlim_cur = bytes;
            active_ = setrlimit(RLIMIT_FSIZE, &lim) == 0;
        }
    }
    ~scoped_file_size_limit() {
        if (active_) {
            setrlimit(RLIMIT_FSIZE, &prev_);
        }
        std::signal(SIGXFSZ, prev_handler_ == SIG_ERR ? SIG_DFL : prev_handler_);
    }

    scoped_file_size_limit(const scoped_file_size_limit &) = delete;
    scoped_file_size_limit & operator=(const scoped_file_size_limit &) = delete;

    bool active() const { return active_; }

private:
    struct rlimit prev_ {};
    void (*prev_handler_)(int) = SIG_DFL;
    bool active_ = false;
};

// Every entry in dir, cache files and leftovers alike.
inline size_t count_dir_entries(const std::string & dir) {
    std::error_code ec;
    size_t n = 0;
    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        ++n;
    }
    return n;
}
