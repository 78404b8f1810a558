#include "polly-tts-aws.h"
#include "polly-tts-cache.h"
#include "polly-tts-synth.h"
#include "polly-tts-voices.h"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>

struct cli_params {
    std::string text;
    std::string text_file;
    std::string output = "output.mp3";

    std::string voice;
    std::string engine;
    std::string rate;
    bool has_voice = false;
    bool has_engine = false;
    bool has_rate = false;
    bool ssml = false;

    std::string cache_dir;
    bool no_cache = false;
    bool clear_cache = false;
    bool list_voices = false;

    std::string region;
    int32_t timeout_sec = 30;
    bool debug = false;
    bool show_help = false;
};

static void print_usage(const char * argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "  %s (-t TEXT | -f FNAME) [options]\n"
        "  %s --list-voices\n"
        "  %s --clear-cache [--cache-dir DIR]\n\n"
        "Synthesis:\n"
        "  -t, --text TEXT                 input text\n"
        "  -f, --text-file FNAME           input text file\n"
        "  -o, --output FNAME              output mp3 (default: output.mp3)\n"
        "  --voice KEY                     voice key (default: zeina)\n"
        "  --engine STR                    standard | neural (default: standard)\n"
        "  --ssml                          wrap the text in <speak><prosody><lang> markup\n"
        "  --rate STR                      prosody rate for --ssml (default: medium)\n\n"
        "Cache:\n"
        "  --cache-dir DIR                 audio cache directory (default: <tmp>/arabic_tutor_cache)\n"
        "  --no-cache                      always call AWS Polly, don't store the result\n"
        "  --clear-cache                   remove every cached file and exit\n\n"
        "AWS Polly:\n"
        "  --region STR                    AWS region (default: $AWS_REGION, $AWS_DEFAULT_REGION, us-east-1)\n"
        "  --timeout N                     connect/request timeout seconds (default: 30)\n\n"
        "Other:\n"
        "  --list-voices                   print the voice table as JSON and exit\n"
        "  --debug                         AWS SDK debug logging\n"
        "  -h, --help                      show this help\n",
        argv0, argv0, argv0);
}

static bool parse_i32(const char * s, int32_t & out) {
    if (s == nullptr) {
        return false;
    }
    char * end = nullptr;
    const long v = std::strtol(s, &end, 10);
    if (end == s || end == nullptr || *end != '\0') {
        return false;
    }
    out = (int32_t) v;
    return true;
}

static bool needs_value(int i, int argc) {
    return i + 1 < argc;
}

static bool load_text_file(const std::string & path, std::string & out, std::string & err) {
    std::ifstream file(path);
    if (!file) {
        err = "failed to open text file: " + path;
        return false;
    }
    out.assign((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (!file.good() && !file.eof()) {
        err = "failed to read text file: " + path;
        return false;
    }
    return true;
}

static bool save_binary_file(const std::string & path, const std::string & data, std::string & err) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        err = "failed to open file for write: " + path;
        return false;
    }
    file.write(data.data(), (std::streamsize) data.size());
    if (!file.good()) {
        err = "failed to write file: " + path;
        return false;
    }
    return true;
}

static bool parse_args(int argc, char ** argv, cli_params & p) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-t" || arg == "--text") {
            if (!needs_value(i, argc)) return false;
            p.text = argv[++i];
        } else if (arg == "-f" || arg == "--text-file") {
            if (!needs_value(i, argc)) return false;
            p.text_file = argv[++i];
        } else if (arg == "-o" || arg == "--output") {
            if (!needs_value(i, argc)) return false;
            p.output = argv[++i];
        } else if (arg == "--voice") {
            if (!needs_value(i, argc)) return false;
            p.voice = argv[++i];
            p.has_voice = true;
        } else if (arg == "--engine") {
            if (!needs_value(i, argc)) return false;
            p.engine = argv[++i];
            p.has_engine = true;
        } else if (arg == "--rate") {
            if (!needs_value(i, argc)) return false;
            p.rate = argv[++i];
            p.has_rate = true;
        } else if (arg == "--ssml") {
            p.ssml = true;
        } else if (arg == "--cache-dir") {
            if (!needs_value(i, argc)) return false;
            p.cache_dir = argv[++i];
        } else if (arg == "--no-cache") {
            p.no_cache = true;
        } else if (arg == "--clear-cache") {
            p.clear_cache = true;
        } else if (arg == "--list-voices") {
            p.list_voices = true;
        } else if (arg == "--region") {
            if (!needs_value(i, argc)) return false;
            p.region = argv[++i];
        } else if (arg == "--timeout") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], p.timeout_sec)) return false;
        } else if (arg == "--debug") {
            p.debug = true;
        } else if (arg == "-h" || arg == "--help") {
            p.show_help = true;
            return true;
        } else {
            std::fprintf(stderr, "unknown option: %s\n", arg.c_str());
            return false;
        }
    }

    if (p.cache_dir.empty()) {
        p.cache_dir = polly_tts::default_cache_dir();
    }
    if (p.list_voices || p.clear_cache) {
        return true;
    }
    if (!p.text.empty() && !p.text_file.empty()) {
        std::fprintf(stderr, "use either --text or --text-file, not both\n");
        return false;
    }
    return !p.text.empty() || !p.text_file.empty();
}

int main(int argc, char ** argv) {
    cli_params p;
    if (!parse_args(argc, argv, p)) {
        print_usage(argv[0]);
        return 1;
    }
    if (p.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    const polly_tts::voice_registry voices = polly_tts::voice_registry::arabic();

    if (p.list_voices) {
        const polly_tts::json j = {
            {"voices", voices.to_json()},
            {"default", voices.default_key()},
        };
        std::printf("%s\n", j.dump(2).c_str());
        return 0;
    }

    polly_tts::audio_cache cache(p.cache_dir);
    std::string err;

    if (p.clear_cache) {
        if (!cache.clear(err)) {
            std::fprintf(stderr, "%s\n", err.c_str());
            return 1;
        }
        std::fprintf(stderr, "cleared cache: %s\n", cache.dir().c_str());
        return 0;
    }

    if (!p.text_file.empty() && !load_text_file(p.text_file, p.text, err)) {
        std::fprintf(stderr, "%s\n", err.c_str());
        return 1;
    }
    if (!p.no_cache && !cache.init(err)) {
        std::fprintf(stderr, "%s\n", err.c_str());
        return 1;
    }

    polly_tts::aws_api_scope aws_scope(p.debug);

    polly_tts::aws_settings aws;
    polly_tts::aws_settings_from_env(aws);
    if (!p.region.empty()) {
        aws.region = p.region;
    }
    aws.timeout_sec = p.timeout_sec;
    aws.debug = p.debug;

    polly_tts::polly_provider polly;
    const bool polly_ok = polly.init(aws, err);
    if (!polly_ok) {
        std::fprintf(stderr, "warning: could not initialize AWS Polly client: %s\n", err.c_str());
    }

    polly_tts::synthesizer synth(voices, cache, polly_ok ? &polly : nullptr);
    synth.set_use_cache(!p.no_cache);

    polly_tts::synth_request req;
    req.text = p.text;
    req.voice = p.voice;
    req.engine = p.engine;
    req.rate = p.rate;
    req.has_voice = p.has_voice;
    req.has_engine = p.has_engine;
    req.has_rate = p.has_rate;

    const polly_tts::synth_result res = p.ssml ? synth.synthesize_ssml(req) : synth.synthesize(req);
    if (!res.ok()) {
        std::fprintf(stderr, "synthesis failed (%s): %s%s%s\n",
                polly_tts::synth_status_to_cstr(res.status),
                res.error.c_str(),
                res.detail.empty() ? "" : ": ",
                res.detail.c_str());
        return 1;
    }

    if (!save_binary_file(p.output, res.audio, err)) {
        std::fprintf(stderr, "%s\n", err.c_str());
        return 1;
    }

    std::fprintf(stderr, "wrote %s: %zu bytes voice=%s engine=%s cache=%s\n",
            p.output.c_str(),
            res.audio.size(),
            res.voice.c_str(),
            res.engine.empty() ? "-" : res.engine.c_str(),
            res.cache_hit ? "hit" : "miss");
    return 0;
}
