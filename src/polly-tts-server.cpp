#include "polly-tts-aws.h"
#include "polly-tts-cache.h"
#include "polly-tts-routes.h"
#include "polly-tts-synth.h"
#include "polly-tts-voices.h"

#include <httplib.h>

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <utility>

struct server_config {
    std::string host = "0.0.0.0";
    int32_t port = 10000;
    bool port_set = false;

    std::string cache_dir;
    std::string region;
    int32_t timeout_sec = 30;
    int32_t n_threads = 0;
    bool probe = true;
    bool debug = false;
};

static void print_usage(const char * argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "  %s [options]\n\n"
        "Server:\n"
        "  --host STR                      bind host (default: 0.0.0.0)\n"
        "  --port N                        bind port (default: $PORT or 10000)\n"
        "  --threads N                     HTTP worker threads (default: 0, runtime default)\n"
        "  --cache-dir DIR                 audio cache directory (default: <tmp>/arabic_tutor_cache)\n"
        "  --debug                         verbose request and AWS SDK logging\n\n"
        "AWS Polly:\n"
        "  --region STR                    AWS region (default: $AWS_REGION, $AWS_DEFAULT_REGION, us-east-1)\n"
        "  --timeout N                     connect/request timeout seconds (default: 30)\n"
        "  --no-probe                      skip the DescribeVoices check at startup\n\n"
        "Environment:\n"
        "  AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY   credentials (missing -> degraded mode)\n"
        "  AWS_REGION, AWS_DEFAULT_REGION             region\n"
        "  PORT                                       bind port\n"
        "  POLLY_TTS_DEBUG                            1/true enables --debug\n",
        argv0);
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

static bool parse_env_bool(const char * s) {
    if (s == nullptr) {
        return false;
    }
    return std::strcmp(s, "1") == 0 || std::strcmp(s, "true") == 0 ||
           std::strcmp(s, "on") == 0 || std::strcmp(s, "development") == 0;
}

static bool needs_value(int i, int argc) {
    return i + 1 < argc;
}

static bool parse_args(int argc, char ** argv, server_config & cfg) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--host") {
            if (!needs_value(i, argc)) return false;
            cfg.host = argv[++i];
        } else if (arg == "--port") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], cfg.port)) return false;
            cfg.port_set = true;
        } else if (arg == "--threads") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], cfg.n_threads)) return false;
        } else if (arg == "--cache-dir") {
            if (!needs_value(i, argc)) return false;
            cfg.cache_dir = argv[++i];
        } else if (arg == "--region") {
            if (!needs_value(i, argc)) return false;
            cfg.region = argv[++i];
        } else if (arg == "--timeout") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], cfg.timeout_sec)) return false;
        } else if (arg == "--no-probe") {
            cfg.probe = false;
        } else if (arg == "--debug") {
            cfg.debug = true;
        } else if (arg == "-h" || arg == "--help") {
            return false;
        } else {
            std::fprintf(stderr, "unknown option: %s\n", arg.c_str());
            return false;
        }
    }

    if (!cfg.port_set) {
        const char * v = std::getenv("PORT");
        if (v != nullptr && v[0] != '\0' && !parse_i32(v, cfg.port)) {
            std::fprintf(stderr, "invalid PORT: %s\n", v);
            return false;
        }
    }
    if (!cfg.debug) {
        cfg.debug = parse_env_bool(std::getenv("POLLY_TTS_DEBUG"));
    }
    if (cfg.cache_dir.empty()) {
        cfg.cache_dir = polly_tts::default_cache_dir();
    }

    if (cfg.port < 0 || cfg.port > 65535) {
        return false;
    }
    if (cfg.timeout_sec < 1 || cfg.n_threads < 0) {
        return false;
    }
    return true;
}

int main(int argc, char ** argv) {
    server_config cfg;
    if (!parse_args(argc, argv, cfg)) {
        print_usage(argv[0]);
        return 1;
    }

    polly_tts::aws_api_scope aws_scope(cfg.debug);

    polly_tts::aws_settings aws;
    polly_tts::aws_settings_from_env(aws);
    if (!cfg.region.empty()) {
        aws.region = cfg.region;
    }
    aws.timeout_sec = cfg.timeout_sec;
    aws.debug = cfg.debug;

    std::unique_ptr<polly_tts::polly_provider> polly;
    {
        auto candidate = std::make_unique<polly_tts::polly_provider>();
        std::string err;
        if (!candidate->init(aws, err)) {
            std::fprintf(stderr, "warning: could not initialize AWS Polly client: %s\n", err.c_str());
        } else if (cfg.probe && !candidate->probe(err)) {
            std::fprintf(stderr, "warning: AWS Polly probe failed: %s\n", err.c_str());
        } else {
            polly = std::move(candidate);
        }
    }

    const polly_tts::voice_registry voices = polly_tts::voice_registry::arabic();
    polly_tts::audio_cache cache(cfg.cache_dir);
    {
        std::string err;
        if (!cache.init(err)) {
            std::fprintf(stderr, "%s\n", err.c_str());
            return 1;
        }
    }

    polly_tts::synthesizer synth(voices, cache, polly.get());

    std::string voice_list;
    for (const auto & key : voices.keys()) {
        voice_list += voice_list.empty() ? key : ", " + key;
    }

    if (polly) {
        std::fprintf(stderr, "AWS Polly client initialized: region=%s\n", polly->region().c_str());
    } else {
        std::fprintf(stderr, "AWS Polly client not available: synthesis requests will fail with 500\n");
        std::fprintf(stderr, "  set AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY and AWS_REGION\n");
    }
    std::fprintf(stderr, "cache dir: %s (%zu file(s))\n", cache.dir().c_str(), cache.count());
    std::fprintf(stderr, "voices: %s (default: %s)\n", voice_list.c_str(), voices.default_key().c_str());

    httplib::Server server;
    server.set_default_headers({{"Server", "polly-tts-server"}});
    if (cfg.n_threads > 0) {
        const size_t n = (size_t) cfg.n_threads;
        server.new_task_queue = [n] { return new httplib::ThreadPool(n); };
    }

    polly_tts::route_options opt;
    opt.debug = cfg.debug;
    polly_tts::register_routes(server, synth, opt);

    std::fprintf(stderr, "polly-tts-server listening on http://%s:%d\n", cfg.host.c_str(), cfg.port);
    std::fprintf(stderr, "  endpoints: / /health /voices /synthesize /synthesize-ssml /clear-cache\n");
    if (!server.listen(cfg.host, cfg.port)) {
        std::fprintf(stderr, "failed to listen on %s:%d\n", cfg.host.c_str(), cfg.port);
        return 1;
    }

    return 0;
}
