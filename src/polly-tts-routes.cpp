#include "polly-tts-routes.h"

#include <chrono>
#include <cstdio>
#include <exception>
#include <stdexcept>
#include <utility>

namespace polly_tts {

static const char * k_json_content_type = "application/json; charset=utf-8";
static const char * k_audio_content_type = "audio/mpeg";

static double ms_since(
        const std::chrono::steady_clock::time_point & begin,
        const std::chrono::steady_clock::time_point & end) {
    return std::chrono::duration<double, std::milli>(end - begin).count();
}

json make_error_json(const std::string & msg, synth_status status, const std::string & detail, const std::string & provider_code) {
    json err = {
        {"message", msg},
        {"code", synth_status_http_code(status)},
        {"type", synth_status_to_cstr(status)},
    };
    if (!provider_code.empty()) {
        err["provider_code"] = provider_code;
    }
    if (!detail.empty()) {
        err["detail"] = detail;
    }
    return json {
        {"ok", false},
        {"error", std::move(err)},
    };
}

static void set_error(httplib::Response & res, const std::string & msg, synth_status status,
                      const std::string & detail = "", const std::string & provider_code = "") {
    res.status = synth_status_http_code(status);
    res.set_content(make_error_json(msg, status, detail, provider_code).dump(), k_json_content_type);
}

bool get_json_string(const json & j, const char * key, std::string & out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return false;
    }
    if (!it->is_string()) {
        throw std::runtime_error(std::string("field '") + key + "' must be string");
    }
    out = it->get<std::string>();
    return true;
}

// Parses {text, voice, engine, rate}; on failure writes a 400 response and returns false.
static bool parse_synth_body(const httplib::Request & req, httplib::Response & res, synth_request & out) {
    json body;
    try {
        body = json::parse(req.body.empty() ? "{}" : req.body);
    } catch (const std::exception & e) {
        set_error(res, std::string("invalid JSON: ") + e.what(), SYNTH_INVALID_REQUEST);
        return false;
    }
    if (!body.is_object()) {
        set_error(res, "request body must be a JSON object", SYNTH_INVALID_REQUEST);
        return false;
    }
    try {
        get_json_string(body, "text", out.text);
        out.has_voice = get_json_string(body, "voice", out.voice);
        out.has_engine = get_json_string(body, "engine", out.engine);
        out.has_rate = get_json_string(body, "rate", out.rate);
    } catch (const std::exception & e) {
        set_error(res, e.what(), SYNTH_INVALID_REQUEST);
        return false;
    }
    return true;
}

static void run_synthesis(
        const synthesizer & synth,
        const route_options & opt,
        bool ssml,
        const httplib::Request & req,
        httplib::Response & res) {
    const auto t_begin = std::chrono::steady_clock::now();

    if (!synth.available()) {
        set_error(res, "AWS Polly not available", SYNTH_SERVICE_UNAVAILABLE);
        std::fprintf(stderr, "synthesize: path=%s ok=false err=provider unavailable\n", req.path.c_str());
        return;
    }

    synth_request sr;
    if (!parse_synth_body(req, res, sr)) {
        return;
    }
    if (opt.debug) {
        std::fprintf(stderr, "synthesize: path=%s text_bytes=%zu voice=%s engine=%s rate=%s\n",
                req.path.c_str(),
                sr.text.size(),
                sr.has_voice ? sr.voice.c_str() : "-",
                sr.has_engine ? sr.engine.c_str() : "-",
                sr.has_rate ? sr.rate.c_str() : "-");
    }

    synth_result out;
    try {
        out = ssml ? synth.synthesize_ssml(sr) : synth.synthesize(sr);
    } catch (const std::exception & e) {
        out = synth_result();
        out.status = SYNTH_UNEXPECTED;
        out.error = std::string("Unexpected error: ") + e.what();
    }

    const double total_ms = ms_since(t_begin, std::chrono::steady_clock::now());
    if (!out.ok()) {
        std::fprintf(stderr, "synthesize: path=%s ok=false status=%s total_ms=%.2f err=%s%s%s\n",
                req.path.c_str(),
                synth_status_to_cstr(out.status),
                total_ms,
                out.error.c_str(),
                out.detail.empty() ? "" : ": ",
                out.detail.c_str());
        set_error(res, out.error, out.status, out.detail, out.provider_code);
        return;
    }

    std::fprintf(stderr, "synthesize: path=%s ok=true voice=%s engine=%s cache=%s bytes=%zu total_ms=%.2f\n",
            req.path.c_str(),
            out.voice.c_str(),
            out.engine.empty() ? "-" : out.engine.c_str(),
            out.cache_hit ? "hit" : "miss",
            out.audio.size(),
            total_ms);

    res.status = 200;
    res.set_header("Cache-Control", "public, max-age=3600");
    res.set_header("X-Cache", out.cache_hit ? "hit" : "miss");
    res.set_content(out.audio, k_audio_content_type);
}

void handle_index(const httplib::Request &, httplib::Response & res) {
    json j = {
        {"message", "Arabic Bible Tutor - AWS Polly TTS Server"},
        {"status", "running"},
        {"endpoints", {
            {"health", "/health"},
            {"voices", "/voices"},
            {"synthesize", "/synthesize"},
            {"synthesize-ssml", "/synthesize-ssml"},
            {"clear-cache", "/clear-cache"},
        }},
    };
    res.set_content(j.dump(), k_json_content_type);
}

void handle_health(const synthesizer & synth, const httplib::Request &, httplib::Response & res) {
    json j = {
        {"status", synth.available() ? "healthy" : "degraded"},
        {"polly_available", synth.available()},
        {"available_voices", synth.voices().keys()},
    };
    res.set_content(j.dump(), k_json_content_type);
}

void handle_voices(const synthesizer & synth, const httplib::Request &, httplib::Response & res) {
    json j = {
        {"voices", synth.voices().to_json()},
        {"default", synth.voices().default_key()},
    };
    res.set_content(j.dump(), k_json_content_type);
}

void handle_synthesize(const synthesizer & synth, const route_options & opt, const httplib::Request & req, httplib::Response & res) {
    run_synthesis(synth, opt, false, req, res);
}

void handle_synthesize_ssml(const synthesizer & synth, const route_options & opt, const httplib::Request & req, httplib::Response & res) {
    run_synthesis(synth, opt, true, req, res);
}

void handle_clear_cache(const synthesizer & synth, const httplib::Request &, httplib::Response & res) {
    std::string err;
    if (!synth.cache().clear(err)) {
        std::fprintf(stderr, "clear-cache: ok=false err=%s\n", err.c_str());
        set_error(res, "Error clearing cache: " + err, SYNTH_UNEXPECTED);
        return;
    }
    std::fprintf(stderr, "clear-cache: ok=true dir=%s\n", synth.cache().dir().c_str());
    json j = {
        {"ok", true},
        {"message", "Cache cleared successfully"},
    };
    res.status = 200;
    res.set_content(j.dump(), k_json_content_type);
}

void register_routes(httplib::Server & server, const synthesizer & synth, const route_options & opt) {
    server.set_pre_routing_handler([](const httplib::Request & req, httplib::Response & res) {
        const std::string origin = req.get_header_value("Origin");
        res.set_header("Access-Control-Allow-Origin", origin.empty() ? "*" : origin);
        if (req.method == "OPTIONS") {
            res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            res.set_header("Access-Control-Allow-Headers", "Content-Type");
            res.set_content("", "text/plain");
            return httplib::Server::HandlerResponse::Handled;
        }
        return httplib::Server::HandlerResponse::Unhandled;
    });

    server.set_exception_handler([](const httplib::Request & req, httplib::Response & res, std::exception_ptr ep) {
        std::string msg = "unknown exception";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception & e) {
            msg = e.what();
        } catch (...) {
            msg = "non-standard exception";
        }
        std::fprintf(stderr, "request: path=%s ok=false err=%s\n", req.path.c_str(), msg.c_str());
        set_error(res, "Unexpected error: " + msg, SYNTH_UNEXPECTED);
    });

    server.Get("/", handle_index);
    server.Get("/health", [&synth](const httplib::Request & req, httplib::Response & res) {
        handle_health(synth, req, res);
    });
    server.Get("/voices", [&synth](const httplib::Request & req, httplib::Response & res) {
        handle_voices(synth, req, res);
    });
    server.Post("/synthesize", [&synth, opt](const httplib::Request & req, httplib::Response & res) {
        handle_synthesize(synth, opt, req, res);
    });
    server.Post("/synthesize-ssml", [&synth, opt](const httplib::Request & req, httplib::Response & res) {
        handle_synthesize_ssml(synth, opt, req, res);
    });
    server.Post("/clear-cache", [&synth](const httplib::Request & req, httplib::Response & res) {
        handle_clear_cache(synth, req, res);
    });
}

} // namespace polly_tts
