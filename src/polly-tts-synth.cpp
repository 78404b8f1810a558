#include "polly-tts-synth.h"

#include <cctype>
#include <cstdio>
#include <exception>

namespace polly_tts {

const char * synth_status_to_cstr(synth_status v) {
    switch (v) {
        case SYNTH_OK: return "ok";
        case SYNTH_INVALID_REQUEST: return "invalid_request";
        case SYNTH_SERVICE_UNAVAILABLE: return "service_unavailable";
        case SYNTH_PROVIDER_ERROR: return "provider_error";
        case SYNTH_UNEXPECTED: return "unexpected";
    }
    return "unexpected";
}

int synth_status_http_code(synth_status v) {
    switch (v) {
        case SYNTH_OK: return 200;
        case SYNTH_INVALID_REQUEST: return 400;
        default: return 500;
    }
}

bool is_ssml_text(const std::string & text) {
    size_t b = 0;
    while (b < text.size() && std::isspace((unsigned char) text[b])) {
        ++b;
    }
    return text.compare(b, 7, "<speak>") == 0;
}

std::string resolve_engine(const std::string & requested, const voice_descriptor & voice) {
    return is_known_engine(requested) ? requested : voice.engine;
}

std::string make_ssml_document(const std::string & text, const std::string & rate, const std::string & language) {
    // text is inserted verbatim so callers can embed their own markup
    return "<speak><prosody rate=\"" + rate + "\"><lang xml:lang=\"" + language + "\">" +
           text + "</lang></prosody></speak>";
}

provider_request make_provider_request(const std::string & text, const voice_descriptor & voice, const std::string & requested_engine) {
    provider_request p;
    p.text = text;
    p.text_type = is_ssml_text(text) ? "ssml" : "text";
    p.voice_id = voice.id;
    p.language_code = voice.language;
    p.engine = resolve_engine(requested_engine, voice);
    return p;
}

provider_request make_ssml_provider_request(const std::string & ssml, const voice_descriptor & voice) {
    provider_request p;
    p.text = ssml;
    p.text_type = "ssml";
    p.voice_id = voice.id;
    p.language_code = voice.language;
    p.engine = voice.engine;
    return p;
}

static synth_result make_failure(synth_status status, const std::string & error, const std::string & detail = "") {
    synth_result r;
    r.status = status;
    r.error = error;
    r.detail = detail;
    return r;
}

synthesizer::synthesizer(const voice_registry & voices, const audio_cache & cache, speech_provider * provider)
    : voices_(voices), cache_(cache), provider_(provider) {
}

bool synthesizer::available() const {
    return provider_ != nullptr;
}

const voice_registry & synthesizer::voices() const {
    return voices_;
}

const audio_cache & synthesizer::cache() const {
    return cache_;
}

void synthesizer::set_use_cache(bool v) {
    use_cache_ = v;
}

synth_result synthesizer::synthesize(const synth_request & req) const {
    if (!available()) {
        return make_failure(SYNTH_SERVICE_UNAVAILABLE, "AWS Polly not available");
    }
    if (req.text.empty()) {
        return make_failure(SYNTH_INVALID_REQUEST, "Text is required");
    }

    const std::string voice_key = req.has_voice ? req.voice : voices_.default_key();
    const voice_descriptor * voice = voices_.find(voice_key);
    if (voice == nullptr) {
        return make_failure(SYNTH_INVALID_REQUEST, "Voice " + voice_key + " not available");
    }

    // keyed on the engine as requested, before fallback
    const std::string engine = req.has_engine ? req.engine : "standard";

    synth_result res;
    res.voice = voice_key;
    return dispatch(compute_cache_key(req.text, voice_key, engine), make_provider_request(req.text, *voice, engine), res);
}

synth_result synthesizer::synthesize_ssml(const synth_request & req) const {
    if (!available()) {
        return make_failure(SYNTH_SERVICE_UNAVAILABLE, "AWS Polly not available");
    }
    if (req.text.empty()) {
        return make_failure(SYNTH_INVALID_REQUEST, "Text is required");
    }

    const std::string voice_key = req.has_voice ? req.voice : voices_.default_key();
    const voice_descriptor * voice = voices_.find(voice_key);
    if (voice == nullptr) {
        voice = &voices_.default_voice();
    }

    const std::string rate = req.has_rate ? req.rate : "medium";
    const std::string ssml = make_ssml_document(req.text, rate, voice->language);

    synth_result res;
    res.voice = voices_.contains(voice_key) ? voice_key : voices_.default_key();
    return dispatch(compute_cache_key(ssml, voice_key, "ssml"), make_ssml_provider_request(ssml, *voice), res);
}

synth_result synthesizer::dispatch(const std::string & cache_key, const provider_request & preq, synth_result res) const {
    if (use_cache_) {
        std::string cache_err;
        if (cache_.lookup(cache_key, res.audio, cache_err)) {
            res.cache_hit = true;
            return res;
        }
        if (!cache_err.empty()) {
            std::fprintf(stderr, "cache: read failed, falling back to provider: %s\n", cache_err.c_str());
        }
    }

    provider_error perr;
    try {
        if (!provider_->synthesize(preq, res.audio, perr)) {
            if (perr.unavailable) {
                synth_result f = make_failure(SYNTH_SERVICE_UNAVAILABLE, "AWS Polly not available", perr.message);
                f.provider_code = perr.code;
                return f;
            }
            synth_result f = make_failure(SYNTH_PROVIDER_ERROR, "AWS Polly error: " + perr.code, perr.message);
            f.provider_code = perr.code;
            return f;
        }
    } catch (const std::exception & e) {
        return make_failure(SYNTH_UNEXPECTED, std::string("Unexpected error: ") + e.what());
    }
    res.engine = preq.engine;

    if (use_cache_) {
        std::string store_err;
        if (!cache_.store(cache_key, res.audio, store_err)) {
            std::fprintf(stderr, "cache: write failed, returning audio uncached: %s\n", store_err.c_str());
        }
    }
    return res;
}

} // namespace polly_tts
