#pragma once

#include "polly-tts-cache.h"
#include "polly-tts-voices.h"

#include <string>

namespace polly_tts {

enum synth_status {
    SYNTH_OK = 0,
    SYNTH_INVALID_REQUEST = 1,
    SYNTH_SERVICE_UNAVAILABLE = 2,
    SYNTH_PROVIDER_ERROR = 3,
    SYNTH_UNEXPECTED = 4,
};

const char * synth_status_to_cstr(synth_status v);
int synth_status_http_code(synth_status v);

// Parameters handed to the provider for one synthesis call.
struct provider_request {
    std::string text;
    std::string text_type = "text"; // "text" or "ssml"
    std::string output_format = "mp3";
    std::string voice_id;
    std::string language_code;
    std::string engine;
};

struct provider_error {
    bool unavailable = false; // unreachable or unconfigured, as opposed to a rejected call
    std::string code;
    std::string message;
};

class speech_provider {
public:
    virtual ~speech_provider() = default;

    virtual const char * name() const = 0;
    virtual bool synthesize(const provider_request & req, std::string & audio_out, provider_error & err) = 0;
};

// Defaults apply only to absent fields; a present empty string is taken as given.
struct synth_request {
    std::string text;
    std::string voice;  // absent selects the registry default
    std::string engine; // plain path only, absent means "standard"
    std::string rate;   // markup path only, absent means "medium"

    bool has_voice = false;
    bool has_engine = false;
    bool has_rate = false;
};

struct synth_result {
    synth_status status = SYNTH_OK;
    std::string audio;
    bool cache_hit = false;

    std::string voice;  // resolved voice key
    std::string engine; // engine sent to the provider, empty on cache hit

    std::string error;
    std::string detail;
    std::string provider_code;

    bool ok() const { return status == SYNTH_OK; }
};

bool is_ssml_text(const std::string & text);

std::string resolve_engine(const std::string & requested, const voice_descriptor & voice);

std::string make_ssml_document(const std::string & text, const std::string & rate, const std::string & language);

provider_request make_provider_request(const std::string & text, const voice_descriptor & voice, const std::string & requested_engine);
provider_request make_ssml_provider_request(const std::string & ssml, const voice_descriptor & voice);

class synthesizer {
public:
    // provider may be null: every synthesis call then reports service-unavailable.
    synthesizer(const voice_registry & voices, const audio_cache & cache, speech_provider * provider);

    bool available() const;
    const voice_registry & voices() const;
    const audio_cache & cache() const;

    void set_use_cache(bool v);

    synth_result synthesize(const synth_request & req) const;
    synth_result synthesize_ssml(const synth_request & req) const;

private:
    synth_result dispatch(const std::string & cache_key, const provider_request & preq, synth_result res) const;

    const voice_registry & voices_;
    const audio_cache & cache_;
    speech_provider * provider_;
    bool use_cache_ = true;
};

} // namespace polly_tts
