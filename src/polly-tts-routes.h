#pragma once

#include "polly-tts-synth.h"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <string>

namespace polly_tts {

using json = nlohmann::ordered_json;

struct route_options {
    bool debug = false;
};

json make_error_json(const std::string & msg, synth_status status, const std::string & detail = "", const std::string & provider_code = "");

// Returns false when the field is absent or null; throws if present with another type.
bool get_json_string(const json & j, const char * key, std::string & out);

void handle_index(const httplib::Request & req, httplib::Response & res);
void handle_health(const synthesizer & synth, const httplib::Request & req, httplib::Response & res);
void handle_voices(const synthesizer & synth, const httplib::Request & req, httplib::Response & res);
void handle_synthesize(const synthesizer & synth, const route_options & opt, const httplib::Request & req, httplib::Response & res);
void handle_synthesize_ssml(const synthesizer & synth, const route_options & opt, const httplib::Request & req, httplib::Response & res);
void handle_clear_cache(const synthesizer & synth, const httplib::Request & req, httplib::Response & res);

// synth must outlive server.
void register_routes(httplib::Server & server, const synthesizer & synth, const route_options & opt);

} // namespace polly_tts
