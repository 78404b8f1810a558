#pragma once

#include "polly-tts-synth.h"

#include <cstdint>
#include <memory>
#include <string>

namespace Aws {
namespace Polly {
class PollyClient;
}
}

namespace polly_tts {

struct aws_settings {
    std::string access_key_id;
    std::string secret_access_key;
    std::string region = "us-east-1";
    int32_t timeout_sec = 30;
    bool debug = false;

    bool has_credentials() const {
        return !access_key_id.empty() && !secret_access_key.empty();
    }
};

// Fills credentials and region from AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY,
// AWS_REGION and AWS_DEFAULT_REGION. Fields already set are left alone.
void aws_settings_from_env(aws_settings & s);

// Aws::InitAPI / Aws::ShutdownAPI for the lifetime of the object.
class aws_api_scope {
public:
    explicit aws_api_scope(bool debug);
    ~aws_api_scope();

    aws_api_scope(const aws_api_scope &) = delete;
    aws_api_scope & operator=(const aws_api_scope &) = delete;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

class polly_provider : public speech_provider {
public:
    polly_provider();
    ~polly_provider() override;

    polly_provider(const polly_provider &) = delete;
    polly_provider & operator=(const polly_provider &) = delete;

    bool init(const aws_settings & settings, std::string & err);

    // DescribeVoices(LanguageCode=arb) round trip.
    bool probe(std::string & err);

    const std::string & region() const;

    const char * name() const override;
    bool synthesize(const provider_request & req, std::string & audio_out, provider_error & err) override;

private:
    std::unique_ptr<Aws::Polly::PollyClient> client_;
    std::string region_;
};

} // namespace polly_tts
