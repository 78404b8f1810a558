#include "polly-tts-aws.h"

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/utils/logging/FormattedLogSystem.h>
#include <aws/core/utils/logging/LogLevel.h>
#include <aws/polly/PollyClient.h>
#include <aws/polly/PollyErrors.h>
#include <aws/polly/model/DescribeVoicesRequest.h>
#include <aws/polly/model/Engine.h>
#include <aws/polly/model/LanguageCode.h>
#include <aws/polly/model/OutputFormat.h>
#include <aws/polly/model/SynthesizeSpeechRequest.h>
#include <aws/polly/model/TextType.h>
#include <aws/polly/model/VoiceId.h>

#include <cstdio>
#include <cstdlib>
#include <iterator>

namespace polly_tts {

static const char * k_alloc_tag = "polly-tts";

static bool getenv_nonempty(const char * name, std::string & out) {
    const char * v = std::getenv(name);
    if (v == nullptr || v[0] == '\0') {
        return false;
    }
    out = v;
    return true;
}

void aws_settings_from_env(aws_settings & s) {
    if (s.access_key_id.empty()) {
        getenv_nonempty("AWS_ACCESS_KEY_ID", s.access_key_id);
    }
    if (s.secret_access_key.empty()) {
        getenv_nonempty("AWS_SECRET_ACCESS_KEY", s.secret_access_key);
    }
    std::string region;
    if (getenv_nonempty("AWS_REGION", region) || getenv_nonempty("AWS_DEFAULT_REGION", region)) {
        s.region = region;
    }
}

// SDK log lines go to stderr next to the gateway's own log lines.
class stderr_log_system : public Aws::Utils::Logging::FormattedLogSystem {
public:
    explicit stderr_log_system(Aws::Utils::Logging::LogLevel level) : FormattedLogSystem(level) {}

    void Flush() override {
        std::fflush(stderr);
    }

protected:
    void ProcessFormattedStatement(Aws::String && statement) override {
        std::fputs(statement.c_str(), stderr);
    }
};

struct aws_api_scope::impl {
    Aws::SDKOptions options;
};

aws_api_scope::aws_api_scope(bool debug) : pimpl_(new impl()) {
    const auto level = debug ? Aws::Utils::Logging::LogLevel::Debug : Aws::Utils::Logging::LogLevel::Warn;
    pimpl_->options.loggingOptions.logLevel = level;
    pimpl_->options.loggingOptions.logger_create_fn = [level]() {
        return Aws::MakeShared<stderr_log_system>(k_alloc_tag, level);
    };
    Aws::InitAPI(pimpl_->options);
}

aws_api_scope::~aws_api_scope() {
    Aws::ShutdownAPI(pimpl_->options);
}

polly_provider::polly_provider() = default;

polly_provider::~polly_provider() = default;

bool polly_provider::init(const aws_settings & settings, std::string & err) {
    if (!settings.has_credentials()) {
        err = "AWS credentials not configured (AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY)";
        return false;
    }
    if (settings.timeout_sec < 1) {
        err = "timeout must be >= 1 second";
        return false;
    }

    Aws::Client::ClientConfiguration cc;
    cc.region = settings.region.c_str();
    cc.connectTimeoutMs = (long) settings.timeout_sec * 1000;
    cc.requestTimeoutMs = (long) settings.timeout_sec * 1000;

    const Aws::Auth::AWSCredentials creds(settings.access_key_id.c_str(), settings.secret_access_key.c_str());
    client_ = std::make_unique<Aws::Polly::PollyClient>(creds, cc);
    region_ = settings.region;
    return true;
}

bool polly_provider::probe(std::string & err) {
    if (!client_) {
        err = "client is not initialized";
        return false;
    }

    Aws::Polly::Model::DescribeVoicesRequest req;
    req.SetLanguageCode(Aws::Polly::Model::LanguageCode::arb);
    const auto outcome = client_->DescribeVoices(req);
    if (!outcome.IsSuccess()) {
        const auto & e = outcome.GetError();
        err = std::string(e.GetExceptionName().c_str()) + ": " + e.GetMessage().c_str();
        return false;
    }
    return true;
}

const std::string & polly_provider::region() const {
    return region_;
}

const char * polly_provider::name() const {
    return "aws-polly";
}

bool polly_provider::synthesize(const provider_request & req, std::string & audio_out, provider_error & err) {
    namespace model = Aws::Polly::Model;

    if (!client_) {
        err.unavailable = true;
        err.message = "client is not initialized";
        return false;
    }

    model::SynthesizeSpeechRequest sreq;
    sreq.SetText(req.text.c_str());
    sreq.SetTextType(model::TextTypeMapper::GetTextTypeForName(req.text_type.c_str()));
    sreq.SetOutputFormat(model::OutputFormatMapper::GetOutputFormatForName(req.output_format.c_str()));
    sreq.SetVoiceId(model::VoiceIdMapper::GetVoiceIdForName(req.voice_id.c_str()));
    sreq.SetLanguageCode(model::LanguageCodeMapper::GetLanguageCodeForName(req.language_code.c_str()));
    sreq.SetEngine(model::EngineMapper::GetEngineForName(req.engine.c_str()));

    auto outcome = client_->SynthesizeSpeech(sreq);
    if (!outcome.IsSuccess()) {
        const auto & e = outcome.GetError();
        err.unavailable = e.GetErrorType() == Aws::Polly::PollyErrors::NETWORK_CONNECTION;
        err.code = e.GetExceptionName().c_str();
        err.message = e.GetMessage().c_str();
        if (err.code.empty()) {
            err.code = "HTTP" + std::to_string((int) e.GetResponseCode());
        }
        return false;
    }

    auto & stream = outcome.GetResult().GetAudioStream();
    audio_out.assign(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
    if (stream.bad()) {
        err.code = "AudioStream";
        err.message = "failed to read audio stream";
        return false;
    }
    return true;
}

} // namespace polly_tts
