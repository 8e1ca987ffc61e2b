#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "asr/transcription_engine.hpp"

namespace asr {

/**
 * @brief One multipart/form-data POST carrying a WAV upload
 */
struct HttpRequest {
    std::string url;
    std::vector<std::string> headers;                           ///< "Name: value"
    std::vector<std::pair<std::string, std::string>> fields;    ///< Form fields before the file
    std::string file_field = "file";
    std::string file_name = "audio.wav";
    std::string file_content_type = "audio/wav";
    std::string file_data;
    long timeout_seconds = 120;
};

struct HttpResponse {
    bool success = false;   ///< Transport completed (any HTTP status)
    long status_code = 0;
    std::string body;
    std::string error;
};

using HttpTransport = std::function<HttpResponse(const HttpRequest&)>;

// libcurl transport: one easy handle per request, safe to call from several threads
HttpResponse curl_post_multipart(const HttpRequest& request);

// {"text": "..."} on 2xx; everything else becomes a failure with the reason
EngineResult parse_transcription_response(const HttpResponse& response);

/**
 * @brief TranscriptionEngine backed by an OpenAI-compatible
 *        /v1/audio/transcriptions endpoint (Fireworks, OpenAI)
 *
 * Each call uploads the samples as a 16-bit mono WAV and returns the
 * response's "text". Beam settings are not sent; the service decides.
 */
class HttpTranscriptionEngine : public TranscriptionEngine {
public:
    struct Options {
        std::string provider = "remote";    ///< Name used in logs
        std::string endpoint;
        std::string api_key;
        std::string model;
        std::vector<std::pair<std::string, std::string>> extra_fields;
        long timeout_seconds = 120;
        int sample_rate = 16000;            ///< Rate the uploaded WAV is written at
    };

    static Options fireworks(const std::string& api_key);
    static Options openai(const std::string& api_key);

    explicit HttpTranscriptionEngine(Options options, HttpTransport transport = curl_post_multipart);
    ~HttpTranscriptionEngine() override;

    HttpTranscriptionEngine(const HttpTranscriptionEngine&) = delete;
    HttpTranscriptionEngine& operator=(const HttpTranscriptionEngine&) = delete;

    HttpRequest build_request(const int16_t* samples, size_t count, const DecodeParams& params) const;

    EngineResult transcribe(const int16_t* samples, size_t count, const DecodeParams& params) override;
    int sample_rate() const override { return options_.sample_rate; }
    std::string name() const override;

    const Options& options() const { return options_; }

private:
    Options options_;
    HttpTransport transport_;
    bool curl_acquired_ = false;
};

} // namespace asr
