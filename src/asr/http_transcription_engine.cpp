#include "asr/http_transcription_engine.hpp"
#include "audio/wav_file.hpp"
#include "core/logging.hpp"

#include <chrono>
#include <mutex>
#include <sstream>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace asr {

namespace {

std::mutex g_curl_mutex;
int g_curl_refcount = 0;

bool acquire_curl_global() {
    std::lock_guard<std::mutex> lock(g_curl_mutex);
    if (g_curl_refcount == 0) {
        const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            core::log_error(std::string("[http] curl_global_init failed: ") + curl_easy_strerror(rc));
            return false;
        }
    }
    ++g_curl_refcount;
    return true;
}

void release_curl_global() {
    std::lock_guard<std::mutex> lock(g_curl_mutex);
    if (g_curl_refcount <= 0) return;
    if (--g_curl_refcount == 0) {
        curl_global_cleanup();
    }
}

// Callback for libcurl to write response data
size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t total = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), total);
    return total;
}

std::string format_temperature(float t) {
    std::ostringstream os;
    os << t;
    return os.str();
}

} // namespace

HttpResponse curl_post_multipart(const HttpRequest& request) {
    HttpResponse response;

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "Failed to initialize HTTP client";
        return response;
    }

    curl_mime* mime = curl_mime_init(curl);
    for (const auto& field : request.fields) {
        curl_mimepart* part = curl_mime_addpart(mime);
        curl_mime_name(part, field.first.c_str());
        curl_mime_data(part, field.second.c_str(), CURL_ZERO_TERMINATED);
    }
    curl_mimepart* file = curl_mime_addpart(mime);
    curl_mime_name(file, request.file_field.c_str());
    curl_mime_data(file, request.file_data.data(), request.file_data.size());
    curl_mime_filename(file, request.file_name.c_str());
    curl_mime_type(file, request.file_content_type.c_str());

    struct curl_slist* headers = nullptr;
    for (const auto& h : request.headers) {
        headers = curl_slist_append(headers, h.c_str());
    }

    std::string body;
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, request.timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    // Worker threads: no signals for timeouts
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    const CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
        response.success = true;
        response.body = std::move(body);
    } else if (res == CURLE_OPERATION_TIMEDOUT) {
        response.error = "Request timed out after " + std::to_string(request.timeout_seconds) + " seconds";
    } else if (res == CURLE_COULDNT_CONNECT || res == CURLE_COULDNT_RESOLVE_HOST) {
        response.error = "Cannot connect to " + request.url;
    } else {
        response.error = std::string("HTTP request failed: ") + curl_easy_strerror(res);
    }

    curl_slist_free_all(headers);
    curl_mime_free(mime);
    curl_easy_cleanup(curl);
    return response;
}

EngineResult parse_transcription_response(const HttpResponse& response) {
    if (!response.success) {
        return EngineResult::failure(response.error.empty() ? std::string("HTTP request failed") : response.error);
    }

    const nlohmann::json body = nlohmann::json::parse(response.body, nullptr, false);
    if (response.status_code < 200 || response.status_code >= 300) {
        std::string reason = "HTTP " + std::to_string(response.status_code);
        if (!body.is_discarded() && body.contains("error")) {
            const auto& err = body["error"];
            if (err.is_object() && err.contains("message") && err["message"].is_string()) {
                reason += ": " + err["message"].get<std::string>();
            } else if (err.is_string()) {
                reason += ": " + err.get<std::string>();
            }
        } else if (!response.body.empty()) {
            reason += ": " + response.body;
        }
        return EngineResult::failure(reason);
    }

    if (body.is_discarded()) {
        return EngineResult::failure("invalid JSON in transcription response");
    }
    if (!body.is_object() || !body.contains("text") || !body["text"].is_string()) {
        return EngineResult::failure("transcription response has no text");
    }
    return EngineResult::success(body["text"].get<std::string>());
}

HttpTranscriptionEngine::Options HttpTranscriptionEngine::fireworks(const std::string& api_key) {
    Options o;
    o.provider = "fireworks";
    o.endpoint = "https://audio-turbo.us-virginia-1.direct.fireworks.ai/v1/audio/transcriptions";
    o.api_key = api_key;
    o.model = "whisper-v3-turbo";
    o.extra_fields = {{"vad_model", "silero"}};
    return o;
}

HttpTranscriptionEngine::Options HttpTranscriptionEngine::openai(const std::string& api_key) {
    Options o;
    o.provider = "openai";
    o.endpoint = "https://api.openai.com/v1/audio/transcriptions";
    o.api_key = api_key;
    o.model = "whisper-1";
    return o;
}

HttpTranscriptionEngine::HttpTranscriptionEngine(Options options, HttpTransport transport)
    : options_(std::move(options))
    , transport_(std::move(transport)) {
    if (!transport_) transport_ = curl_post_multipart;
    if (options_.sample_rate <= 0) options_.sample_rate = 16000;
    curl_acquired_ = acquire_curl_global();
}

HttpTranscriptionEngine::~HttpTranscriptionEngine() {
    if (curl_acquired_) release_curl_global();
}

HttpRequest HttpTranscriptionEngine::build_request(const int16_t* samples, size_t count,
                                                   const DecodeParams& params) const {
    HttpRequest req;
    req.url = options_.endpoint;
    req.timeout_seconds = options_.timeout_seconds;
    if (!options_.api_key.empty()) {
        req.headers.push_back("Authorization: Bearer " + options_.api_key);
    }
    req.headers.push_back("Accept: application/json");

    if (!options_.model.empty()) req.fields.emplace_back("model", options_.model);
    req.fields.emplace_back("temperature", format_temperature(params.temperature));
    if (!params.language.empty()) req.fields.emplace_back("language", params.language);
    req.fields.emplace_back("response_format", "json");
    for (const auto& f : options_.extra_fields) req.fields.push_back(f);

    req.file_data = audio::encode_wav(samples, count, options_.sample_rate, 1);
    return req;
}

EngineResult HttpTranscriptionEngine::transcribe(const int16_t* samples, size_t count, const DecodeParams& params) {
    if (!samples || count == 0) return EngineResult::success({});
    if (options_.endpoint.empty()) return EngineResult::failure("no transcription endpoint configured");

    const HttpRequest req = build_request(samples, count, params);
    auto t0 = std::chrono::steady_clock::now();
    const HttpResponse resp = transport_(req);
    const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

    EngineResult r = parse_transcription_response(resp);
    core::log_debug("[http] " + options_.provider + " " + std::to_string(count) + " samples -> "
                    + (resp.success ? "HTTP " + std::to_string(resp.status_code) : resp.error)
                    + " in " + std::to_string(elapsed) + "s");
    return r;
}

std::string HttpTranscriptionEngine::name() const {
    return options_.provider + (options_.model.empty() ? std::string() : " (" + options_.model + ")");
}

} // namespace asr
