#undef NDEBUG  // assert() must stay active in release builds
#include <algorithm>
#include <cassert>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "asr/http_transcription_engine.hpp"
#include "core/pipeline_controller.hpp"

namespace {

bool has_field(const asr::HttpRequest& req, const std::string& name, const std::string& value) {
    return std::find(req.fields.begin(), req.fields.end(), std::make_pair(name, value)) != req.fields.end();
}

bool has_header(const asr::HttpRequest& req, const std::string& header) {
    return std::find(req.headers.begin(), req.headers.end(), header) != req.headers.end();
}

asr::HttpResponse reply(long status, std::string body) {
    asr::HttpResponse r;
    r.success = true;
    r.status_code = status;
    r.body = std::move(body);
    return r;
}

} // namespace

int main() {
    const std::vector<int16_t> pcm(1600, 250);

    // Provider presets
    {
        auto fw = asr::HttpTranscriptionEngine::fireworks("fw-key");
        assert(fw.endpoint.find("fireworks.ai/v1/audio/transcriptions") != std::string::npos);
        assert(fw.model == "whisper-v3-turbo");
        auto oa = asr::HttpTranscriptionEngine::openai("sk-key");
        assert(oa.endpoint == "https://api.openai.com/v1/audio/transcriptions");
        assert(oa.model == "whisper-1");
    }

    // Request: bearer header, form fields, 16 kHz mono WAV upload
    {
        auto opts = asr::HttpTranscriptionEngine::fireworks("fw-key");
        opts.timeout_seconds = 30;
        asr::HttpTranscriptionEngine engine(opts, [](const asr::HttpRequest&) { return asr::HttpResponse{}; });
        assert(engine.sample_rate() == 16000);
        assert(engine.name() == "fireworks (whisper-v3-turbo)");

        asr::DecodeParams params = asr::DecodeParams::for_chunks();
        params.language = "de";
        asr::HttpRequest req = engine.build_request(pcm.data(), pcm.size(), params);
        assert(req.url == opts.endpoint);
        assert(req.timeout_seconds == 30);
        assert(has_header(req, "Authorization: Bearer fw-key"));
        assert(has_field(req, "model", "whisper-v3-turbo"));
        assert(has_field(req, "temperature", "0"));
        assert(has_field(req, "language", "de"));
        assert(has_field(req, "response_format", "json"));
        assert(has_field(req, "vad_model", "silero"));
        assert(req.file_field == "file");
        assert(req.file_content_type == "audio/wav");
        assert(req.file_data.size() == 44 + pcm.size() * 2);
        assert(req.file_data.compare(0, 4, "RIFF") == 0);
        uint32_t rate = 0;
        uint16_t channels = 0;
        std::memcpy(&channels, req.file_data.data() + 22, 2);
        std::memcpy(&rate, req.file_data.data() + 24, 4);
        assert(channels == 1);
        assert(rate == 16000);

        // Auto-detect: no language field
        params.language.clear();
        req = engine.build_request(pcm.data(), pcm.size(), params);
        for (const auto& f : req.fields) assert(f.first != "language");
    }

    // Response parsing
    {
        asr::EngineResult r = asr::parse_transcription_response(reply(200, R"({"text": " Hello there."})"));
        assert(r.ok);
        assert(r.text == " Hello there.");

        r = asr::parse_transcription_response(reply(401, R"({"error": {"message": "Invalid API key"}})"));
        assert(!r.ok);
        assert(r.error == "HTTP 401: Invalid API key");

        r = asr::parse_transcription_response(reply(503, "upstream unavailable"));
        assert(!r.ok);
        assert(r.error == "HTTP 503: upstream unavailable");

        r = asr::parse_transcription_response(reply(200, "<html>not json</html>"));
        assert(!r.ok);
        assert(r.error.find("invalid JSON") != std::string::npos);

        r = asr::parse_transcription_response(reply(200, R"({"segments": []})"));
        assert(!r.ok);
        assert(r.error.find("no text") != std::string::npos);

        asr::HttpResponse down;
        down.error = "Cannot connect to https://example.invalid";
        r = asr::parse_transcription_response(down);
        assert(!r.ok);
        assert(r.error == down.error);
    }

    // transcribe() goes through the transport once per call
    {
        std::vector<asr::HttpRequest> seen;
        asr::HttpTranscriptionEngine engine(asr::HttpTranscriptionEngine::openai("sk-key"),
            [&seen](const asr::HttpRequest& req) {
                seen.push_back(req);
                return reply(200, R"({"text": "remote words"})");
            });
        asr::EngineResult r = engine.transcribe(pcm.data(), pcm.size(), asr::DecodeParams::for_full_file());
        assert(r.ok);
        assert(r.text == "remote words");
        assert(seen.size() == 1);
        assert(has_header(seen[0], "Authorization: Bearer sk-key"));

        // Nothing to upload
        r = engine.transcribe(pcm.data(), 0, asr::DecodeParams::for_chunks());
        assert(r.ok);
        assert(r.text.empty());
        assert(seen.size() == 1);
    }

    // Missing endpoint is an engine error, not a request
    {
        bool called = false;
        asr::HttpTranscriptionEngine::Options opts;
        asr::HttpTranscriptionEngine engine(opts, [&called](const asr::HttpRequest&) {
            called = true;
            return asr::HttpResponse{};
        });
        assert(!engine.transcribe(pcm.data(), pcm.size(), asr::DecodeParams::for_chunks()).ok);
        assert(!called);
    }

    // A pipeline session on the remote engine: windows are uploaded and merged
    {
        size_t uploads = 0;
        const char* texts[] = {"the quick brown fox jumps", "fox jumps over the lazy dog"};
        auto engine = std::make_shared<asr::HttpTranscriptionEngine>(
            asr::HttpTranscriptionEngine::fireworks("fw-key"),
            [&uploads, &texts](const asr::HttpRequest& req) {
                assert(req.file_data.size() > 44);
                const size_t i = uploads++;
                return reply(200, std::string(R"({"text": ")") + (i < 2 ? texts[i] : "") + "\"}");
            });

        core::PipelineController::Config cfg;
        cfg.sample_rate = 16000;
        cfg.channels = 1;
        cfg.window_duration_s = 2.0;
        cfg.overlap_duration_s = 0.5;
        cfg.queue_capacity = 4096;
        core::PipelineController pc(engine, cfg);
        assert(pc.start());
        std::vector<int16_t> block(320, 100);
        for (int i = 0; i < 175; ++i) pc.feed(block.data(), block.size());  // 3.5 s
        pc.stop();
        core::RecordingTranscript out = pc.finish();
        assert(out.ok);
        assert(!out.used_fallback);
        assert(uploads == 2);
        assert(out.text == "the quick brown fox jumps over the lazy dog");
    }

    // Real transport against a closed local port
    {
        asr::HttpRequest req;
        req.url = "http://127.0.0.1:9/v1/audio/transcriptions";
        req.timeout_seconds = 5;
        req.file_data = "RIFF";
        asr::HttpResponse resp = asr::curl_post_multipart(req);
        assert(!resp.success);
        assert(!resp.error.empty());
    }

    return 0;
}
