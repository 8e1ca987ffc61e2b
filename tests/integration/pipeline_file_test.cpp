// End to end: WAV file -> synthetic microphone -> pipeline -> transcript
#undef NDEBUG  // assert() must stay active in release builds
#include <cassert>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "asr/transcription_engine.hpp"
#include "audio/audio_input_device.hpp"
#include "audio/audio_input_device_synthetic.hpp"
#include "audio/wav_file.hpp"
#include "core/pipeline_controller.hpp"

namespace fs = std::filesystem;

namespace {

constexpr double kPi = 3.14159265358979323846;

class CountingEngine : public asr::TranscriptionEngine {
public:
    asr::EngineResult transcribe(const int16_t*, size_t count, const asr::DecodeParams& params) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (params.beam_size > 1) {
            full_lengths.push_back(count);
            return asr::EngineResult::success("complete transcript");
        }
        static const char* texts[] = {"one two three four", "three four five six", "five six seven"};
        size_t call = chunk_lengths.size();
        chunk_lengths.push_back(count);
        return asr::EngineResult::success(call < 3 ? texts[call] : "");
    }
    int sample_rate() const override { return 16000; }
    std::string name() const override { return "counting"; }

    std::mutex mutex_;
    std::vector<size_t> chunk_lengths;
    std::vector<size_t> full_lengths;
};

std::string write_tone(const fs::path& path, double seconds, int rate, int channels) {
    const size_t frames = static_cast<size_t>(seconds * rate);
    std::vector<int16_t> pcm(frames * channels);
    for (size_t i = 0; i < frames; ++i) {
        auto v = static_cast<int16_t>(8000.0 * std::sin(2.0 * kPi * 440.0 * i / rate));
        for (int c = 0; c < channels; ++c) pcm[i * channels + c] = v;
    }
    assert(audio::write_wav(path.string(), pcm, rate, channels));
    return path.string();
}

core::RecordingTranscript run_file(const std::string& wav, const std::string& recordings,
                                   std::shared_ptr<CountingEngine> engine) {
    audio::AudioInputConfig dev_cfg;
    dev_cfg.device_id = "synthetic:" + wav;
    dev_cfg.synthetic_realtime = false;
    assert(audio::AudioInputFactory::is_device_available(dev_cfg.device_id));
    auto device = audio::AudioInputFactory::create_device(dev_cfg.device_id);
    assert(device);

    // Unpaced replay: hold the file thread while the worker catches up
    std::unique_ptr<core::PipelineController> pc;
    const size_t queue_capacity = 64;
    bool fatal_error = false;
    assert(device->initialize(
        dev_cfg,
        [&pc, queue_capacity](const int16_t* samples, size_t frames, int, int) {
            pc->wait_for_queue_below(queue_capacity / 2, std::chrono::milliseconds(30000));
            pc->feed(samples, frames);
        },
        [&fatal_error](const std::string&, bool fatal) { fatal_error = fatal_error || fatal; }));

    const audio::AudioDeviceInfo info = device->get_device_info();
    assert(info.driver == "Synthetic");
    assert(info.name.find(wav) != std::string::npos);
    assert(info.default_sample_rate == device->get_actual_config().sample_rate);
    assert(info.max_channels == 1);

    core::PipelineController::Config cfg;
    cfg.queue_capacity = queue_capacity;
    cfg.sample_rate = device->get_actual_config().sample_rate;
    cfg.channels = device->get_actual_config().channels;
    cfg.window_duration_s = 2.0;
    cfg.overlap_duration_s = 0.5;
    cfg.min_flush_duration_s = 0.5;
    cfg.recordings_dir = recordings;
    pc = std::make_unique<core::PipelineController>(engine, cfg);
    assert(pc->start());

    assert(device->start());
    static_cast<audio::AudioInputDevice_Synthetic*>(device.get())->wait_until_finished();
    device->stop();
    assert(!fatal_error);

    pc->stop();
    return pc->finish();
}

} // namespace

int main() {
    const fs::path dir = fs::temp_directory_path() / "chunkscribe_pipeline_file_test";
    fs::remove_all(dir);
    fs::create_directories(dir);
    const std::string recordings = (dir / "recordings").string();

    assert(!audio::AudioInputFactory::create_device("wasapi:default"));
    const auto devices = audio::AudioInputFactory::enumerate_devices();
    assert(devices.size() == 1);
    assert(devices[0].id == "synthetic");
    assert(devices[0].is_default);

    // 5 s of 44.1 kHz stereo: three 2 s windows, nothing left to flush
    {
        auto engine = std::make_shared<CountingEngine>();
        const std::string wav = write_tone(dir / "five_seconds.wav", 5.0, 44100, 2);
        core::RecordingTranscript out = run_file(wav, recordings, engine);

        assert(out.ok);
        assert(!out.used_fallback);
        assert(out.text == "one two three four five six seven");
        assert(out.finalize.frames_recorded == 220500);
        assert(out.finalize.windows_transcribed == 3);
        assert(out.finalize.flush_windows == 0);
        assert(out.finalize.dropped_blocks == 0);
        // Each 88200-frame window reaches the engine resampled to 16 kHz
        assert((engine->chunk_lengths == std::vector<size_t>{32000, 32000, 32000}));
        assert(engine->full_lengths.empty());

        // The recording was saved as mono at the capture rate
        assert(!out.finalize.recording_path.empty());
        audio::WavData saved;
        assert(audio::read_wav(out.finalize.recording_path, saved));
        assert(saved.sample_rate == 44100);
        assert(saved.channels == 1);
        assert(saved.frames() == 220500);
    }

    // 1 s recording: shorter than a window, transcribed again from the saved file
    {
        auto engine = std::make_shared<CountingEngine>();
        const std::string wav = write_tone(dir / "one_second.wav", 1.0, 44100, 1);
        core::RecordingTranscript out = run_file(wav, recordings, engine);

        assert(out.ok);
        assert(out.used_fallback);
        assert(out.finalize.has_issue(core::PipelineIssue::ShortRecording));
        assert(out.text == "complete transcript");
        assert(engine->chunk_lengths.size() == 1);
        assert(engine->full_lengths == std::vector<size_t>{16000});
    }

    fs::remove_all(dir);
    return 0;
}
