#include "audio/audio_input_device_synthetic.hpp"
#include <chrono>
#include <thread>

namespace audio {

AudioInputDevice_Synthetic::AudioInputDevice_Synthetic() = default;

AudioInputDevice_Synthetic::~AudioInputDevice_Synthetic() {
    stop();
}

bool AudioInputDevice_Synthetic::initialize(
    const AudioInputConfig& config,
    AudioCallback audio_callback,
    ErrorCallback error_callback
) {
    config_ = config;
    audio_callback_ = audio_callback;
    error_callback_ = error_callback;
    
    if (config_.synthetic_file_path.empty() && config_.device_id.rfind("synthetic:", 0) == 0) {
        config_.synthetic_file_path = config_.device_id.substr(10);
    }
    if (config_.synthetic_file_path.empty()) {
        if (error_callback_) {
            error_callback_("Synthetic device requires synthetic_file_path", true);
        }
        return false;
    }
    
    if (!file_capture_.start_from_wav(config_.synthetic_file_path, config_.buffer_size_ms)) {
        if (error_callback_) {
            error_callback_("Failed to load WAV file: " + config_.synthetic_file_path, true);
        }
        return false;
    }
    
    // FileCapture delivers mono at the file's own rate
    config_.sample_rate = file_capture_.sample_rate();
    config_.channels = 1;
    return true;
}

bool AudioInputDevice_Synthetic::start() {
    if (is_capturing_.load()) {
        return true;  // Already capturing
    }
    if (file_capture_.sample_rate() <= 0) {
        return false;  // Not initialized
    }
    if (capture_thread_ && capture_thread_->joinable()) {
        capture_thread_->join();  // Previous run finished on its own
    }
    
    should_stop_.store(false);
    is_capturing_.store(true);
    
    capture_thread_ = std::make_unique<std::thread>(
        &AudioInputDevice_Synthetic::capture_thread_func, this
    );
    
    return true;
}

void AudioInputDevice_Synthetic::stop() {
    should_stop_.store(true);
    
    if (capture_thread_ && capture_thread_->joinable()) {
        capture_thread_->join();
    }
    
    is_capturing_.store(false);
    capture_thread_.reset();
}

void AudioInputDevice_Synthetic::wait_until_finished() {
    if (capture_thread_ && capture_thread_->joinable()) {
        capture_thread_->join();
    }
    capture_thread_.reset();
}

void AudioInputDevice_Synthetic::capture_thread_func() {
    auto next_callback_time = std::chrono::steady_clock::now();
    
    while (!should_stop_.load()) {
        auto chunk = file_capture_.read_chunk();
        
        if (chunk.empty()) {
            break;  // End of file
        }
        
        if (audio_callback_) {
            audio_callback_(
                chunk.data(), 
                chunk.size(), 
                file_capture_.sample_rate(),
                1  // FileCapture returns mono
            );
        }
        
        if (!config_.synthetic_realtime) continue;

        // Sleep for the block's duration (simulate real-time capture)
        double chunk_duration_s = static_cast<double>(chunk.size()) / file_capture_.sample_rate();
        auto chunk_duration = std::chrono::duration<double>(chunk_duration_s);
        next_callback_time += std::chrono::duration_cast<std::chrono::steady_clock::duration>(chunk_duration);
        std::this_thread::sleep_until(next_callback_time);
    }
    
    is_capturing_.store(false);
}

AudioDeviceInfo AudioInputDevice_Synthetic::get_device_info() const {
    AudioDeviceInfo info;
    info.id = "synthetic";
    info.name = "Synthetic Device (File: " + config_.synthetic_file_path + ")";
    info.driver = "Synthetic";
    info.default_sample_rate = file_capture_.sample_rate();
    info.max_channels = 1;  // FileCapture returns mono
    info.is_default = false;
    return info;
}

} // namespace audio
