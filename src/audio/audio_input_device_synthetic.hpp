#pragma once

#include "audio/audio_input_device.hpp"
#include "audio/file_capture.hpp"
#include <thread>
#include <atomic>
#include <memory>

namespace audio {

/**
 * @brief Synthetic audio device that reads from a file and simulates microphone input
 * 
 * - Reads a WAV file in fixed blocks (buffer_size_ms) on its own thread
 * - Paces delivery at real-time cadence unless synthetic_realtime is false
 * - Stops at end of file
 */
class AudioInputDevice_Synthetic : public IAudioInputDevice {
public:
    AudioInputDevice_Synthetic();
    ~AudioInputDevice_Synthetic() override;
    
    bool initialize(
        const AudioInputConfig& config,
        AudioCallback audio_callback,
        ErrorCallback error_callback
    ) override;
    
    bool start() override;
    void stop() override;
    bool is_capturing() const override { return is_capturing_.load(); }
    AudioDeviceInfo get_device_info() const override;
    AudioInputConfig get_actual_config() const override { return config_; }

    // Blocks until the capture thread reached end of file or was stopped
    void wait_until_finished();
    
private:
    void capture_thread_func();
    
    AudioInputConfig config_;
    AudioCallback audio_callback_;
    ErrorCallback error_callback_;
    
    FileCapture file_capture_;
    
    // Threading
    std::unique_ptr<std::thread> capture_thread_;
    std::atomic<bool> is_capturing_{false};
    std::atomic<bool> should_stop_{false};
};

} // namespace audio
