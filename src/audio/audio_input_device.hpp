#pragma once

#include <string>
#include <vector>
#include <functional>
#include <memory>
#include <cstdint>

namespace audio {

/**
 * @brief Metadata about an audio input device
 */
struct AudioDeviceInfo {
    std::string id;              // Unique device identifier
    std::string name;            // Human-readable name
    std::string driver;          // Driver/API name ("Synthetic", ...)
    int default_sample_rate;     // Native sample rate (48000, 44100, etc.)
    int max_channels;            // Maximum supported channels
    bool is_default;             // Is this the system default device?
    
    AudioDeviceInfo() 
        : default_sample_rate(48000)
        , max_channels(2)
        , is_default(false) {}
};

/**
 * @brief Configuration for audio input capture
 */
struct AudioInputConfig {
    std::string device_id;       // Device to use (empty = system default)
    int sample_rate = 44100;     // Requested sample rate
    int channels = 1;            // Mono = 1, Stereo = 2
    int buffer_size_ms = 20;     // Block size in milliseconds
    
    // For synthetic device only
    std::string synthetic_file_path;    // Path to WAV file
    bool synthetic_realtime = true;     // Pace blocks at real-time cadence
};

/**
 * @brief Callback for audio data
 * 
 * Called from the capture thread when a block is available. Must return quickly.
 * 
 * @param samples PCM16 audio samples (interleaved if stereo)
 * @param frame_count Number of frames in the block
 * @param sample_rate Actual sample rate of the data
 * @param channels Number of channels (1=mono, 2=stereo)
 */
using AudioCallback = std::function<void(
    const int16_t* samples, 
    size_t frame_count,
    int sample_rate,
    int channels
)>;

/**
 * @brief Error callback for device issues
 * 
 * @param error_message Human-readable error description
 * @param is_fatal If true, device has stopped and needs restart
 */
using ErrorCallback = std::function<void(const std::string& error_message, bool is_fatal)>;

/**
 * @brief Abstract base class for audio input devices
 *
 * The system microphone is provided by the host application; this repository
 * ships the synthetic (file playback) device.
 */
class IAudioInputDevice {
public:
    virtual ~IAudioInputDevice() = default;
    
    /**
     * @brief Initialize the device with configuration
     * @param config Device configuration
     * @param audio_callback Called when audio data is ready
     * @param error_callback Called on errors
     * @return true if initialization succeeded
     */
    virtual bool initialize(
        const AudioInputConfig& config,
        AudioCallback audio_callback,
        ErrorCallback error_callback
    ) = 0;
    
    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool is_capturing() const = 0;
    virtual AudioDeviceInfo get_device_info() const = 0;
    
    /**
     * @brief Get actual configuration being used (may differ from requested)
     */
    virtual AudioInputConfig get_actual_config() const = 0;
};

/**
 * @brief Factory for creating audio input devices
 */
class AudioInputFactory {
public:
    static std::vector<AudioDeviceInfo> enumerate_devices();
    
    /**
     * @brief Create an audio input device
     * @param device_id "synthetic" or "synthetic:path/to/file.wav"
     * @return Device instance, or nullptr for unknown ids
     */
    static std::unique_ptr<IAudioInputDevice> create_device(const std::string& device_id);
    
    static bool is_device_available(const std::string& device_id);
};

} // namespace audio
