#include "audio/audio_input_device.hpp"
#include "audio/audio_input_device_synthetic.hpp"

namespace audio {

std::vector<AudioDeviceInfo> AudioInputFactory::enumerate_devices() {
    std::vector<AudioDeviceInfo> devices;
    
    AudioDeviceInfo synthetic;
    synthetic.id = "synthetic";
    synthetic.name = "Synthetic Device (File Playback)";
    synthetic.driver = "Synthetic";
    synthetic.default_sample_rate = 44100;
    synthetic.max_channels = 1;
    synthetic.is_default = true;
    devices.push_back(synthetic);
    
    return devices;
}

std::unique_ptr<IAudioInputDevice> AudioInputFactory::create_device(const std::string& device_id) {
    if (device_id == "synthetic" || device_id.rfind("synthetic:", 0) == 0) {
        return std::make_unique<AudioInputDevice_Synthetic>();
    }
    return nullptr;
}

bool AudioInputFactory::is_device_available(const std::string& device_id) {
    if (device_id.rfind("synthetic:", 0) == 0) return true;
    for (const auto& dev : enumerate_devices()) {
        if (dev.id == device_id) {
            return true;
        }
    }
    return false;
}

} // namespace audio
