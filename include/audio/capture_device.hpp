#ifndef CAPTURE_DEVICE_HPP
#define CAPTURE_DEVICE_HPP

#include "audio/audio_format.hpp"
#include "audio/stream_config.hpp"

#include <portaudio.h>

#include <cstdint>
#include <string>
#include <vector>

struct InputDeviceInfo {
    int index;
    std::string name;
    int maxInputChannels;
    double defaultSampleRate;
};

// PortAudio capture with blocking reads of one fixed-size buffer at a time.
class CaptureDevice {
public:
    CaptureDevice();
    ~CaptureDevice();

    CaptureDevice(const CaptureDevice&) = delete;
    CaptureDevice& operator=(const CaptureDevice&) = delete;

    std::vector<InputDeviceInfo> listInputDevices() const;

    // Picks the device by exact name (empty for the system default) and
    // negotiates channels, rate and buffer size. Throws ConfigError.
    void open(const std::string& name, int targetRate = kTargetSampleRate);

    void start();
    void stop();

    // Reads framesPerBuffer interleaved frames into buffer. Returns false when
    // the input overflowed and the read has to be retried.
    bool read(std::vector<int16_t>& buffer);

    const std::string& deviceName() const { return name_; }
    const StreamConfig& config() const { return config_; }

private:
    SupportedInputConfig probe(PaDeviceIndex device, const PaDeviceInfo* info) const;

    PaStream* stream_ = nullptr;
    PaDeviceIndex device_ = paNoDevice;
    std::string name_;
    StreamConfig config_;
    bool running_ = false;
};

#endif
