#include "audio/capture_device.hpp"

#include "app/errors.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

static void pa_check(PaError e, const char* msg) {
    if (e != paNoError) {
        throw std::runtime_error(std::string(msg) + " (" + std::to_string((int)e) + "): " + Pa_GetErrorText(e));
    }
}

static const int kProbeRates[] = {8000, 11025, 16000, 22050, 32000, 44100, 48000, 88200, 96000};

// Constructor
CaptureDevice::CaptureDevice() {
    pa_check(Pa_Initialize(), "Pa_Initialize");
}

// Destructor
CaptureDevice::~CaptureDevice() {
    if (stream_) {
        if (running_) Pa_StopStream(stream_);
        Pa_CloseStream(stream_);
    }
    Pa_Terminate();
}

std::vector<InputDeviceInfo> CaptureDevice::listInputDevices() const {
    std::vector<InputDeviceInfo> devices;
    const int count = Pa_GetDeviceCount();
    if (count < 0) pa_check(count, "Pa_GetDeviceCount");

    for (int i = 0; i < count; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (info && info->maxInputChannels > 0) {
            devices.push_back({i, info->name, info->maxInputChannels, info->defaultSampleRate});
        }
    }
    return devices;
}

// Mono is preferred over stereo; a device offering neither is reported with its
// full channel count so negotiation can reject it
SupportedInputConfig CaptureDevice::probe(PaDeviceIndex device, const PaDeviceInfo* info) const {
    std::vector<int> candidates(std::begin(kProbeRates), std::end(kProbeRates));
    candidates.push_back((int)info->defaultSampleRate);
    std::sort(candidates.begin(), candidates.end());
    candidates.erase(std::unique(candidates.begin(), candidates.end()), candidates.end());

    auto ratesFor = [&](int channels) {
        PaStreamParameters params{};
        params.device = device;
        params.channelCount = channels;
        params.sampleFormat = paInt16;
        params.suggestedLatency = info->defaultLowInputLatency;
        params.hostApiSpecificStreamInfo = nullptr;

        std::vector<int> rates;
        for (int rate : candidates) {
            if (Pa_IsFormatSupported(&params, nullptr, rate) == paFormatIsSupported) rates.push_back(rate);
        }
        return rates;
    };

    SupportedInputConfig supported;
    for (int channels = 1; channels <= std::min(2, info->maxInputChannels); ++channels) {
        std::vector<int> rates = ratesFor(channels);
        if (!rates.empty()) {
            supported.channels = channels;
            supported.sampleRates = std::move(rates);
            return supported;
        }
    }

    supported.channels = info->maxInputChannels;
    if (info->maxInputChannels > 2) supported.sampleRates = ratesFor(info->maxInputChannels);
    return supported;
}

void CaptureDevice::open(const std::string& name, int targetRate) {
    if (stream_) throw std::logic_error("capture device already open");

    device_ = paNoDevice;
    if (name.empty()) {
        device_ = Pa_GetDefaultInputDevice();
        if (device_ == paNoDevice) throw ConfigError("no default input device");
    } else {
        for (const InputDeviceInfo& dev : listInputDevices()) {
            if (dev.name == name) {
                device_ = dev.index;
                break;
            }
        }
        if (device_ == paNoDevice) throw ConfigError("input device unavailable: " + name);
    }

    const PaDeviceInfo* info = Pa_GetDeviceInfo(device_);
    if (!info) throw ConfigError("could not get device info for device " + std::to_string(device_));
    name_ = info->name;

    config_ = negotiateStreamConfig(name_, probe(device_, info), targetRate);

    PaStreamParameters inParams{};
    inParams.device = device_;
    inParams.channelCount = config_.channels;
    inParams.sampleFormat = paInt16;
    inParams.suggestedLatency = info->defaultLowInputLatency;
    inParams.hostApiSpecificStreamInfo = nullptr;

    pa_check(
        Pa_OpenStream(&stream_, &inParams, nullptr,
                      config_.sampleRate, config_.framesPerBuffer,
                      paNoFlag, nullptr, nullptr),
        "Pa_OpenStream"
    );

    std::cerr << "[Capture] [INFO] using audio: '" << name_ << "' " << config_.channels << "ch "
              << config_.sampleRate << "Hz, " << config_.framesPerBuffer << " frames per buffer" << std::endl;
}

void CaptureDevice::start() {
    if (!stream_) throw std::logic_error("capture device not open");
    if (running_) return;
    pa_check(Pa_StartStream(stream_), "Pa_StartStream");
    running_ = true;
}

void CaptureDevice::stop() {
    if (!stream_ || !running_) return;
    running_ = false;
    pa_check(Pa_StopStream(stream_), "Pa_StopStream");
}

bool CaptureDevice::read(std::vector<int16_t>& buffer) {
    buffer.resize(config_.framesPerBuffer * (unsigned long)config_.channels);

    PaError e = Pa_ReadStream(stream_, buffer.data(), config_.framesPerBuffer);
    if (e == paInputOverflowed) {
        return false;
    }
    pa_check(e, "Pa_ReadStream");
    return true;
}
