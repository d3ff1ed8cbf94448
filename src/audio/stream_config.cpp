#include "audio/stream_config.hpp"

#include "app/errors.hpp"

#include <algorithm>

unsigned long fixedBufferFrames(int sampleRate, unsigned long minFrames, unsigned long maxFrames) {
    const unsigned long base = sampleRate > 0 ? (unsigned long)sampleRate / 30 : 0;
    unsigned long frames = (base + kBufferQuantum - 1) / kBufferQuantum * kBufferQuantum;
    frames = std::max(frames, kBufferMin);

    if (minFrames > 0) frames = std::max(frames, minFrames);
    if (maxFrames > 0) frames = std::min(frames, maxFrames);
    return frames;
}

int chooseSampleRate(const std::vector<int>& supported, int targetRate) {
    if (supported.empty()) throw ConfigError("no supported sample rate");

    if (std::find(supported.begin(), supported.end(), targetRate) != supported.end()) return targetRate;

    const int lowest = *std::min_element(supported.begin(), supported.end());
    const int highest = *std::max_element(supported.begin(), supported.end());
    return lowest > targetRate ? lowest : highest;
}

StreamConfig negotiateStreamConfig(const std::string& deviceName, const SupportedInputConfig& supported,
                                   int targetRate) {
    if (supported.channels > 2) {
        throw ConfigError(deviceName + " has more than two channels. Only Mono and Stereo audio is supported");
    }
    if (supported.channels < 1) {
        throw ConfigError(deviceName + ": does not have any valid input configurations");
    }
    if (supported.sampleRates.empty()) {
        throw ConfigError(deviceName + ": no sample rate could be negotiated");
    }

    StreamConfig config;
    config.channels = supported.channels;
    config.sampleRate = chooseSampleRate(supported.sampleRates, targetRate);
    config.framesPerBuffer = fixedBufferFrames(config.sampleRate, supported.minBufferFrames, supported.maxBufferFrames);
    return config;
}
