#ifndef STREAM_CONFIG_HPP
#define STREAM_CONFIG_HPP

#include <string>
#include <vector>

// Selectable ALSA buffer sizes follow an odd pattern, 32 works as a quantum
// over a wide range of sizes
static constexpr unsigned long kBufferQuantum = 32;
static constexpr unsigned long kBufferMin = 32;

struct StreamConfig {
    int channels = 0;
    int sampleRate = 0;
    unsigned long framesPerBuffer = 0;
};

// What a capture device offers for one channel layout
struct SupportedInputConfig {
    int channels = 0;
    std::vector<int> sampleRates;     // ascending
    unsigned long minBufferFrames = 0; // 0 when the device does not say
    unsigned long maxBufferFrames = 0;
};

// ~33ms of audio rounded up to the buffer quantum, clamped into [minFrames, maxFrames]
// when those are known.
unsigned long fixedBufferFrames(int sampleRate, unsigned long minFrames = 0, unsigned long maxFrames = 0);

// The target rate when supported, else the lowest rate if it is above the
// target, else the highest. Throws ConfigError on an empty list.
int chooseSampleRate(const std::vector<int>& supported, int targetRate);

// Throws ConfigError for layouts with more than two channels or no usable rate.
StreamConfig negotiateStreamConfig(const std::string& deviceName, const SupportedInputConfig& supported,
                                   int targetRate);

#endif
