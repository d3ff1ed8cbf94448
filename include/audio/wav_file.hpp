#ifndef WAV_FILE_HPP
#define WAV_FILE_HPP

#include <cstdint>
#include <string>
#include <vector>

struct WavData {
    int sampleRate = 0;
    int channels = 0;
    int bitsPerSample = 0;
    std::vector<int16_t> samples; // interleaved

    size_t frames() const { return channels > 0 ? samples.size() / (size_t)channels : 0; }
    double durationSeconds() const { return sampleRate > 0 ? (double)frames() / sampleRate : 0.0; }
};

// Reads a PCM16 or float32 WAV file. Float samples are quantized to int16.
// Throws ConfigError when the file is missing or not a supported WAV.
WavData readWavFile(const std::string& path);

// Canonical 44-byte header WAV: PCM 16-bit signed, mono.
std::vector<uint8_t> encodeWav(const int16_t* samples, size_t n, int sampleRate);

#endif
