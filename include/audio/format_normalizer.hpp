#ifndef FORMAT_NORMALIZER_HPP
#define FORMAT_NORMALIZER_HPP

#include "audio/audio_format.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

// Streaming linear-interpolation resampler. Keeps the last input sample and the
// fractional read position between calls, so chunk boundaries are seamless.
class LinearResampler {
public:
    LinearResampler(int srcRate, int dstRate);

    // Appends the resampled chunk to out.
    void process(const float* in, size_t n, std::vector<float>& out);

    void reset();

    int srcRate() const { return srcRate_; }
    int dstRate() const { return dstRate_; }

private:
    int srcRate_;
    int dstRate_;
    double step_;        // input samples per output sample
    double pos_ = 0.0;   // next output position, relative to the current chunk
    float prev_ = 0.0f;  // last sample of the previous chunk, at position -1
};

// Turns device audio into mono int16 at the target rate:
// stereo is averaged, other rates are resampled on floats, and the result is
// quantized with saturating round-to-nearest.
class FormatNormalizer {
public:
    struct Config {
        int channels = 1;
        int sourceSampleRate = kTargetSampleRate;
        int targetSampleRate = kTargetSampleRate;
    };

    explicit FormatNormalizer(Config config);

    // frames is the number of interleaved sample frames in the chunk. The
    // returned buffer is reused by the next call.
    const std::vector<int16_t>& process(const int16_t* interleaved, size_t frames);
    const std::vector<int16_t>& process(const float* interleaved, size_t frames);

    bool resampling() const { return resampler_ != nullptr; }
    const Config& config() const { return config_; }

    static int16_t quantize(float v);

private:
    const std::vector<int16_t>& finish();

    Config config_;
    std::unique_ptr<LinearResampler> resampler_;

    std::vector<float> mono_;
    std::vector<float> resampled_;
    std::vector<int16_t> out_;
};

#endif
