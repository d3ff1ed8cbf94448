#include "audio/format_normalizer.hpp"

#include "app/errors.hpp"

#include <cmath>
#include <iostream>
#include <string>

// Constructor
LinearResampler::LinearResampler(int srcRate, int dstRate)
    : srcRate_(srcRate), dstRate_(dstRate), step_((double)srcRate / (double)dstRate) {}

void LinearResampler::reset() {
    pos_ = 0.0;
    prev_ = 0.0f;
}

// pos_ is always >= -1 on entry; -1 addresses prev_
void LinearResampler::process(const float* in, size_t n, std::vector<float>& out) {
    if (n == 0) return;

    const double last = (double)(n - 1);
    while (pos_ < last) {
        const double base = std::floor(pos_);
        const long i0 = (long)base;
        const float frac = (float)(pos_ - base);
        const float a = i0 < 0 ? prev_ : in[i0];
        const float b = in[i0 + 1];
        out.push_back(a + (b - a) * frac);
        pos_ += step_;
    }

    pos_ -= (double)n;
    prev_ = in[n - 1];
}

// Constructor
FormatNormalizer::FormatNormalizer(Config config) : config_(config) {
    if (config_.channels < 1 || config_.channels > 2) {
        throw ConfigError("configs with " + std::to_string(config_.channels) +
                          " channels are not supported, only mono and stereo");
    }
    if (config_.sourceSampleRate <= 0 || config_.targetSampleRate <= 0) {
        throw ConfigError("invalid sample rate " + std::to_string(config_.sourceSampleRate));
    }

    if (config_.sourceSampleRate != config_.targetSampleRate) {
        std::cerr << "[Normalizer] [INFO] running with resampling src" << config_.sourceSampleRate
                  << "->dest" << config_.targetSampleRate << std::endl;
        resampler_ = std::make_unique<LinearResampler>(config_.sourceSampleRate, config_.targetSampleRate);
    }
}

int16_t FormatNormalizer::quantize(float v) {
    const long s = std::lround((double)v * 32768.0);
    if (s > 32767) return 32767;
    if (s < -32768) return -32768;
    return (int16_t)s;
}

const std::vector<int16_t>& FormatNormalizer::process(const int16_t* interleaved, size_t frames) {
    mono_.clear();
    if (config_.channels == 2) {
        for (size_t i = 0; i < frames; ++i) {
            const float l = (float)interleaved[2 * i] / 32768.0f;
            const float r = (float)interleaved[2 * i + 1] / 32768.0f;
            mono_.push_back((l + r) * 0.5f);
        }
    } else {
        for (size_t i = 0; i < frames; ++i) mono_.push_back((float)interleaved[i] / 32768.0f);
    }
    return finish();
}

const std::vector<int16_t>& FormatNormalizer::process(const float* interleaved, size_t frames) {
    mono_.clear();
    if (config_.channels == 2) {
        for (size_t i = 0; i < frames; ++i) {
            mono_.push_back((interleaved[2 * i] + interleaved[2 * i + 1]) * 0.5f);
        }
    } else {
        mono_.assign(interleaved, interleaved + frames);
    }
    return finish();
}

const std::vector<int16_t>& FormatNormalizer::finish() {
    const std::vector<float>* src = &mono_;
    if (resampler_) {
        resampled_.clear();
        resampler_->process(mono_.data(), mono_.size(), resampled_);
        src = &resampled_;
    }

    out_.resize(src->size());
    for (size_t i = 0; i < src->size(); ++i) out_[i] = quantize((*src)[i]);
    return out_;
}
