#ifndef FRAME_ACCUMULATOR_HPP
#define FRAME_ACCUMULATOR_HPP

#include "audio/audio_format.hpp"

#include <cstdint>
#include <functional>
#include <vector>

// Regroups arbitrarily sized chunks into fixed-size classification frames.
// Fewer than frameSamples samples stay staged between calls.
class FrameAccumulator {
public:
    using FrameCallback = std::function<void(const int16_t* frame, size_t n)>;

    explicit FrameAccumulator(size_t frameSamples = kFrameSamples);

    // Calls onFrame once per completed frame, in order.
    void push(const int16_t* samples, size_t n, const FrameCallback& onFrame);

    size_t frameSamples() const { return frameSamples_; }
    size_t staged() const { return staging_.size(); }

    void reset() { staging_.clear(); }

private:
    size_t frameSamples_;
    std::vector<int16_t> staging_;
};

#endif
