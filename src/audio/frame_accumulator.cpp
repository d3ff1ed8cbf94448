#include "audio/frame_accumulator.hpp"

#include <algorithm>
#include <stdexcept>

// Constructor
FrameAccumulator::FrameAccumulator(size_t frameSamples) : frameSamples_(frameSamples) {
    if (frameSamples_ == 0) throw std::invalid_argument("frame accumulator: frame size must be positive");
    staging_.reserve(frameSamples_);
}

void FrameAccumulator::push(const int16_t* samples, size_t n, const FrameCallback& onFrame) {
    size_t offset = 0;
    while (offset < n) {
        const size_t take = std::min(frameSamples_ - staging_.size(), n - offset);
        staging_.insert(staging_.end(), samples + offset, samples + offset + take);
        offset += take;

        if (staging_.size() == frameSamples_) {
            onFrame(staging_.data(), staging_.size());
            staging_.clear();
        }
    }
}
