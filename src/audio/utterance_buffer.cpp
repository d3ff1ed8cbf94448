#include "audio/utterance_buffer.hpp"

#include <algorithm>

// Constructor
UtteranceBuffer::UtteranceBuffer(Config config) : config_(config) {
    active_.reserve(capacity());
    sealed_.reserve(capacity());
}

// Overwrites the active buffer with the silence pre-roll
size_t UtteranceBuffer::open() {
    active_.assign(config_.preRollSamples, 0);
    return active_.size();
}

size_t UtteranceBuffer::append(const int16_t* samples, size_t n) {
    const size_t fit = std::min(n, remaining());
    active_.insert(active_.end(), samples, samples + fit);
    return fit;
}

size_t UtteranceBuffer::remaining() const {
    return capacity() - active_.size();
}

// Swaps the filled buffer into the sealed slot and empties the other one
void UtteranceBuffer::seal(size_t sampleCount) {
    std::swap(active_, sealed_);
    if (sampleCount < sealed_.size()) sealed_.resize(sampleCount);
    active_.clear();
}

void UtteranceBuffer::exportSealed(std::vector<int16_t>& out) const {
    out.assign(sealed_.begin(), sealed_.end());
}
