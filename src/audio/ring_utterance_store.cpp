#include "audio/ring_utterance_store.hpp"

#include <algorithm>
#include <iostream>

// Constructor
RingUtteranceStore::RingUtteranceStore(SampleRing& ring, Config config)
    : ring_(ring), config_(config) {}

size_t RingUtteranceStore::open() {
    stored_ = 0;
    dropReported_ = false;

    const size_t n = ring_.pushSilence(config_.preRollSamples);
    if (n != config_.preRollSamples) reportDrop(config_.preRollSamples - n);
    stored_ = n;
    return n;
}

size_t RingUtteranceStore::append(const int16_t* samples, size_t n) {
    const size_t fit = std::min(n, remaining());
    const size_t written = ring_.push(samples, fit);
    if (written != fit) reportDrop(fit - written);
    stored_ += written;
    return written;
}

size_t RingUtteranceStore::remaining() const {
    return capacity() - stored_;
}

// Samples are already in the ring, only the per-utterance count resets
void RingUtteranceStore::seal(size_t) {
    stored_ = 0;
}

// Warns once per utterance, the audio thread must not flood stderr
void RingUtteranceStore::reportDrop(size_t n) {
    dropped_ += n;
    if (dropReported_) return;
    dropReported_ = true;
    std::cerr << "[Producer] [WARN] transcription audio ring was full, dropped some audio" << std::endl;
}
