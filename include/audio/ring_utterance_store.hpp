#ifndef RING_UTTERANCE_STORE_HPP
#define RING_UTTERANCE_STORE_HPP

#include "audio/audio_format.hpp"
#include "audio/sample_ring.hpp"
#include "audio/utterance_store.hpp"

// Writes utterance samples straight into the ring shared with the dispatcher.
// The dispatcher finds them again by count, so nothing is copied through the
// event channel. If the ring is full the newest samples are dropped and only
// what was actually written is counted.
class RingUtteranceStore : public UtteranceStore {
public:
    struct Config {
        size_t preRollSamples = kPreRollSamples;
        size_t maxUtteranceSamples = kMaxUtteranceSamples;
    };

    RingUtteranceStore(SampleRing& ring, Config config);

    size_t open() override;
    size_t append(const int16_t* samples, size_t n) override;
    size_t remaining() const override;
    void seal(size_t sampleCount) override;

    size_t preRollSamples() const override { return config_.preRollSamples; }
    size_t capacity() const override { return config_.preRollSamples + config_.maxUtteranceSamples; }

    size_t droppedSamples() const { return dropped_; }

private:
    void reportDrop(size_t n);

    SampleRing& ring_;
    Config config_;

    size_t stored_ = 0;
    size_t dropped_ = 0;
    bool dropReported_ = false;
};

#endif
