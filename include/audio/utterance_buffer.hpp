#ifndef UTTERANCE_BUFFER_HPP
#define UTTERANCE_BUFFER_HPP

#include "audio/audio_format.hpp"
#include "audio/utterance_store.hpp"

#include <vector>
#include <cstdint>

// Bounded contiguous utterance storage. Two buffers are allocated up front and
// swapped on seal(), so the sealed utterance stays readable while the next one
// fills and nothing is reallocated on the audio path.
class UtteranceBuffer : public UtteranceStore {
public:
    struct Config {
        size_t preRollSamples = kPreRollSamples;
        size_t maxUtteranceSamples = kMaxUtteranceSamples;
    };

    explicit UtteranceBuffer(Config config);

    size_t open() override;
    size_t append(const int16_t* samples, size_t n) override;
    size_t remaining() const override;
    void seal(size_t sampleCount) override;
    void exportSealed(std::vector<int16_t>& out) const override;

    size_t preRollSamples() const override { return config_.preRollSamples; }
    size_t capacity() const override { return config_.preRollSamples + config_.maxUtteranceSamples; }

    const std::vector<int16_t>& active() const { return active_; }
    const std::vector<int16_t>& sealed() const { return sealed_; }

private:
    Config config_;

    std::vector<int16_t> active_;
    std::vector<int16_t> sealed_;
};

#endif
