#ifndef UTTERANCE_STORE_HPP
#define UTTERANCE_STORE_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

// Destination for the samples of the utterance the endpointer has open.
// Only ever touched from the producer side.
class UtteranceStore {
public:
    virtual ~UtteranceStore() = default;

    // Starts a new utterance seeded with the silence pre-roll. Returns samples stored.
    virtual size_t open() = 0;

    // Appends at most remaining() samples. Returns samples stored.
    virtual size_t append(const int16_t* samples, size_t n) = 0;

    // Room left in the open utterance.
    virtual size_t remaining() const = 0;

    virtual size_t preRollSamples() const = 0;

    // Largest utterance, pre-roll included.
    virtual size_t capacity() const = 0;

    // Closes the open utterance, sampleCount being what the endpointer reports for it.
    virtual void seal(size_t sampleCount) = 0;

    // Copies the last sealed utterance into out. Stores that hand samples over by
    // index instead of by value leave out empty.
    virtual void exportSealed(std::vector<int16_t>& out) const { out.clear(); }
};

#endif
