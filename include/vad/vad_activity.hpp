#ifndef VAD_ACTIVITY_HPP
#define VAD_ACTIVITY_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

// Endpointing event passed from the producer to the dispatcher.
// SpeechStart and SpeechEnd strictly alternate.
struct VadActivity {
    enum class Kind { SpeechStart, SpeechEnd };

    Kind kind = Kind::SpeechStart;

    // SpeechEnd only: samples in the utterance, pre-roll included
    size_t sampleCount = 0;

    // SpeechEnd only: the utterance hit the buffer limit and speech carries on
    bool forced = false;

    // SpeechEnd only: samples of earlier utterances whose SpeechEnd was dropped,
    // to be skipped in the ring before popping this one
    size_t discardSamples = 0;

    // SpeechEnd only: the utterance itself when it travels by value; empty when
    // the samples sit in the shared ring
    std::vector<int16_t> samples;

    static VadActivity speechStart() { return VadActivity{}; }

    static VadActivity speechEnd(size_t n, bool forced = false) {
        VadActivity a;
        a.kind = Kind::SpeechEnd;
        a.sampleCount = n;
        a.forced = forced;
        return a;
    }

    bool isStart() const { return kind == Kind::SpeechStart; }
    bool isEnd() const { return kind == Kind::SpeechEnd; }
};

#endif
