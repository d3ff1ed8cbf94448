#ifndef ENDPOINTER_HPP
#define ENDPOINTER_HPP

#include "audio/audio_format.hpp"
#include "audio/utterance_store.hpp"
#include "vad/vad_activity.hpp"

#include <cstdint>
#include <optional>
#include <utility>

// Hysteresis endpointer. Consumes one classification result per frame and
// decides which frames belong to the current utterance.
//
//   Idle      -> speech frame                  -> SpeechStart, Listening
//   Listening -> endThresholdFrames of silence -> SpeechEnd(n), Idle
//
// While listening, silent frames up to lingerThresholdFrames after the last
// speech frame are still recorded; later silent frames are skipped until either
// speech resumes or the end threshold is reached.
class Endpointer {
public:
    struct Config {
        int targetSampleRate = kTargetSampleRate;
        size_t frameSamples = kFrameSamples;

        uint64_t endThresholdFrames = 8;    // 240ms
        uint64_t lingerThresholdFrames = 3; // 90ms

        // The store handed to the endpointer must be sized from these
        size_t preRollSamples = kPreRollSamples;
        size_t maxUtteranceSamples = kMaxUtteranceSamples;
    };

    // Events raised by a single frame. A frame that overflows the store raises a
    // forced SpeechEnd followed by the SpeechStart of the continuation.
    struct Events {
        VadActivity items[3];
        size_t count = 0;

        void push(VadActivity a) { items[count++] = std::move(a); }
        bool empty() const { return count == 0; }
        const VadActivity* begin() const { return items; }
        const VadActivity* end() const { return items + count; }
    };

    Endpointer(Config config, UtteranceStore& store);

    Events process(const int16_t* frame, size_t n, bool isSpeech);

    // Closes an utterance still open at end of stream.
    Events flush();

    bool isListening() const { return lastSpeechFrame_.has_value(); }
    uint64_t currentFrame() const { return currentFrame_; }
    std::optional<uint64_t> lastSpeechFrame() const { return lastSpeechFrame_; }

    // Only meaningful while isListening()
    size_t accumulatedSamples() const { return accumulated_; }

    const Config& config() const { return config_; }

private:
    void record(const int16_t* frame, size_t n, Events& events);
    void close(Events& events);

    Config config_;
    UtteranceStore& store_;

    uint64_t currentFrame_ = 0;
    std::optional<uint64_t> lastSpeechFrame_;
    size_t accumulated_ = 0;
};

#endif
