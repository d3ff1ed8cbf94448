#include "vad/endpointer.hpp"

#include <algorithm>
#include <stdexcept>

// Constructor
Endpointer::Endpointer(Config config, UtteranceStore& store) : config_(config), store_(store) {
    if (config_.frameSamples == 0) throw std::invalid_argument("endpointer: frameSamples must be positive");
    if (config_.endThresholdFrames == 0) throw std::invalid_argument("endpointer: endThresholdFrames must be positive");
    if (config_.lingerThresholdFrames >= config_.endThresholdFrames) {
        throw std::invalid_argument("endpointer: lingerThresholdFrames must be below endThresholdFrames");
    }
    if (config_.maxUtteranceSamples < config_.frameSamples) {
        throw std::invalid_argument("endpointer: maxUtteranceSamples must hold at least one frame");
    }
    if (store_.preRollSamples() != config_.preRollSamples ||
        store_.capacity() != config_.preRollSamples + config_.maxUtteranceSamples) {
        throw std::invalid_argument("endpointer: utterance store is sized for a different pre-roll or length limit");
    }
}

Endpointer::Events Endpointer::process(const int16_t* frame, size_t n, bool isSpeech) {
    Events events;

    if (!lastSpeechFrame_) {
        // inside a silence window
        if (!isSpeech) return events;

        accumulated_ = store_.open();
        lastSpeechFrame_ = currentFrame_;
        events.push(VadActivity::speechStart());
        record(frame, n, events);
        return events;
    }

    // inside a speech window
    ++currentFrame_;
    const uint64_t silenceRun = currentFrame_ - *lastSpeechFrame_;

    if (!isSpeech && silenceRun >= config_.endThresholdFrames) {
        close(events);
        return events;
    }

    if (isSpeech) lastSpeechFrame_ = currentFrame_;
    if (isSpeech || silenceRun <= config_.lingerThresholdFrames) record(frame, n, events);

    return events;
}

Endpointer::Events Endpointer::flush() {
    Events events;
    if (lastSpeechFrame_) close(events);
    return events;
}

// Appends a frame. When the store is full the utterance is cut there and the
// rest of the frame opens the next one, speech is still going on.
void Endpointer::record(const int16_t* frame, size_t n, Events& events) {
    const size_t fit = std::min(n, store_.remaining());
    accumulated_ += store_.append(frame, fit);
    if (fit == n) return;

    store_.seal(accumulated_);
    events.push(VadActivity::speechEnd(accumulated_, true));

    accumulated_ = store_.open();
    accumulated_ += store_.append(frame + fit, n - fit);
    events.push(VadActivity::speechStart());
}

void Endpointer::close(Events& events) {
    store_.seal(accumulated_);
    events.push(VadActivity::speechEnd(accumulated_));
    lastSpeechFrame_.reset();
    accumulated_ = 0;
}
