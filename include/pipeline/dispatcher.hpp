#ifndef DISPATCHER_HPP
#define DISPATCHER_HPP

#include "audio/audio_format.hpp"
#include "audio/sample_ring.hpp"
#include "pipeline/bounded_channel.hpp"
#include "stt/transcriber.hpp"
#include "vad/vad_activity.hpp"

#include <functional>
#include <string>
#include <vector>

// Consumer half of the pipeline. Drains endpointing events, collects each
// finished utterance and hands it to the transcriber.
//
// Utterance samples come either inside the SpeechEnd message or, when ring is
// set, from the ring shared with the producer by count.
class Dispatcher {
public:
    struct Config {
        int sampleRate = kTargetSampleRate;
        size_t maxUtteranceSamples = kPreRollSamples + kMaxUtteranceSamples;
        size_t minUtteranceSamples = kMinUtteranceSamples;
    };

    using TextCallback = std::function<void(const std::string& text)>;

    Dispatcher(Config config, BoundedChannel<VadActivity>& channel, Transcriber& transcriber,
               SampleRing* ring, TextCallback onText);

    // Runs until the channel is closed and drained. Throws DesyncError.
    void run();

    // Handles one event, returns true if the transcriber was invoked.
    bool handle(VadActivity& activity);

    size_t transcribed() const { return transcribed_; }
    size_t skipped() const { return skipped_; }
    size_t failed() const { return failed_; }

private:
    const std::vector<int16_t>& collect(VadActivity& activity);

    Config config_;
    BoundedChannel<VadActivity>& channel_;
    Transcriber& transcriber_;
    SampleRing* ring_;
    TextCallback onText_;

    std::vector<int16_t> buffer_;

    size_t transcribed_ = 0;
    size_t skipped_ = 0;
    size_t failed_ = 0;
};

#endif
