#ifndef VAD_PRODUCER_HPP
#define VAD_PRODUCER_HPP

#include "audio/format_normalizer.hpp"
#include "audio/frame_accumulator.hpp"
#include "audio/utterance_store.hpp"
#include "pipeline/bounded_channel.hpp"
#include "vad/endpointer.hpp"
#include "vad/speech_classifier.hpp"
#include "vad/vad_activity.hpp"

// Producer half of the pipeline, driven by the audio source:
// normalize -> frame -> classify -> endpoint -> store samples -> send events.
// Never blocks; events that do not fit in the channel are dropped with a warning.
class VadProducer {
public:
    struct Config {
        int channels = 1;
        int sourceSampleRate = kTargetSampleRate;
        Endpointer::Config endpointer;
    };

    VadProducer(Config config, SpeechClassifier& classifier, UtteranceStore& store,
                BoundedChannel<VadActivity>& channel);
    ~VadProducer();

    VadProducer(const VadProducer&) = delete;
    VadProducer& operator=(const VadProducer&) = delete;

    // frames is the number of interleaved sample frames in the chunk
    void feed(const int16_t* interleaved, size_t frames);
    void feed(const float* interleaved, size_t frames);

    // End of stream: closes an open utterance and then the channel.
    void finish();

    size_t droppedEvents() const { return droppedEvents_; }
    const Endpointer& endpointer() const { return endpointer_; }

private:
    void onFrame(const int16_t* frame, size_t n);
    void emit(const Endpointer::Events& events);
    void send(const VadActivity& activity);

    FormatNormalizer normalizer_;
    FrameAccumulator accumulator_;
    SpeechClassifier& classifier_;
    UtteranceStore& store_;
    Endpointer endpointer_;
    BoundedChannel<VadActivity>& channel_;

    FrameAccumulator::FrameCallback frameCallback_;

    size_t pendingDiscard_ = 0;
    size_t droppedEvents_ = 0;
    bool finished_ = false;
};

#endif
