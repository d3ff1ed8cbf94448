#include "pipeline/vad_producer.hpp"

#include <iostream>

// Constructor
VadProducer::VadProducer(Config config, SpeechClassifier& classifier, UtteranceStore& store,
                         BoundedChannel<VadActivity>& channel)
    : normalizer_(FormatNormalizer::Config{config.channels, config.sourceSampleRate, config.endpointer.targetSampleRate}),
      accumulator_(config.endpointer.frameSamples),
      classifier_(classifier),
      store_(store),
      endpointer_(config.endpointer, store),
      channel_(channel),
      frameCallback_([this](const int16_t* frame, size_t n) { onFrame(frame, n); }) {}

// Destructor
VadProducer::~VadProducer() { finish(); }

void VadProducer::feed(const int16_t* interleaved, size_t frames) {
    if (finished_) return;
    const std::vector<int16_t>& mono = normalizer_.process(interleaved, frames);
    accumulator_.push(mono.data(), mono.size(), frameCallback_);
}

void VadProducer::feed(const float* interleaved, size_t frames) {
    if (finished_) return;
    const std::vector<int16_t>& mono = normalizer_.process(interleaved, frames);
    accumulator_.push(mono.data(), mono.size(), frameCallback_);
}

void VadProducer::finish() {
    if (finished_) return;
    finished_ = true;

    // a partial frame left in staging is never classified
    accumulator_.reset();
    emit(endpointer_.flush());
    channel_.close();
}

void VadProducer::onFrame(const int16_t* frame, size_t n) {
    const bool speech = classifier_.isSpeech(frame, n);
    const Endpointer::Events events = endpointer_.process(frame, n, speech);
    if (!events.empty()) emit(events);
}

void VadProducer::emit(const Endpointer::Events& events) {
    for (const VadActivity& activity : events) send(activity);
}

// Samples are in the store before the SpeechEnd goes out
void VadProducer::send(const VadActivity& activity) {
    VadActivity msg = activity;
    if (msg.isEnd()) {
        store_.exportSealed(msg.samples);
        if (msg.samples.empty()) msg.discardSamples = pendingDiscard_;
    }

    const bool byIndex = msg.isEnd() && msg.samples.empty();
    const size_t count = msg.sampleCount;

    if (channel_.trySend(std::move(msg))) {
        if (byIndex) pendingDiscard_ = 0;
        return;
    }

    ++droppedEvents_;
    if (byIndex) {
        // the samples are in the ring already, the next SpeechEnd tells the
        // dispatcher to skip them
        pendingDiscard_ += count;
    }
    std::cerr << "[Producer] [WARN] event channel full, dropped a "
              << (activity.isEnd() ? "speech end" : "speech start") << std::endl;
}
