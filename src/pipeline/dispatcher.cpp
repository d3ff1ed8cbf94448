#include "pipeline/dispatcher.hpp"

#include "app/errors.hpp"

#include <chrono>
#include <exception>
#include <iostream>

// Constructor
Dispatcher::Dispatcher(Config config, BoundedChannel<VadActivity>& channel, Transcriber& transcriber,
                       SampleRing* ring, TextCallback onText)
    : config_(config), channel_(channel), transcriber_(transcriber), ring_(ring), onText_(std::move(onText)) {
    buffer_.reserve(config_.maxUtteranceSamples);
}

void Dispatcher::run() {
    VadActivity activity;
    while (channel_.receive(activity)) {
        handle(activity);
    }
}

bool Dispatcher::handle(VadActivity& activity) {
    if (activity.isStart()) {
        std::cerr << "[Dispatcher] [INFO] speech started" << std::endl;
        return false;
    }

    const std::vector<int16_t>& pcm = collect(activity);

    if (pcm.size() < config_.minUtteranceSamples) {
        // whisper would reject it anyway
        ++skipped_;
        std::cerr << "[Dispatcher] [INFO] skipped " << pcm.size() << " samples, shorter than "
                  << config_.minUtteranceSamples << std::endl;
        return false;
    }

    if (activity.forced) {
        std::cerr << "[Dispatcher] [INFO] utterance reached the length limit, dispatching early" << std::endl;
    }

    const auto start = std::chrono::steady_clock::now();
    std::vector<std::string> segments;
    try {
        segments = transcriber_.transcribe(pcm.data(), pcm.size());
    } catch (const std::exception& e) {
        ++failed_;
        std::cerr << "[Dispatcher] [ERROR] transcription failed, utterance skipped: " << e.what() << std::endl;
        return true;
    }
    ++transcribed_;

    for (const std::string& text : segments) {
        if (!text.empty() && onText_) onText_(text);
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    std::cerr << "[Dispatcher] [INFO] \t@" << elapsed << "ms" << std::endl;
    return true;
}

// Producer and consumer agree on sample counts by construction, any mismatch
// is a bug and stops the pipeline
const std::vector<int16_t>& Dispatcher::collect(VadActivity& activity) {
    const size_t n = activity.sampleCount;
    if (n > config_.maxUtteranceSamples) {
        throw DesyncError("logic error: utterance of " + std::to_string(n) +
                          " samples exceeds the buffer limit of " + std::to_string(config_.maxUtteranceSamples));
    }

    if (!ring_) {
        if (activity.samples.size() != n) {
            throw DesyncError("logic error: utterance announced " + std::to_string(n) +
                              " samples but carries " + std::to_string(activity.samples.size()));
        }
        buffer_.swap(activity.samples);
        return buffer_;
    }

    if (activity.discardSamples > 0 && ring_->discard(activity.discardSamples) != activity.discardSamples) {
        throw DesyncError("logic error: not enough samples to skip a dropped utterance");
    }

    buffer_.resize(n);
    if (!ring_->popExact(buffer_.data(), n)) {
        throw DesyncError("logic error: not enough samples could be fetched");
    }
    return buffer_;
}
