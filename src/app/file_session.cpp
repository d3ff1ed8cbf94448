#include "app/session.hpp"

#include "audio/file_replay.hpp"
#include "audio/utterance_buffer.hpp"
#include "pipeline/vad_producer.hpp"
#include "vad/speech_classifier.hpp"

#include <iostream>
#include <thread>

Dispatcher::Config dispatcherConfig(const Endpointer::Config& endpointer) {
    Dispatcher::Config config;
    config.sampleRate = endpointer.targetSampleRate;
    config.maxUtteranceSamples = endpointer.preRollSamples + endpointer.maxUtteranceSamples;
    return config;
}

SessionStats runFileSession(const Options& opts, Transcriber& transcriber, const std::atomic<bool>& running,
                            const Dispatcher::TextCallback& onText) {
    FileReplay replay(readWavFile(opts.file), FileReplay::Config{opts.paced});
    std::cerr << "[Replay] [INFO] " << opts.file << ": " << replay.config().channels << "ch "
              << replay.config().sampleRate << "Hz, " << replay.wav().durationSeconds() << "s" << std::endl;

    VadProducer::Config pc;
    pc.channels = replay.config().channels;
    pc.sourceSampleRate = replay.config().sampleRate;
    const Endpointer::Config& ep = pc.endpointer;

    BoundedChannel<VadActivity> channel(kEventChannelCapacity);
    EnergyClassifier classifier(EnergyClassifier::Config{opts.vadThreshold});
    UtteranceBuffer store(UtteranceBuffer::Config{ep.preRollSamples, ep.maxUtteranceSamples});
    VadProducer producer(pc, classifier, store, channel);

    Dispatcher dispatcher(dispatcherConfig(ep), channel, transcriber, nullptr, onText);

    std::atomic<bool> aborted{false};
    std::thread feeder([&] {
        replay.run([&](const int16_t* chunk, size_t frames) {
            if (!running.load() || aborted.load()) return false;
            producer.feed(chunk, frames);
            return true;
        });
        producer.finish();
    });

    try {
        dispatcher.run();
    } catch (...) {
        aborted = true;
        channel.close();
        feeder.join();
        throw;
    }
    feeder.join();

    SessionStats stats;
    stats.transcribed = dispatcher.transcribed();
    stats.skipped = dispatcher.skipped();
    stats.failed = dispatcher.failed();
    stats.droppedEvents = producer.droppedEvents();
    return stats;
}
