#include "app/session.hpp"

#include "audio/capture_device.hpp"
#include "audio/ring_utterance_store.hpp"
#include "pipeline/vad_producer.hpp"
#include "vad/speech_classifier.hpp"

#include <exception>
#include <iostream>
#include <thread>

SessionStats runLiveSession(const Options& opts, Transcriber& transcriber, const std::atomic<bool>& running,
                            const Dispatcher::TextCallback& onText) {
    CaptureDevice device;
    device.open(opts.device);
    const StreamConfig& config = device.config();

    VadProducer::Config pc;
    pc.channels = config.channels;
    pc.sourceSampleRate = config.sampleRate;
    const Endpointer::Config& ep = pc.endpointer;

    // room for two full utterances, the dispatcher may still be busy with the last one
    SampleRing ring(2 * (ep.preRollSamples + ep.maxUtteranceSamples));
    RingUtteranceStore store(ring, RingUtteranceStore::Config{ep.preRollSamples, ep.maxUtteranceSamples});

    BoundedChannel<VadActivity> channel(kEventChannelCapacity);
    EnergyClassifier classifier(EnergyClassifier::Config{opts.vadThreshold});
    VadProducer producer(pc, classifier, store, channel);

    Dispatcher dispatcher(dispatcherConfig(ep), channel, transcriber, &ring, onText);

    device.start();
    std::cerr << "[Capture] [INFO] listening on '" << device.deviceName() << "' (Ctrl+C to stop)" << std::endl;

    std::atomic<bool> aborted{false};
    std::exception_ptr captureError;
    std::thread capture([&] {
        std::vector<int16_t> buff;
        try {
            while (running.load() && !aborted.load()) {
                if (!device.read(buff)) {
                    std::cerr << "[Capture] [WARN] input overflowed, some audio was lost" << std::endl;
                    continue;
                }
                producer.feed(buff.data(), config.framesPerBuffer);
            }
        } catch (const std::exception& e) {
            std::cerr << "[Capture] [ERROR] " << e.what() << std::endl;
            captureError = std::current_exception();
        }
        // closing the producer closes the channel, which ends the dispatcher
        producer.finish();
    });

    try {
        dispatcher.run();
    } catch (...) {
        aborted = true;
        channel.close();
        capture.join();
        throw;
    }
    capture.join();
    if (captureError) std::rethrow_exception(captureError);
    device.stop();

    SessionStats stats;
    stats.transcribed = dispatcher.transcribed();
    stats.skipped = dispatcher.skipped();
    stats.failed = dispatcher.failed();
    stats.droppedEvents = producer.droppedEvents();
    return stats;
}
