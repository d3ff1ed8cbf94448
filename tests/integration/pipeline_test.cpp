#include <algorithm>
#include <cassert>
#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

#include "audio/ring_utterance_store.hpp"
#include "audio/sample_ring.hpp"
#include "audio/stream_config.hpp"
#include "audio/utterance_buffer.hpp"
#include "pipeline/dispatcher.hpp"
#include "pipeline/vad_producer.hpp"
#include "support/test_doubles.hpp"

// 2s silence, 1s tone, 0.5s silence at 16kHz: the tone covers frames 66..99
static const size_t kToneFirstFrame = 66;
static const size_t kToneFrames = 34;
static const size_t kExpectedSamples = kPreRollSamples + (kToneFrames + 3) * kFrameSamples;

static void feedInChunks(VadProducer& producer, const std::vector<int16_t>& pcm, int channels, int rate) {
    const size_t chunk = fixedBufferFrames(rate);
    const size_t total = pcm.size() / (size_t)channels;
    for (size_t f = 0; f < total; f += chunk) {
        const size_t n = std::min(chunk, total - f);
        producer.feed(pcm.data() + f * (size_t)channels, n);
    }
    producer.finish();
}

static void checkUtterance(const std::vector<int16_t>& utterance, const std::vector<int16_t>& mono) {
    assert(utterance.size() == kExpectedSamples);
    for (size_t i = 0; i < kPreRollSamples; ++i) assert(utterance[i] == 0);
    const size_t from = kToneFirstFrame * kFrameSamples;
    for (size_t i = kPreRollSamples; i < utterance.size(); ++i) {
        assert(utterance[i] == mono[from + i - kPreRollSamples]);
    }
}

static void one_tone_one_utterance() {
    const std::vector<int16_t> pcm = silenceToneSilence(16000, 1, 2.0, 1.0, 0.5);

    BoundedChannel<VadActivity> channel(64);
    ThresholdClassifier classifier;
    UtteranceBuffer store(UtteranceBuffer::Config{});
    VadProducer producer(VadProducer::Config{}, classifier, store, channel);

    feedInChunks(producer, pcm, 1, 16000);
    assert(channel.isClosed());

    std::vector<VadActivity> events;
    VadActivity a;
    while (channel.receive(a)) events.push_back(a);

    assert(events.size() == 2);
    assert(events[0].isStart());
    assert(events[1].isEnd());
    assert(!events[1].forced);
    assert(events[1].sampleCount == kExpectedSamples);
    // about a second of speech plus the pre-roll
    assert(std::abs((long)events[1].sampleCount - (long)(kPreRollSamples + 16000)) <= (long)(4 * kFrameSamples));
    checkUtterance(events[1].samples, pcm);
    assert(producer.droppedEvents() == 0);
}

static void copy_mode_end_to_end() {
    const std::vector<int16_t> pcm = silenceToneSilence(16000, 1, 2.0, 1.0, 0.5);

    BoundedChannel<VadActivity> channel(64);
    ThresholdClassifier classifier;
    UtteranceBuffer store(UtteranceBuffer::Config{});
    VadProducer producer(VadProducer::Config{}, classifier, store, channel);

    RecordingTranscriber stt;
    std::vector<std::string> texts;
    Dispatcher dispatcher(Dispatcher::Config{}, channel, stt, nullptr,
                          [&](const std::string& t) { texts.push_back(t); });

    std::thread feeder([&] { feedInChunks(producer, pcm, 1, 16000); });
    dispatcher.run();
    feeder.join();

    assert(stt.calls.size() == 1);
    checkUtterance(stt.calls[0], pcm);
    assert(texts.size() == 1 && texts[0] == "hello world");
}

static void ring_mode_end_to_end() {
    const std::vector<int16_t> pcm = silenceToneSilence(16000, 1, 2.0, 1.0, 0.5);
    std::vector<float> pcmFloat(pcm.size());
    for (size_t i = 0; i < pcm.size(); ++i) pcmFloat[i] = (float)pcm[i] / 32768.0f;

    SampleRing ring(2 * (kPreRollSamples + kMaxUtteranceSamples));
    BoundedChannel<VadActivity> channel(64);
    ThresholdClassifier classifier;
    RingUtteranceStore store(ring, RingUtteranceStore::Config{});
    VadProducer producer(VadProducer::Config{}, classifier, store, channel);

    RecordingTranscriber stt;
    Dispatcher dispatcher(Dispatcher::Config{}, channel, stt, &ring, nullptr);

    std::thread feeder([&] {
        const size_t chunk = fixedBufferFrames(16000);
        for (size_t f = 0; f < pcmFloat.size(); f += chunk) {
            producer.feed(pcmFloat.data() + f, std::min(chunk, pcmFloat.size() - f));
        }
        producer.finish();
    });
    dispatcher.run();
    feeder.join();

    assert(stt.calls.size() == 1);
    checkUtterance(stt.calls[0], pcm);
    assert(ring.size() == 0);
    assert(store.droppedSamples() == 0);
}

static void stereo_48k_is_normalized_first() {
    const std::vector<int16_t> pcm = silenceToneSilence(48000, 2, 2.0, 1.0, 0.5);

    BoundedChannel<VadActivity> channel(64);
    ThresholdClassifier classifier;
    UtteranceBuffer store(UtteranceBuffer::Config{});
    VadProducer::Config config;
    config.channels = 2;
    config.sourceSampleRate = 48000;
    VadProducer producer(config, classifier, store, channel);

    RecordingTranscriber stt;
    Dispatcher dispatcher(Dispatcher::Config{}, channel, stt, nullptr, nullptr);

    std::thread feeder([&] { feedInChunks(producer, pcm, 2, 48000); });
    dispatcher.run();
    feeder.join();

    assert(stt.calls.size() == 1);
    const size_t n = stt.calls[0].size();
    assert(std::abs((long)n - (long)kExpectedSamples) <= (long)kFrameSamples);
    for (size_t i = 0; i < kPreRollSamples; ++i) assert(stt.calls[0][i] == 0);
}

static void trailing_speech_is_flushed() {
    // the stream stops in the middle of the tone
    const std::vector<int16_t> pcm = silenceToneSilence(16000, 1, 1.0, 1.5, 0.0);

    BoundedChannel<VadActivity> channel(64);
    ThresholdClassifier classifier;
    UtteranceBuffer store(UtteranceBuffer::Config{});
    VadProducer producer(VadProducer::Config{}, classifier, store, channel);
    feedInChunks(producer, pcm, 1, 16000);

    std::vector<VadActivity> events;
    VadActivity a;
    while (channel.receive(a)) events.push_back(a);
    assert(events.size() == 2);
    assert(events[1].isEnd());
    assert(events[1].sampleCount == events[1].samples.size());
    assert(events[1].sampleCount > kPreRollSamples + 24000 - kFrameSamples);
}

// 20 silent frames, 34 frames at value, 20 silent frames
static std::vector<int16_t> blockUtterance(int16_t value) {
    std::vector<int16_t> pcm(20 * kFrameSamples, 0);
    pcm.insert(pcm.end(), kToneFrames * kFrameSamples, value);
    pcm.insert(pcm.end(), 20 * kFrameSamples, 0);
    return pcm;
}

static std::vector<int16_t> expectedBlock(int16_t value) {
    std::vector<int16_t> out(kPreRollSamples, 0);
    out.insert(out.end(), kToneFrames * kFrameSamples, value);
    out.insert(out.end(), 3 * kFrameSamples, 0);
    return out;
}

static void feedRaw(VadProducer& producer, const std::vector<int16_t>& pcm) {
    const size_t chunk = fixedBufferFrames(16000);
    for (size_t f = 0; f < pcm.size(); f += chunk) producer.feed(pcm.data() + f, std::min(chunk, pcm.size() - f));
}

static void full_channel_drops_events_without_desync() {
    SampleRing ring(2 * (kPreRollSamples + kMaxUtteranceSamples));
    BoundedChannel<VadActivity> channel(2);
    ThresholdClassifier classifier;
    RingUtteranceStore store(ring, RingUtteranceStore::Config{});
    VadProducer producer(VadProducer::Config{}, classifier, store, channel);

    RecordingTranscriber stt;
    Dispatcher dispatcher(Dispatcher::Config{}, channel, stt, &ring, nullptr);

    // the second utterance finds the channel full, both of its events are dropped
    feedRaw(producer, blockUtterance(1000));
    feedRaw(producer, blockUtterance(2000));
    assert(producer.droppedEvents() == 2);
    assert(channel.size() == 2);

    VadActivity a;
    for (int i = 0; i < 2; ++i) {
        assert(channel.receive(a));
        dispatcher.handle(a);
    }
    assert(stt.calls.size() == 1);
    // the dropped utterance is still in the ring
    assert(ring.size() == kExpectedSamples);

    feedRaw(producer, blockUtterance(3000));
    producer.finish();
    dispatcher.run();

    assert(stt.calls.size() == 2);
    assert(stt.calls[0] == expectedBlock(1000));
    assert(stt.calls[1] == expectedBlock(3000));
    assert(producer.droppedEvents() == 2);
    assert(store.droppedSamples() == 0);
    assert(ring.size() == 0);
}

int main() {
    one_tone_one_utterance();
    copy_mode_end_to_end();
    ring_mode_end_to_end();
    stereo_48k_is_normalized_first();
    trailing_speech_is_flushed();
    full_channel_drops_events_without_desync();
    return 0;
}
