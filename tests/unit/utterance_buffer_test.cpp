#include <cassert>
#include <vector>

#include "audio/ring_utterance_store.hpp"
#include "audio/sample_ring.hpp"
#include "audio/utterance_buffer.hpp"

static void open_seeds_pre_roll() {
    UtteranceBuffer buf(UtteranceBuffer::Config{4, 10});
    assert(buf.capacity() == 14);
    assert(buf.open() == 4);
    assert(buf.active().size() == 4);
    for (int16_t v : buf.active()) assert(v == 0);
    assert(buf.remaining() == 10);
}

static void append_stops_at_capacity() {
    UtteranceBuffer buf(UtteranceBuffer::Config{2, 5});
    buf.open();
    std::vector<int16_t> in{1, 2, 3, 4};
    assert(buf.append(in.data(), in.size()) == 4);
    assert(buf.remaining() == 1);
    assert(buf.append(in.data(), in.size()) == 1);
    assert(buf.remaining() == 0);
    assert(buf.append(in.data(), in.size()) == 0);
    assert((buf.active() == std::vector<int16_t>{0, 0, 1, 2, 3, 4, 1}));
}

static void seal_keeps_utterance_while_next_fills() {
    UtteranceBuffer buf(UtteranceBuffer::Config{1, 8});
    std::vector<int16_t> first{5, 6, 7};
    std::vector<int16_t> second{8, 9};

    buf.open();
    buf.append(first.data(), first.size());
    buf.seal(4);
    assert(buf.active().empty());
    assert((buf.sealed() == std::vector<int16_t>{0, 5, 6, 7}));

    buf.open();
    buf.append(second.data(), second.size());
    assert((buf.sealed() == std::vector<int16_t>{0, 5, 6, 7}));

    std::vector<int16_t> out{42};
    buf.exportSealed(out);
    assert((out == std::vector<int16_t>{0, 5, 6, 7}));

    buf.seal(3);
    buf.exportSealed(out);
    assert((out == std::vector<int16_t>{0, 8, 9}));
}

static void ring_store_writes_through() {
    SampleRing ring(64);
    RingUtteranceStore store(ring, RingUtteranceStore::Config{3, 5});
    std::vector<int16_t> in{1, 2, 3, 4, 5, 6, 7};

    assert(store.open() == 3);
    assert(store.remaining() == 5);
    assert(store.append(in.data(), in.size()) == 5);
    assert(store.remaining() == 0);
    store.seal(8);

    std::vector<int16_t> out;
    store.exportSealed(out);
    assert(out.empty());

    std::vector<int16_t> popped(8);
    assert(ring.popExact(popped.data(), popped.size()));
    assert((popped == std::vector<int16_t>{0, 0, 0, 1, 2, 3, 4, 5}));

    assert(store.open() == 3);
    assert(store.remaining() == 5);
    assert(store.droppedSamples() == 0);
}

static void ring_store_counts_only_written_samples() {
    SampleRing ring(6);
    RingUtteranceStore store(ring, RingUtteranceStore::Config{2, 10});
    std::vector<int16_t> in{1, 2, 3, 4, 5, 6};

    assert(store.open() == 2);
    assert(store.append(in.data(), in.size()) == 4);
    assert(store.droppedSamples() == 2);
    assert(store.remaining() == 6);
    assert(ring.size() == 6);
}

int main() {
    open_seeds_pre_roll();
    append_stops_at_capacity();
    seal_keeps_utterance_while_next_fills();
    ring_store_writes_through();
    ring_store_counts_only_written_samples();
    return 0;
}
