#ifndef SESSION_HPP
#define SESSION_HPP

#include "app/options.hpp"
#include "pipeline/dispatcher.hpp"
#include "stt/transcriber.hpp"
#include "vad/endpointer.hpp"

#include <atomic>

// Events in flight between the audio thread and the dispatcher
static constexpr size_t kEventChannelCapacity = 64;

// Dispatcher limits matching what the endpointer can produce
Dispatcher::Config dispatcherConfig(const Endpointer::Config& endpointer);

struct SessionStats {
    size_t transcribed = 0;
    size_t skipped = 0;
    size_t failed = 0;
    size_t droppedEvents = 0;
};

// Replays opts.file through the pipeline; utterances travel by value.
// Returns once the file is done and every utterance was dispatched, or once
// running turns false. Throws ConfigError and DesyncError.
SessionStats runFileSession(const Options& opts, Transcriber& transcriber, const std::atomic<bool>& running,
                            const Dispatcher::TextCallback& onText);

// Captures from opts.device until running turns false; utterance samples go
// through the shared ring. Throws ConfigError and DesyncError.
SessionStats runLiveSession(const Options& opts, Transcriber& transcriber, const std::atomic<bool>& running,
                            const Dispatcher::TextCallback& onText);

#endif
