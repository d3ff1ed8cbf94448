#include "audio/file_replay.hpp"

#include "app/errors.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

// Constructor
FileReplay::FileReplay(WavData wav, Config config) : wav_(std::move(wav)), replay_(config) {
    if (wav_.channels > 2) {
        throw ConfigError("wav file has " + std::to_string(wav_.channels) +
                          " channels. Only Mono and Stereo audio is supported");
    }
    config_.channels = wav_.channels;
    config_.sampleRate = wav_.sampleRate;
    config_.framesPerBuffer = fixedBufferFrames(wav_.sampleRate);
}

void FileReplay::run(const ChunkCallback& onChunk) const {
    const size_t total = wav_.frames();
    const size_t chunk = config_.framesPerBuffer;
    const size_t channels = (size_t)config_.channels;

    auto next = std::chrono::steady_clock::now();
    for (size_t frame = 0; frame < total; frame += chunk) {
        const size_t n = std::min(chunk, total - frame);
        if (!onChunk(wav_.samples.data() + frame * channels, n)) return;

        if (replay_.paced) {
            next += std::chrono::microseconds((long long)n * 1000000 / config_.sampleRate);
            std::this_thread::sleep_until(next);
        }
    }
}
