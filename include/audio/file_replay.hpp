#ifndef FILE_REPLAY_HPP
#define FILE_REPLAY_HPP

#include "audio/stream_config.hpp"
#include "audio/wav_file.hpp"

#include <cstdint>
#include <functional>

// Plays a decoded WAV file back in device-sized chunks, sleeping between
// chunks so the pipeline sees the same cadence as a live microphone.
class FileReplay {
public:
    struct Config {
        bool paced = true;
    };

    // Returning false stops the replay
    using ChunkCallback = std::function<bool(const int16_t* interleaved, size_t frames)>;

    FileReplay(WavData wav, Config config);

    const StreamConfig& config() const { return config_; }
    const WavData& wav() const { return wav_; }

    // Returns after the last chunk or as soon as onChunk returns false.
    void run(const ChunkCallback& onChunk) const;

private:
    WavData wav_;
    Config replay_;
    StreamConfig config_;
};

#endif
