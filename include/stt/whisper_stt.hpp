#ifndef WHISPER_STT_HPP
#define WHISPER_STT_HPP

#include "stt/transcriber.hpp"

#include <string>
#include <vector>

struct whisper_context;

// In-process whisper.cpp
class WhisperSTT : public Transcriber {
public:
    struct Config {
        std::string language = "en"; // "auto" for detection
        bool translate = false;
        int threads = 4;
        bool verbose = false;
    };

    WhisperSTT(const std::string& modelPath, Config config);
    ~WhisperSTT();

    WhisperSTT(const WhisperSTT&) = delete;
    WhisperSTT& operator=(const WhisperSTT&) = delete;

    std::vector<std::string> transcribe(const int16_t* pcm, size_t n) override;

private:
    whisper_context* context_ = nullptr;
    Config config_;
    std::vector<float> pcmf_;
};

#endif
