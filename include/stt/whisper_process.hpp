#ifndef WHISPER_PROCESS_HPP
#define WHISPER_PROCESS_HPP

#include "audio/audio_format.hpp"
#include "stt/transcriber.hpp"

#include <string>
#include <vector>

// Out-of-process whisper.cpp: every utterance is encoded as a WAV stream and
// piped to `<binary> --no-prints --no-timestamps -f - -m <model>`; the text
// comes back on the child's stdout.
class WhisperProcess : public Transcriber {
public:
    WhisperProcess(std::string binaryPath, std::string modelPath, int sampleRate = kTargetSampleRate);

    std::vector<std::string> transcribe(const int16_t* pcm, size_t n) override;

private:
    std::string binary_;
    std::string model_;
    int sampleRate_;
};

#endif
