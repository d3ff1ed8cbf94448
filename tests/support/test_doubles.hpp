#ifndef TEST_DOUBLES_HPP
#define TEST_DOUBLES_HPP

#include "stt/transcriber.hpp"
#include "vad/speech_classifier.hpp"

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

// Any sample louder than the threshold makes the frame speech
class ThresholdClassifier : public SpeechClassifier {
public:
    explicit ThresholdClassifier(int threshold = 100) : threshold_(threshold) {}

    bool isSpeech(const int16_t* frame, size_t n) override {
        for (size_t i = 0; i < n; ++i) {
            if (std::abs((int)frame[i]) > threshold_) return true;
        }
        return false;
    }

private:
    int threshold_;
};

// Keeps every buffer it is asked to transcribe
class RecordingTranscriber : public Transcriber {
public:
    std::vector<std::vector<int16_t>> calls;
    std::vector<std::string> reply{"hello world"};
    size_t failFirst = 0;

    std::vector<std::string> transcribe(const int16_t* pcm, size_t n) override {
        calls.emplace_back(pcm, pcm + n);
        if (calls.size() <= failFirst) throw std::runtime_error("engine failed");
        return reply;
    }
};

// silence, 440Hz tone, silence; interleaved, every channel identical
inline std::vector<int16_t> silenceToneSilence(int rate, int channels, double lead, double tone, double tail) {
    const size_t leadN = (size_t)std::llround(lead * rate);
    const size_t toneN = (size_t)std::llround(tone * rate);
    const size_t tailN = (size_t)std::llround(tail * rate);

    std::vector<int16_t> out;
    out.reserve((leadN + toneN + tailN) * (size_t)channels);
    for (size_t i = 0; i < leadN * (size_t)channels; ++i) out.push_back(0);
    for (size_t i = 0; i < toneN; ++i) {
        const double v = 8000.0 * std::sin(6.283185307179586 * 440.0 * (double)i / rate + 1.0);
        for (int c = 0; c < channels; ++c) out.push_back((int16_t)std::lround(v));
    }
    for (size_t i = 0; i < tailN * (size_t)channels; ++i) out.push_back(0);
    return out;
}

#endif
