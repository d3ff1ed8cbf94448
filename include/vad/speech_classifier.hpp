#ifndef SPEECH_CLASSIFIER_HPP
#define SPEECH_CLASSIFIER_HPP

#include <cstddef>
#include <cstdint>

// Frame-level speech / non-speech decision on one classification frame
// (kFrameSamples mono samples at kTargetSampleRate).
class SpeechClassifier {
public:
    virtual ~SpeechClassifier() = default;
    virtual bool isSpeech(const int16_t* frame, size_t n) = 0;
};

// RMS energy gate
class EnergyClassifier : public SpeechClassifier {
public:
    struct Config {
        float speechRms = 0.014f;
    };

    explicit EnergyClassifier(Config config) : config_(config) {}

    bool isSpeech(const int16_t* frame, size_t n) override;

    static float rms(const int16_t* x, size_t n);

private:
    Config config_;
};

#endif
