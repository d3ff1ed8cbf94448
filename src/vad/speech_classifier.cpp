#include "vad/speech_classifier.hpp"

#include <cmath>

float EnergyClassifier::rms(const int16_t* x, size_t n) {
    if (n == 0) return 0.0f;
    double acc = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double s = (double)x[i] / 32768.0;
        acc += s * s;
    }
    return (float)std::sqrt(acc / (double)n);
}

bool EnergyClassifier::isSpeech(const int16_t* frame, size_t n) {
    return rms(frame, n) >= config_.speechRms;
}
