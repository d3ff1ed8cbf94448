#ifndef TRANSCRIBER_HPP
#define TRANSCRIBER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Speech-to-text engine. Input is mono int16 at kTargetSampleRate.
// Throws std::runtime_error when the engine fails.
class Transcriber {
public:
    virtual ~Transcriber() = default;
    virtual std::vector<std::string> transcribe(const int16_t* pcm, size_t n) = 0;
};

#endif
