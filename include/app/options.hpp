#ifndef OPTIONS_HPP
#define OPTIONS_HPP

#include <string>

struct Options {
    std::string model;      // -m, --model
    std::string whisperCpp; // -w, --whisper-cpp
    std::string file;       // -f, --file
    std::string device;     // -d, --device
    bool list = false;      // -l, --list
    bool help = false;      // -h, --help

    std::string language = "en"; // --language
    bool translate = false;      // --translate
    int threads = 4;             // -t, --threads

    float vadThreshold = 0.014f; // --vad-threshold
    bool paced = true;           // --no-pacing
    bool verbose = false;        // -v, --verbose
};

// Throws ConfigError on unknown options, missing or malformed values, or a
// missing --model when one is needed.
Options parseOptions(int argc, const char* const* argv);

std::string usage(const std::string& program);

#endif
