#include "app/options.hpp"

#include "app/errors.hpp"

#include <stdexcept>

namespace {

std::string value(int argc, const char* const* argv, int& i, const std::string& flag) {
    if (i + 1 >= argc) throw ConfigError("missing value for " + flag);
    return argv[++i];
}

int asInt(const std::string& s, const std::string& flag) {
    size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(s, &used);
    } catch (const std::logic_error&) {
        throw ConfigError("invalid number for " + flag + ": " + s);
    }
    if (used != s.size()) throw ConfigError("invalid number for " + flag + ": " + s);
    return v;
}

float asFloat(const std::string& s, const std::string& flag) {
    size_t used = 0;
    float v = 0;
    try {
        v = std::stof(s, &used);
    } catch (const std::logic_error&) {
        throw ConfigError("invalid number for " + flag + ": " + s);
    }
    if (used != s.size()) throw ConfigError("invalid number for " + flag + ": " + s);
    return v;
}

} // namespace

Options parseOptions(int argc, const char* const* argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "-m" || a == "--model") opts.model = value(argc, argv, i, a);
        else if (a == "-w" || a == "--whisper-cpp") opts.whisperCpp = value(argc, argv, i, a);
        else if (a == "-f" || a == "--file") opts.file = value(argc, argv, i, a);
        else if (a == "-d" || a == "--device") opts.device = value(argc, argv, i, a);
        else if (a == "-l" || a == "--list") opts.list = true;
        else if (a == "-h" || a == "--help") opts.help = true;
        else if (a == "--language") opts.language = value(argc, argv, i, a);
        else if (a == "--translate") opts.translate = true;
        else if (a == "-t" || a == "--threads") opts.threads = asInt(value(argc, argv, i, a), a);
        else if (a == "--vad-threshold") opts.vadThreshold = asFloat(value(argc, argv, i, a), a);
        else if (a == "--no-pacing") opts.paced = false;
        else if (a == "-v" || a == "--verbose") opts.verbose = true;
        else throw ConfigError("unknown option: " + a);
    }

    if (opts.help || opts.list) return opts;

    if (opts.model.empty()) throw ConfigError("--model is required");
    if (opts.threads < 1) throw ConfigError("--threads must be at least 1");
    if (opts.vadThreshold <= 0.0f) throw ConfigError("--vad-threshold must be positive");
    return opts;
}

std::string usage(const std::string& program) {
    return "usage: " + program + " -m FILE [options]\n"
           "\n"
           "Transcribes the default input device (or a WAV file) utterance by utterance.\n"
           "\n"
           "  -m, --model FILE        whisper.cpp model to use\n"
           "  -w, --whisper-cpp FILE  run this whisper.cpp binary instead of the built-in engine\n"
           "  -f, --file FILE         transcribe a WAV file instead of the microphone\n"
           "  -l, --list              list available audio devices\n"
           "  -d, --device NAME       audio device to listen to\n"
           "      --language LANG     spoken language, \"auto\" to detect (default en)\n"
           "      --translate         translate to English\n"
           "  -t, --threads N         whisper threads (default 4)\n"
           "      --vad-threshold RMS speech energy threshold (default 0.014)\n"
           "      --no-pacing         replay files as fast as possible\n"
           "  -v, --verbose           show whisper.cpp logs\n"
           "  -h, --help              show this help\n";
}
