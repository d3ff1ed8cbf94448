#include <cassert>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

#include "app/errors.hpp"
#include "stt/transcript_text.hpp"
#include "stt/whisper_process.hpp"

namespace fs = std::filesystem;

static fs::path workDir() {
    const fs::path dir = fs::current_path() / "whisper_process_test_tmp";
    fs::create_directories(dir);
    return dir;
}

static std::string writeScript(const std::string& name, const std::string& body) {
    const fs::path p = workDir() / name;
    {
        std::ofstream f(p);
        f << "#!/bin/sh\n" << body;
    }
    fs::permissions(p, fs::perms::owner_all, fs::perm_options::replace);
    return p.string();
}

static std::string writeModel() {
    const fs::path p = workDir() / "ggml-test.bin";
    std::ofstream(p) << "not really a model";
    return p.string();
}

static std::string slurp(const fs::path& p) {
    std::ifstream f(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

static void cli_output_parsing() {
    assert(trimSegment("  hello \n") == "hello");
    assert(trimSegment(" \t ").empty());
    assert(isKnownHallucination(" you"));
    assert(isKnownHallucination("You"));
    assert(!isKnownHallucination("you know"));

    auto segments = parseCliOutput("\n hello world\n you\n\n second line\r\n");
    assert(segments.size() == 2);
    assert(segments[0] == "hello world");
    assert(segments[1] == "second line");
    assert(parseCliOutput("").empty());
}

static void pipes_wav_and_reads_text() {
    const fs::path dir = workDir();
    const std::string model = writeModel();
    const std::string script = writeScript("fake-whisper",
        "echo \"$@\" > '" + (dir / "args.txt").string() + "'\n"
        "cat > '" + (dir / "input.wav").string() + "'\n"
        "printf '\\n hello there\\n you\\n'\n");

    WhisperProcess whisper(script, model, 16000);
    std::vector<int16_t> pcm(16000, 100);
    auto segments = whisper.transcribe(pcm.data(), pcm.size());

    assert(segments.size() == 1);
    assert(segments[0] == "hello there");

    const std::string wav = slurp(dir / "input.wav");
    assert(wav.size() == 44 + 2 * pcm.size());
    assert(wav.compare(0, 4, "RIFF") == 0);

    assert(slurp(dir / "args.txt") == "--no-prints --no-timestamps -f - -m " + model + "\n");
}

static void failing_binary_throws() {
    const std::string model = writeModel();
    const std::string script = writeScript("failing-whisper", "exit 3\n");

    WhisperProcess whisper(script, model, 16000);
    std::vector<int16_t> pcm(48000, 100);
    bool threw = false;
    try {
        whisper.transcribe(pcm.data(), pcm.size());
    } catch (const std::runtime_error& e) {
        threw = true;
        assert(std::string(e.what()).find("status 3") != std::string::npos);
    }
    assert(threw);

    // the next call still works
    const std::string good = writeScript("good-whisper", "cat >/dev/null\necho ' again'\n");
    WhisperProcess recovered(good, model, 16000);
    auto segments = recovered.transcribe(pcm.data(), pcm.size());
    assert(segments.size() == 1 && segments[0] == "again");
}

static void missing_binary_or_model_is_config_error() {
    const std::string model = writeModel();
    bool threw = false;
    try {
        WhisperProcess w((workDir() / "no-such-binary").string(), model);
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);

    const std::string script = writeScript("unused-whisper", "exit 0\n");
    threw = false;
    try {
        WhisperProcess w(script, (workDir() / "no-such-model.bin").string());
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);
}

int main() {
    cli_output_parsing();
    pipes_wav_and_reads_text();
    failing_binary_throws();
    missing_binary_or_model_is_config_error();
    fs::remove_all(workDir());
    return 0;
}
