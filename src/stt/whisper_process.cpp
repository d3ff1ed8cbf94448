#include "stt/whisper_process.hpp"

#include "app/errors.hpp"
#include "audio/wav_file.hpp"
#include "stt/transcript_text.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <utility>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

void closefd(int& fd) {
    if (fd >= 0) ::close(fd);
    fd = -1;
}

// Returns false when the reader went away
bool writeAll(int fd, const uint8_t* data, size_t n) {
    while (n > 0) {
        const ssize_t w = ::write(fd, data, n);
        if (w < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += w;
        n -= (size_t)w;
    }
    return true;
}

std::string readAll(int fd) {
    std::string out;
    char buff[4096];
    while (true) {
        const ssize_t r = ::read(fd, buff, sizeof(buff));
        if (r < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error(std::string("reading whisper.cpp output failed: ") + std::strerror(errno));
        }
        if (r == 0) break;
        out.append(buff, (size_t)r);
    }
    return out;
}

} // namespace

// Constructor
WhisperProcess::WhisperProcess(std::string binaryPath, std::string modelPath, int sampleRate)
    : binary_(std::move(binaryPath)), model_(std::move(modelPath)), sampleRate_(sampleRate) {
    if (::access(binary_.c_str(), X_OK) != 0) throw ConfigError("whisper.cpp binary not executable: " + binary_);
    if (!std::ifstream(model_).good()) throw ConfigError("whisper model not found: " + model_);

    // a child that dies early must show up as EPIPE, not kill the whole process
    std::signal(SIGPIPE, SIG_IGN);
}

std::vector<std::string> WhisperProcess::transcribe(const int16_t* pcm, size_t n) {
    const std::vector<uint8_t> wav = encodeWav(pcm, n, sampleRate_);

    int toChild[2] = {-1, -1};
    int fromChild[2] = {-1, -1};
    if (::pipe(toChild) != 0) throw std::runtime_error(std::string("pipe: ") + std::strerror(errno));
    if (::pipe(fromChild) != 0) {
        const int err = errno;
        closefd(toChild[0]);
        closefd(toChild[1]);
        throw std::runtime_error(std::string("pipe: ") + std::strerror(err));
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        closefd(toChild[0]);
        closefd(toChild[1]);
        closefd(fromChild[0]);
        closefd(fromChild[1]);
        throw std::runtime_error(std::string("fork: ") + std::strerror(err));
    }

    if (pid == 0) {
        ::dup2(toChild[0], STDIN_FILENO);
        ::dup2(fromChild[1], STDOUT_FILENO);
        ::close(toChild[0]);
        ::close(toChild[1]);
        ::close(fromChild[0]);
        ::close(fromChild[1]);
        ::execl(binary_.c_str(), binary_.c_str(),
                "--no-prints", "--no-timestamps", "-f", "-", "-m", model_.c_str(),
                static_cast<char*>(nullptr));
        ::_exit(127);
    }

    closefd(toChild[0]);
    closefd(fromChild[1]);

    // whisper.cpp reads all of stdin before printing anything
    const bool piped = writeAll(toChild[1], wav.data(), wav.size());
    closefd(toChild[1]);

    std::string output;
    std::string readError;
    try {
        output = readAll(fromChild[0]);
    } catch (const std::runtime_error& e) {
        readError = e.what();
    }
    closefd(fromChild[0]);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) throw std::runtime_error(std::string("waitpid: ") + std::strerror(errno));
    }

    if (!WIFEXITED(status)) throw std::runtime_error("whisper.cpp was killed by a signal");
    if (WEXITSTATUS(status) != 0) {
        throw std::runtime_error("whisper.cpp exited with status " + std::to_string(WEXITSTATUS(status)));
    }
    if (!piped) throw std::runtime_error("whisper.cpp closed its input before reading the audio");
    if (!readError.empty()) throw std::runtime_error(readError);

    return parseCliOutput(output);
}
