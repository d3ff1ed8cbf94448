#include "stt/whisper_stt.hpp"

#include "app/errors.hpp"
#include "stt/transcript_text.hpp"

#include <whisper.h>

#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>

static bool g_whisperVerbose = false;

// whisper.cpp and ggml talk a lot on stderr, keep errors and warnings only
static void whisper_log(enum ggml_log_level level, const char* text, void*) {
    if (g_whisperVerbose || level == GGML_LOG_LEVEL_ERROR || level == GGML_LOG_LEVEL_WARN) {
        std::fputs(text, stderr);
    }
}

// Constructor
WhisperSTT::WhisperSTT(const std::string& modelPath, Config config) : config_(config) {
    if (!std::ifstream(modelPath).good()) throw ConfigError("whisper model not found: " + modelPath);

    g_whisperVerbose = config_.verbose;
    whisper_log_set(whisper_log, nullptr);

    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = false;
    cparams.flash_attn = false;

    context_ = whisper_init_from_file_with_params(modelPath.c_str(), cparams);
    if (!context_) throw ConfigError("whisper_init_from_file_with_params failed: " + modelPath);
}

// Destructor
WhisperSTT::~WhisperSTT() {
    if (context_) whisper_free(context_);
}

// Converts 16kHz mono PCM into text segments
std::vector<std::string> WhisperSTT::transcribe(const int16_t* pcm, size_t n) {
    std::vector<std::string> out;
    if (n == 0) return out;

    pcmf_.resize(n);
    for (size_t i = 0; i < n; ++i) pcmf_[i] = (float)pcm[i] / 32768.0f;

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);

    params.n_threads = config_.threads;
    params.language = config_.language.c_str();
    params.translate = config_.translate;

    params.print_progress = false;
    params.print_realtime = false;
    params.print_timestamps = false;
    params.print_special = false;

    params.no_timestamps = true;
    params.single_segment = true;
    params.suppress_blank = true;

    params.no_speech_thold = 0.6f;

    const int rc = whisper_full(context_, params, pcmf_.data(), (int)pcmf_.size());
    if (rc != 0) throw std::runtime_error("whisper_full failed (" + std::to_string(rc) + ")");

    const int n_segments = whisper_full_n_segments(context_);
    if (n_segments > 1) {
        std::cerr << "[Whisper STT] [WARN] more than one text segment received from whisper" << std::endl;
    }
    for (int i = 0; i < n_segments; ++i) {
        std::string text = trimSegment(whisper_full_get_segment_text(context_, i));
        if (!text.empty() && !isKnownHallucination(text)) out.push_back(std::move(text));
    }
    return out;
}
