#ifndef AUDIO_FORMAT_HPP
#define AUDIO_FORMAT_HPP

#include <cstddef>

// Whisper and the frame classifier both expect 16 kHz mono.
static constexpr int kTargetSampleRate = 16000;

// ~30ms of audio at the target rate
static constexpr size_t kFrameSamples = 480;

// 700ms of silence in front of every utterance so the first word survives the
// classifier's reaction latency
static constexpr size_t kPreRollSamples = 1600 * 7;

// Dispatch after at most 30s, pre-roll included
static constexpr size_t kMaxUtteranceSamples = kTargetSampleRate * 30 - kPreRollSamples;

// Whisper rejects anything under a second anyway
static constexpr size_t kMinUtteranceSamples = kTargetSampleRate;

#endif
