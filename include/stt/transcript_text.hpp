#ifndef TRANSCRIPT_TEXT_HPP
#define TRANSCRIPT_TEXT_HPP

#include <string>
#include <vector>

// Strips the surrounding whitespace whisper puts around segment text.
std::string trimSegment(const std::string& text);

// Whisper likes to produce "you" from silence and noise.
bool isKnownHallucination(const std::string& text);

// Splits whisper.cpp CLI stdout (run with --no-prints --no-timestamps) into
// segments: the leading newline and each line's leading space are dropped.
std::vector<std::string> parseCliOutput(const std::string& stdoutText);

#endif
