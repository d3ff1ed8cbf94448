#include "stt/transcript_text.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

std::string trimSegment(const std::string& text) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    const auto first = std::find_if(text.begin(), text.end(), notSpace);
    const auto last = std::find_if(text.rbegin(), text.rend(), notSpace).base();
    if (first >= last) return {};
    return std::string(first, last);
}

bool isKnownHallucination(const std::string& text) {
    std::string lower = trimSegment(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return lower == "you";
}

std::vector<std::string> parseCliOutput(const std::string& stdoutText) {
    std::vector<std::string> out;
    std::istringstream in(stdoutText);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        std::string text = trimSegment(line);
        if (!text.empty() && !isKnownHallucination(text)) out.push_back(std::move(text));
    }
    return out;
}
