#include "audio/wav_file.hpp"

#include "app/errors.hpp"
#include "audio/format_normalizer.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>

namespace {

uint32_t readU32(const uint8_t* p) {
    return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) | ((uint32_t)p[3] << 24);
}

uint16_t readU16(const uint8_t* p) {
    return (uint16_t)(p[0] | (p[1] << 8));
}

void putU32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back((uint8_t)((v >> (8 * i)) & 0xff));
}

void putU16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back((uint8_t)(v & 0xff));
    out.push_back((uint8_t)((v >> 8) & 0xff));
}

void putTag(std::vector<uint8_t>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

} // namespace

WavData readWavFile(const std::string& path) {
    std::ifstream f(path, std::ios::binary | std::ios::ate);
    if (!f) throw ConfigError("cannot open wav file: " + path);
    const std::streamoff fileSize = f.tellg();
    f.seekg(0, std::ios::beg);

    uint8_t riff[12];
    if (!f.read(reinterpret_cast<char*>(riff), sizeof(riff)) ||
        std::memcmp(riff, "RIFF", 4) != 0 || std::memcmp(riff + 8, "WAVE", 4) != 0) {
        throw ConfigError("not a RIFF/WAVE file: " + path);
    }

    uint16_t audioFormat = 0;
    WavData wav;
    bool haveFmt = false;
    std::vector<uint8_t> data;
    bool haveData = false;

    uint8_t chunk[8];
    while (!haveData && f.read(reinterpret_cast<char*>(chunk), sizeof(chunk))) {
        const uint32_t size = readU32(chunk + 4);
        const std::streamoff left = fileSize - f.tellg();

        if (std::memcmp(chunk, "fmt ", 4) == 0) {
            if (size < 16 || (std::streamoff)size > left) throw ConfigError("truncated fmt chunk: " + path);
            std::vector<uint8_t> fmt(size);
            if (!f.read(reinterpret_cast<char*>(fmt.data()), size)) throw ConfigError("truncated fmt chunk: " + path);
            audioFormat = readU16(fmt.data());
            wav.channels = readU16(fmt.data() + 2);
            wav.sampleRate = (int)readU32(fmt.data() + 4);
            wav.bitsPerSample = readU16(fmt.data() + 14);
            // WAVE_FORMAT_EXTENSIBLE keeps the real format in the sub-format GUID
            if (audioFormat == 0xFFFE && size >= 26) audioFormat = readU16(fmt.data() + 24);
            if (size & 1) f.seekg(1, std::ios::cur);
            haveFmt = true;
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            // streamed files carry a placeholder size (0xFFFFFFFF), read what is there
            const size_t n = (size_t)std::min<std::streamoff>(size, left);
            data.resize(n);
            f.read(reinterpret_cast<char*>(data.data()), (std::streamsize)n);
            data.resize((size_t)f.gcount());
            haveData = true;
        } else {
            f.seekg(size + (size & 1), std::ios::cur);
        }
    }

    if (!haveFmt || !haveData) throw ConfigError("wav file without fmt or data chunk: " + path);
    if (wav.channels <= 0 || wav.sampleRate <= 0) throw ConfigError("invalid wav format: " + path);

    if (audioFormat == 1 && wav.bitsPerSample == 16) {
        wav.samples.resize(data.size() / 2);
        for (size_t i = 0; i < wav.samples.size(); ++i) {
            wav.samples[i] = (int16_t)readU16(data.data() + 2 * i);
        }
    } else if (audioFormat == 3 && wav.bitsPerSample == 32) {
        wav.samples.resize(data.size() / 4);
        for (size_t i = 0; i < wav.samples.size(); ++i) {
            const uint32_t bits = readU32(data.data() + 4 * i);
            float v;
            std::memcpy(&v, &bits, sizeof(v));
            wav.samples[i] = FormatNormalizer::quantize(v);
        }
    } else {
        throw ConfigError("unsupported wav encoding (format " + std::to_string(audioFormat) + ", " +
                          std::to_string(wav.bitsPerSample) + " bits): " + path);
    }

    // drop a trailing partial frame
    wav.samples.resize(wav.frames() * (size_t)wav.channels);
    return wav;
}

std::vector<uint8_t> encodeWav(const int16_t* samples, size_t n, int sampleRate) {
    const uint16_t channels = 1;
    const uint16_t bits = 16;
    const uint32_t dataBytes = (uint32_t)(n * sizeof(int16_t));

    std::vector<uint8_t> out;
    out.reserve(44 + dataBytes);

    putTag(out, "RIFF");
    putU32(out, 36 + dataBytes);
    putTag(out, "WAVE");

    putTag(out, "fmt ");
    putU32(out, 16);
    putU16(out, 1); // PCM
    putU16(out, channels);
    putU32(out, (uint32_t)sampleRate);
    putU32(out, (uint32_t)sampleRate * channels * bits / 8);
    putU16(out, channels * bits / 8);
    putU16(out, bits);

    putTag(out, "data");
    putU32(out, dataBytes);
    for (size_t i = 0; i < n; ++i) putU16(out, (uint16_t)samples[i]);

    return out;
}
