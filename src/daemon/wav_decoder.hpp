#pragma once

#include "audio/audio_buffer.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <expected>
#include <span>
#include <string>
#include <vector>

// Decodes an in-memory RIFF/WAVE file into mono float samples.
// Supports PCM int16 and IEEE float32, any channel count (averaged to mono).
namespace wav {

inline std::expected<AudioBuffer, Error> decode(std::span<const uint8_t> data) {
    auto fail = [](std::string msg) {
        return std::unexpected(Error{ErrorCode::UnsupportedFormat, std::move(msg)});
    };
    auto r16 = [&data](size_t pos) {
        uint16_t v;
        std::memcpy(&v, data.data() + pos, 2);
        return v;
    };
    auto r32 = [&data](size_t pos) {
        uint32_t v;
        std::memcpy(&v, data.data() + pos, 4);
        return v;
    };
    auto tag = [&data](size_t pos, const char* expect) {
        return std::memcmp(data.data() + pos, expect, 4) == 0;
    };

    if (data.size() < 12 || !tag(0, "RIFF") || !tag(8, "WAVE")) {
        return fail("not a RIFF/WAVE file");
    }

    uint16_t format = 0;
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits = 0;
    std::span<const uint8_t> pcm;
    bool have_fmt = false;

    size_t pos = 12;
    while (pos + 8 <= data.size()) {
        uint32_t size = r32(pos + 4);
        size_t body = pos + 8;
        size_t avail = std::min<size_t>(size, data.size() - body);

        if (tag(pos, "fmt ")) {
            if (avail < 16) return fail("truncated fmt chunk");
            format = r16(body);
            channels = r16(body + 2);
            sample_rate = r32(body + 4);
            bits = r16(body + 14);
            // WAVE_FORMAT_EXTENSIBLE carries the real format in the subformat GUID.
            if (format == 0xFFFE && avail >= 26) format = r16(body + 24);
            have_fmt = true;
        } else if (tag(pos, "data")) {
            pcm = data.subspan(body, avail);
            break;
        }

        pos = body + size + (size & 1);
    }

    if (!have_fmt) return fail("missing fmt chunk");
    if (pcm.empty()) return fail("missing or empty data chunk");
    if (channels == 0) return fail("invalid channel count");

    bool is_pcm16 = format == 1 && bits == 16;
    bool is_f32 = format == 3 && bits == 32;
    if (!is_pcm16 && !is_f32) {
        return fail("unsupported WAV encoding (format " + std::to_string(format) +
                    ", " + std::to_string(bits) + " bits)");
    }

    size_t bytes_per_sample = bits / 8;
    size_t frames = pcm.size() / (bytes_per_sample * channels);
    if (frames == 0) return fail("audio is empty");

    AudioBuffer out;
    out.sample_rate = sample_rate;
    out.samples.resize(frames);

    for (size_t f = 0; f < frames; ++f) {
        float acc = 0.0f;
        for (uint16_t c = 0; c < channels; ++c) {
            const uint8_t* p = pcm.data() + (f * channels + c) * bytes_per_sample;
            if (is_pcm16) {
                int16_t s;
                std::memcpy(&s, p, 2);
                acc += static_cast<float>(s) / 32768.0f;
            } else {
                float s;
                std::memcpy(&s, p, 4);
                acc += s;
            }
        }
        out.samples[f] = acc / channels;
    }

    float peak = 0.0f;
    for (float s : out.samples) peak = std::max(peak, std::fabs(s));
    if (peak > 1.0f) {
        for (float& s : out.samples) s /= peak;
    }

    return out;
}

} // namespace wav
