#pragma once

#include "audio_buffer.hpp"
#include "errors.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <vector>

struct Chunk {
    size_t index = 0;
    double start_s = 0.0;
    double end_s = 0.0;
    uint32_t sample_rate = 16000;
    // View into the source AudioBuffer; valid while the buffer lives.
    std::span<const float> samples;

    double duration() const { return end_s - start_s; }
};

struct SegmentOptions {
    double chunk_seconds = 30.0;
    double overlap_seconds = 3.0;
    double min_final_seconds = 2.0;
};

// Splits audio into overlapping windows covering [0, duration) with no gaps.
// Chunk i spans [i*(chunk-overlap), min(i*(chunk-overlap)+chunk, duration)).
// A final window shorter than min_final_seconds is folded into its predecessor.
// Fails only when overlap >= chunk/2 (or the window sizes are not positive).
std::expected<std::vector<Chunk>, Error>
segment_audio(const AudioBuffer& audio, const SegmentOptions& opts);
