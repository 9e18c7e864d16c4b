#pragma once

#include "audio/audio_buffer.hpp"
#include "audio/segmenter.hpp"
#include "errors.hpp"

#include <cstddef>
#include <expected>
#include <string>

class TranscriptionEngine;

struct ChunkStats {
    size_t total = 0;
    size_t transcribed = 0;
    size_t skipped = 0;   // silent or constant noise, never sent to the engine
    size_t failed = 0;
    size_t duplicates_removed = 0;
};

struct TranscriptionResult {
    std::string text;
    double duration = 0.0;         // audio seconds
    double confidence = 0.0;
    double processing_time = 0.0;  // wall seconds
    ChunkStats chunks;

    double real_time_factor() const {
        return duration > 0.0 ? processing_time / duration : 0.0;
    }
};

struct PipelineOptions {
    bool chunking_enabled = true;
    SegmentOptions segments;
};

// Long-audio pipeline: segment, validate, transcribe sequentially, merge.
// Chunks of one request are processed one at a time so peak memory stays at
// roughly one chunk regardless of total length.
class TranscriptionPipeline {
public:
    TranscriptionPipeline(TranscriptionEngine& engine, PipelineOptions opts, bool verbose = false);

    std::expected<TranscriptionResult, Error> run(const AudioBuffer& audio,
                                                  const std::string& language);

private:
    void log(const std::string& msg);

    TranscriptionEngine& engine_;
    PipelineOptions opts_;
    bool verbose_;
};
