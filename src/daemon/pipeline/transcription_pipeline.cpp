#include "transcription_pipeline.hpp"

#include "audio/content_validator.hpp"
#include "segment_merger.hpp"
#include "whisper/transcription_engine.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <print>
#include <vector>

TranscriptionPipeline::TranscriptionPipeline(TranscriptionEngine& engine, PipelineOptions opts,
                                             bool verbose)
    : engine_(engine), opts_(opts), verbose_(verbose) {}

std::expected<TranscriptionResult, Error>
TranscriptionPipeline::run(const AudioBuffer& audio, const std::string& language) {
    auto start = std::chrono::steady_clock::now();

    if (audio.samples.empty()) {
        return std::unexpected(Error{ErrorCode::UnsupportedFormat, "audio is empty"});
    }

    // Disabling chunking is a window as long as the whole input.
    SegmentOptions seg = opts_.segments;
    if (!opts_.chunking_enabled) {
        seg.chunk_seconds = std::max(seg.chunk_seconds, audio.duration());
    }

    auto chunks = segment_audio(audio, seg);
    if (!chunks) return std::unexpected(chunks.error());

    TranscriptionResult result;
    result.duration = audio.duration();
    result.chunks.total = chunks->size();

    if (chunks->size() > 1) {
        log(std::format("chunked transcription: {:.2f}s audio, {} chunks of {}s, overlap {}s",
                        audio.duration(), chunks->size(), seg.chunk_seconds, seg.overlap_seconds));
    }

    std::vector<ChunkResult> partials;
    partials.reserve(chunks->size());

    for (const auto& chunk : *chunks) {
        ContentStats stats;
        auto content = classify_content(chunk.samples, &stats);
        if (content != ContentClass::Viable) {
            std::println(stderr, "pipeline: chunk {}/{} skipped as {} (max={:.4f}, std={:.6f})",
                         chunk.index + 1, chunks->size(), content_class_name(content),
                         stats.max_abs, stats.stddev);
            result.chunks.skipped++;
            partials.push_back({.index = chunk.index, .text = {}, .succeeded = true});
            continue;
        }

        auto text = engine_.transcribe(chunk, language);
        if (!text) {
            if (text.error().code == ErrorCode::ContextLost) {
                std::println(stderr, "pipeline: aborting at chunk {}/{}: {}",
                             chunk.index + 1, chunks->size(), text.error().message);
                return std::unexpected(text.error());
            }
            std::println(stderr, "pipeline: chunk {}/{} ({:.2f}s-{:.2f}s) failed: {}",
                         chunk.index + 1, chunks->size(), chunk.start_s, chunk.end_s,
                         text.error().message);
            result.chunks.failed++;
            partials.push_back({.index = chunk.index, .text = {}, .succeeded = false});
            continue;
        }

        if (text->empty()) {
            std::println(stderr, "pipeline: chunk {}/{} returned empty text",
                         chunk.index + 1, chunks->size());
        }
        result.chunks.transcribed++;
        partials.push_back({.index = chunk.index, .text = std::move(*text), .succeeded = true});
    }

    if (result.chunks.transcribed == 0 && result.chunks.failed > 0) {
        return std::unexpected(Error{ErrorCode::InferenceFailed, std::format(
            "all {} transcribable chunks failed", result.chunks.failed)});
    }

    result.text = merge_segments(partials, &result.chunks.duplicates_removed);
    result.confidence = result.text.empty() ? 0.0 : 0.95;
    result.processing_time =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    log(std::format("transcription done: {} chunks (ok={}, skipped={}, failed={}), "
                    "{} duplicate words removed, {} chars, RTF {:.2f}",
                    result.chunks.total, result.chunks.transcribed, result.chunks.skipped,
                    result.chunks.failed, result.chunks.duplicates_removed, result.text.size(),
                    result.real_time_factor()));
    return result;
}

void TranscriptionPipeline::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[whisperd] {}", msg);
    }
}
