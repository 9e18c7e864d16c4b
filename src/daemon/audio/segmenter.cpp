#include "segmenter.hpp"

#include <algorithm>
#include <cmath>
#include <format>

namespace {

size_t to_sample(double seconds, uint32_t sample_rate, size_t total) {
    auto pos = static_cast<size_t>(std::llround(seconds * sample_rate));
    return std::min(pos, total);
}

} // namespace

std::expected<std::vector<Chunk>, Error>
segment_audio(const AudioBuffer& audio, const SegmentOptions& opts) {
    if (opts.chunk_seconds <= 0.0 || opts.overlap_seconds < 0.0) {
        return std::unexpected(Error{ErrorCode::InvalidConfig,
                                     "chunk duration must be positive and overlap non-negative"});
    }
    if (opts.overlap_seconds >= opts.chunk_seconds / 2) {
        return std::unexpected(Error{ErrorCode::InvalidConfig, std::format(
            "chunk overlap ({}s) must be less than half of chunk duration ({}s)",
            opts.overlap_seconds, opts.chunk_seconds)});
    }

    const double total = audio.duration();
    std::vector<Chunk> chunks;
    if (audio.samples.empty()) return chunks;

    if (total <= opts.chunk_seconds) {
        chunks.push_back(Chunk{.index = 0, .start_s = 0.0, .end_s = total,
                               .sample_rate = audio.sample_rate,
                               .samples = std::span<const float>(audio.samples)});
        return chunks;
    }

    const double step = opts.chunk_seconds - opts.overlap_seconds;
    struct Span { double start; double end; };
    std::vector<Span> spans;
    for (size_t i = 0;; ++i) {
        double start = static_cast<double>(i) * step;
        double end = std::min(start + opts.chunk_seconds, total);
        spans.push_back({start, end});
        if (end >= total) break;
    }

    if (spans.size() > 1 && spans.back().end - spans.back().start < opts.min_final_seconds) {
        spans[spans.size() - 2].end = spans.back().end;
        spans.pop_back();
    }

    const size_t n = audio.samples.size();
    chunks.reserve(spans.size());
    for (size_t i = 0; i < spans.size(); ++i) {
        size_t first = to_sample(spans[i].start, audio.sample_rate, n);
        size_t last = i + 1 == spans.size() ? n : to_sample(spans[i].end, audio.sample_rate, n);
        chunks.push_back(Chunk{
            .index = i,
            .start_s = spans[i].start,
            .end_s = spans[i].end,
            .sample_rate = audio.sample_rate,
            .samples = std::span<const float>(audio.samples).subspan(first, last - first),
        });
    }
    return chunks;
}
