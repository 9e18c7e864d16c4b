#include "segment_merger.hpp"

#include <algorithm>
#include <sstream>
#include <vector>

namespace {

std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream in(text);
    std::string w;
    while (in >> w) words.push_back(std::move(w));
    return words;
}

// Longest j <= window such that the last j words of `tail` equal the first j of `head`.
size_t boundary_overlap(const std::vector<std::string>& tail,
                        const std::vector<std::string>& head) {
    size_t limit = std::min({kMergeWindowWords, tail.size(), head.size()});
    for (size_t j = limit; j > 0; --j) {
        if (std::equal(tail.end() - static_cast<std::ptrdiff_t>(j), tail.end(), head.begin())) {
            return j;
        }
    }
    return 0;
}

} // namespace

std::string merge_segments(std::span<const ChunkResult> results, size_t* duplicates_removed) {
    std::vector<const ChunkResult*> ordered;
    ordered.reserve(results.size());
    for (const auto& r : results) ordered.push_back(&r);
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const ChunkResult* a, const ChunkResult* b) { return a->index < b->index; });

    std::string merged;
    std::vector<std::string> tail; // last kMergeWindowWords words of `merged`
    size_t removed = 0;

    for (const ChunkResult* r : ordered) {
        if (!r->succeeded) continue;

        auto words = split_words(r->text);
        if (words.empty()) continue;

        size_t skip = boundary_overlap(tail, words);
        removed += skip;

        for (size_t i = skip; i < words.size(); ++i) {
            if (!merged.empty()) merged += ' ';
            merged += words[i];
            tail.push_back(words[i]);
        }
        if (tail.size() > kMergeWindowWords) {
            tail.erase(tail.begin(), tail.end() - static_cast<std::ptrdiff_t>(kMergeWindowWords));
        }
    }

    if (duplicates_removed) *duplicates_removed = removed;
    return merged;
}
