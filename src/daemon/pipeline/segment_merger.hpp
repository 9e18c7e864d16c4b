#pragma once

#include <cstddef>
#include <span>
#include <string>

struct ChunkResult {
    size_t index = 0;
    std::string text;
    bool succeeded = false;
};

// Number of trailing words compared against the next chunk's leading words.
constexpr size_t kMergeWindowWords = 5;

// Joins chunk transcripts in index order with single spaces. Words repeated
// across a boundary (the longest suffix of the previous tail that equals a
// prefix of the next chunk, within kMergeWindowWords) are emitted once.
// Failed and empty results contribute nothing.
std::string merge_segments(std::span<const ChunkResult> results,
                           size_t* duplicates_removed = nullptr);
