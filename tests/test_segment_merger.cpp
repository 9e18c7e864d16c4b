#include <catch2/catch_test_macros.hpp>

#include "pipeline/segment_merger.hpp"

#include <string>
#include <vector>

namespace {

std::vector<ChunkResult> ok(std::vector<std::string> texts) {
    std::vector<ChunkResult> out;
    for (size_t i = 0; i < texts.size(); ++i) {
        out.push_back({.index = i, .text = texts[i], .succeeded = true});
    }
    return out;
}

size_t count(const std::string& hay, const std::string& needle) {
    size_t n = 0;
    for (auto pos = hay.find(needle); pos != std::string::npos; pos = hay.find(needle, pos + 1)) {
        ++n;
    }
    return n;
}

} // namespace

TEST_CASE("merge_segments", "[merger]") {

    SECTION("EmptyChunksAddNoSeparator") {
        REQUIRE(merge_segments(ok({"hello world", "", "foo bar"})) == "hello world foo bar");
    }

    SECTION("BoundaryOverlapIsDeduplicated") {
        size_t removed = 0;
        auto text = merge_segments(ok({"x y a b c", "b c d e"}), &removed);
        REQUIRE(text == "x y a b c d e");
        REQUIRE(count(text, "b c") == 1);
        REQUIRE(removed == 2);
    }

    SECTION("LongestMatchWins") {
        auto text = merge_segments(ok({"one two one two", "one two one two three"}));
        REQUIRE(text == "one two one two three");
    }

    SECTION("MatchLimitedToWindow") {
        // Six shared words exceed the five-word window, so only five are dropped.
        size_t removed = 0;
        auto text = merge_segments(ok({"a b c d e f", "a b c d e f g"}), &removed);
        REQUIRE(removed == 0);
        REQUIRE(text == "a b c d e f a b c d e f g");

        text = merge_segments(ok({"z b c d e f", "b c d e f g"}), &removed);
        REQUIRE(removed == 5);
        REQUIRE(text == "z b c d e f g");
    }

    SECTION("NoOverlapKeepsEverything") {
        size_t removed = 7;
        REQUIRE(merge_segments(ok({"the quick", "brown fox"}), &removed) == "the quick brown fox");
        REQUIRE(removed == 0);
    }

    SECTION("SingleWordChunks") {
        REQUIRE(merge_segments(ok({"hello", "hello", "world"})) == "hello world");
    }

    SECTION("FailedChunksAreSkipped") {
        std::vector<ChunkResult> results = {
            {.index = 0, .text = "first part", .succeeded = true},
            {.index = 1, .text = "garbage", .succeeded = false},
            {.index = 2, .text = "third part", .succeeded = true},
        };
        REQUIRE(merge_segments(results) == "first part third part");
    }

    SECTION("OrderedByIndex") {
        std::vector<ChunkResult> results = {
            {.index = 2, .text = "gamma", .succeeded = true},
            {.index = 0, .text = "alpha", .succeeded = true},
            {.index = 1, .text = "beta", .succeeded = true},
        };
        REQUIRE(merge_segments(results) == "alpha beta gamma");
    }

    SECTION("WhitespaceIsNormalized") {
        REQUIRE(merge_segments(ok({"  hello   world ", "\tagain\n"})) == "hello world again");
    }

    SECTION("NothingToMerge") {
        REQUIRE(merge_segments(std::vector<ChunkResult>{}).empty());
        REQUIRE(merge_segments(ok({"", "   "})).empty());
    }
}
