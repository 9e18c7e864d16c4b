#include <catch2/catch_test_macros.hpp>

#include "mock_backend.hpp"
#include "pipeline/transcription_pipeline.hpp"
#include "whisper/transcription_engine.hpp"

#include <algorithm>
#include <chrono>
#include <memory>

TEST_CASE("TranscriptionPipeline", "[pipeline]") {
    auto owned = std::make_unique<MockBackend>();
    auto* mock = owned.get();
    TranscriptionEngine engine(std::move(owned), std::chrono::seconds(5));
    REQUIRE(engine.init().has_value());

    PipelineOptions opts; // 30s windows, 3s overlap
    TranscriptionPipeline pipeline(engine, opts);

    SECTION("ShortAudioIsOneCall") {
        auto result = pipeline.run(make_tone(10.0), "en");
        REQUIRE(result.has_value());
        REQUIRE(result->text == "chunk0");
        REQUIRE(result->duration == 10.0);
        REQUIRE(result->confidence == 0.95);
        REQUIRE(result->chunks.total == 1);
        REQUIRE(mock->calls == 1);
    }

    SECTION("LongAudioIsChunkedAndMerged") {
        mock->script = [](size_t call) -> std::expected<std::string, Error> {
            if (call == 0) return std::string("the meeting started with a review of the plan");
            return std::string("of the plan and then moved on");
        };
        auto result = pipeline.run(make_tone(45.0), "en");
        REQUIRE(result.has_value());
        REQUIRE(result->chunks.total == 2);
        REQUIRE(result->chunks.transcribed == 2);
        REQUIRE(result->chunks.duplicates_removed == 3);
        REQUIRE(result->text ==
                "the meeting started with a review of the plan and then moved on");
        REQUIRE(mock->sample_counts == std::vector<size_t>{30 * 16000, 18 * 16000});
    }

    SECTION("ChunkingDisabledSendsWholeInput") {
        PipelineOptions whole = opts;
        whole.chunking_enabled = false;
        TranscriptionPipeline single(engine, whole);

        auto result = single.run(make_tone(75.0), "en");
        REQUIRE(result.has_value());
        REQUIRE(result->chunks.total == 1);
        REQUIRE(mock->sample_counts == std::vector<size_t>{75 * 16000});
    }

    SECTION("SilentChunksAreSkipped") {
        auto audio = make_tone(45.0);
        // silence everything from 20s on, so the second window [27, 45) is silent
        std::fill(audio.samples.begin() + 20 * 16000, audio.samples.end(), 0.0f);

        auto result = pipeline.run(audio, "en");
        REQUIRE(result.has_value());
        REQUIRE(result->chunks.skipped == 1);
        REQUIRE(result->chunks.transcribed == 1);
        REQUIRE(mock->calls == 1);
        REQUIRE(result->text == "chunk0");
    }

    SECTION("AllSilentIsEmptySuccess") {
        auto result = pipeline.run(make_silence(40.0), "en");
        REQUIRE(result.has_value());
        REQUIRE(result->text.empty());
        REQUIRE(result->confidence == 0.0);
        REQUIRE(result->chunks.skipped == 2);
        REQUIRE(mock->calls == 0);
    }

    SECTION("PartialFailureKeepsOtherChunks") {
        mock->script = [](size_t call) -> std::expected<std::string, Error> {
            if (call == 1) return std::unexpected(Error{ErrorCode::InferenceFailed, "bad chunk"});
            return std::string("part") + std::to_string(call);
        };
        auto result = pipeline.run(make_tone(80.0), "en"); // windows at 0, 27, 54
        REQUIRE(result.has_value());
        REQUIRE(result->chunks.total == 3);
        REQUIRE(result->chunks.failed == 1);
        REQUIRE(result->chunks.transcribed == 2);
        REQUIRE(result->text == "part0 part2");
        REQUIRE(mock->calls == 3);
    }

    SECTION("AllChunksFailing") {
        mock->script = [](size_t) -> std::expected<std::string, Error> {
            return std::unexpected(Error{ErrorCode::Timeout, "too slow"});
        };
        auto result = pipeline.run(make_tone(45.0), "en");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::InferenceFailed);
        REQUIRE(is_transient(result.error().code));
    }

    SECTION("ContextLossAbortsRequest") {
        mock->script = [mock](size_t call) -> std::expected<std::string, Error> {
            if (call == 0) {
                mock->corrupt();
                mock->fail_load = true;
            }
            return std::string("first");
        };
        auto result = pipeline.run(make_tone(80.0), "en");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::ContextLost);
        REQUIRE(mock->calls == 1);
    }

    SECTION("EmptyAudioIsRejected") {
        AudioBuffer empty;
        auto result = pipeline.run(empty, "en");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::UnsupportedFormat);
    }

    SECTION("InvalidOverlapIsRejected") {
        PipelineOptions bad = opts;
        bad.segments.overlap_seconds = 20.0;
        TranscriptionPipeline p(engine, bad);
        auto result = p.run(make_tone(45.0), "en");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::InvalidConfig);
    }
}
