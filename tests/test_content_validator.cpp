#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "audio/content_validator.hpp"
#include "mock_backend.hpp"

#include <vector>

TEST_CASE("classify_content", "[validator]") {

    SECTION("DigitalSilence") {
        auto audio = make_silence(1.0);
        REQUIRE(classify_content(audio.samples) == ContentClass::Silent);
    }

    SECTION("QuietHissIsSilent") {
        auto audio = make_tone(1.0, 16000, 0.005f);
        REQUIRE(classify_content(audio.samples) == ContentClass::Silent);
    }

    SECTION("ConstantOffsetIsNoise") {
        std::vector<float> dc(16000, 0.3f);
        ContentStats stats;
        REQUIRE(classify_content(dc, &stats) == ContentClass::ConstantNoise);
        REQUIRE(stats.max_abs == Catch::Approx(0.3f));
        REQUIRE(stats.stddev < kNoiseThreshold);
    }

    SECTION("SpeechLikeSignalIsViable") {
        auto audio = make_tone(1.0);
        ContentStats stats;
        REQUIRE(classify_content(audio.samples, &stats) == ContentClass::Viable);
        REQUIRE(stats.max_abs == Catch::Approx(0.5f).margin(0.01));
        REQUIRE(stats.stddev > 0.3f);
    }

    SECTION("EmptyIsSilent") {
        std::vector<float> empty;
        REQUIRE(classify_content(empty) == ContentClass::Silent);
    }

    SECTION("SingleSpikeInSilence") {
        auto audio = make_silence(1.0);
        audio.samples[8000] = 0.8f;
        // peak is high but the signal barely varies
        REQUIRE(classify_content(audio.samples) != ContentClass::Silent);
    }

    SECTION("Names") {
        REQUIRE(content_class_name(ContentClass::Silent) == "silent");
        REQUIRE(content_class_name(ContentClass::ConstantNoise) == "constant noise");
        REQUIRE(content_class_name(ContentClass::Viable) == "viable");
    }
}
