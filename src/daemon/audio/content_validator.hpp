#pragma once

#include <span>
#include <string_view>

enum class ContentClass { Silent, ConstantNoise, Viable };

struct ContentStats {
    float max_abs = 0.0f;
    float stddev = 0.0f;
};

constexpr float kSilenceThreshold = 0.01f;  // max |amplitude| below this is silence
constexpr float kNoiseThreshold = 0.001f;   // stddev below this is constant noise

ContentStats measure_content(std::span<const float> samples);

// Empty input is classified Silent.
ContentClass classify_content(std::span<const float> samples, ContentStats* stats = nullptr);

std::string_view content_class_name(ContentClass c);
