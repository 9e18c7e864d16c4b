#include "content_validator.hpp"

#include <algorithm>
#include <cmath>

ContentStats measure_content(std::span<const float> samples) {
    ContentStats stats;
    if (samples.empty()) return stats;

    double sum = 0.0;
    for (float s : samples) {
        stats.max_abs = std::max(stats.max_abs, std::fabs(s));
        sum += s;
    }
    double mean = sum / static_cast<double>(samples.size());

    double sq = 0.0;
    for (float s : samples) {
        double d = s - mean;
        sq += d * d;
    }
    stats.stddev = static_cast<float>(std::sqrt(sq / static_cast<double>(samples.size())));
    return stats;
}

ContentClass classify_content(std::span<const float> samples, ContentStats* stats) {
    auto measured = measure_content(samples);
    if (stats) *stats = measured;

    if (samples.empty() || measured.max_abs < kSilenceThreshold) return ContentClass::Silent;
    if (measured.stddev < kNoiseThreshold) return ContentClass::ConstantNoise;
    return ContentClass::Viable;
}

std::string_view content_class_name(ContentClass c) {
    switch (c) {
        case ContentClass::Silent: return "silent";
        case ContentClass::ConstantNoise: return "constant noise";
        case ContentClass::Viable: return "viable";
    }
    return "unknown";
}
