#pragma once

#include <algorithm>

constexpr double kTimeoutDurationFactor = 1.5;

// Deadline for a whole request: never below the base, and scaled with the
// audio so long inputs are not cut off.
constexpr double calculate_timeout(double base_seconds, double audio_duration_seconds) {
    return std::max(base_seconds, audio_duration_seconds * kTimeoutDurationFactor);
}
