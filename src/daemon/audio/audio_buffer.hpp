#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

// Decoded mono PCM, normalized to [-1, 1].
struct AudioBuffer {
    std::vector<float> samples;
    uint32_t sample_rate = 16000;

    double duration() const {
        if (sample_rate == 0) return 0.0;
        return static_cast<double>(samples.size()) / sample_rate;
    }
};
