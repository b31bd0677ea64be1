#pragma once

#include <cstdint>
#include <vector>

// Mono float PCM.
struct AudioBuffer {
    std::vector<float> samples;
    uint32_t sample_rate = 0;

    double duration_s() const {
        return sample_rate ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
};
