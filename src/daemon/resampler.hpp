#pragma once

#include <cmath>
#include <cstddef>
#include <span>
#include <vector>

// Linear-interpolation resampling to the 16 kHz mono format whisper expects.
namespace resample {

inline constexpr double kTargetRate = 16000.0;

// Number of samples to_16k() produces for an input of `count` samples.
inline size_t output_length(size_t count, double source_rate) {
    return static_cast<size_t>(std::floor(static_cast<double>(count) * kTargetRate / source_rate));
}

// source_rate must be positive and finite; callers validate it.
inline std::vector<float> to_16k(std::span<const float> samples, double source_rate) {
    if (std::abs(source_rate - kTargetRate) < 1.0) {
        return {samples.begin(), samples.end()};
    }

    size_t out_len = output_length(samples.size(), source_rate);
    std::vector<float> out;
    out.reserve(out_len);

    const double step = source_rate / kTargetRate;
    const size_t last = samples.size() - 1;

    for (size_t i = 0; i < out_len; ++i) {
        double pos = static_cast<double>(i) * step;
        size_t lower = static_cast<size_t>(pos);
        if (lower > last) lower = last;
        size_t upper = lower + 1 > last ? last : lower + 1;
        float frac = static_cast<float>(pos - static_cast<double>(lower));

        float a = samples[lower];
        float b = samples[upper];
        out.push_back(a + (b - a) * frac);
    }

    return out;
}

} // namespace resample
