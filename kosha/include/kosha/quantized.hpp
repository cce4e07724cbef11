#pragma once
// int8 quantization for index vectors
//
// Each vector keeps its own scale/offset: x ≈ code * scale + offset.
// A 384-dim vector shrinks from 1536 to 392 bytes at ~1% recall loss.
// Queries stay float32; distances are computed against the codes
// without materializing the dequantized vector.

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

namespace kosha {

struct QuantParams {
    float scale = 1.0f;
    float offset = 0.0f;
};

inline QuantParams quantize(const float* v, size_t dim, int8_t* out) {
    float min_val = std::numeric_limits<float>::max();
    float max_val = std::numeric_limits<float>::lowest();
    for (size_t i = 0; i < dim; ++i) {
        min_val = std::min(min_val, v[i]);
        max_val = std::max(max_val, v[i]);
    }
    if (dim == 0) { min_val = 0.0f; max_val = 0.0f; }

    float range = max_val - min_val;
    if (range < 1e-8f) range = 1.0f;

    QuantParams p;
    p.scale = range / 254.0f;  // Map to [-127, 127]
    p.offset = min_val + range / 2.0f;

    for (size_t i = 0; i < dim; ++i) {
        int val = static_cast<int>(std::round((v[i] - p.offset) / p.scale));
        out[i] = static_cast<int8_t>(std::clamp(val, -127, 127));
    }
    return p;
}

inline void dequantize(const int8_t* codes, size_t dim, QuantParams p, float* out) {
    for (size_t i = 0; i < dim; ++i) {
        out[i] = static_cast<float>(codes[i]) * p.scale + p.offset;
    }
}

// dot(q, x) = scale * Σ q·c + offset * Σ q
inline float dot_quantized(const float* q, float q_sum, const int8_t* codes,
                           size_t dim, QuantParams p) {
    float acc = 0.0f;
    for (size_t i = 0; i < dim; ++i) acc += q[i] * static_cast<float>(codes[i]);
    return p.scale * acc + p.offset * q_sum;
}

inline float l2_squared_quantized(const float* q, const int8_t* codes,
                                  size_t dim, QuantParams p) {
    float sum = 0.0f;
    for (size_t i = 0; i < dim; ++i) {
        float d = q[i] - (static_cast<float>(codes[i]) * p.scale + p.offset);
        sum += d * d;
    }
    return sum;
}

} // namespace kosha
