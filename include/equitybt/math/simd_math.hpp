// simd_math.hpp
// Vectorized column kernels for return series and predicate masks
// ARM NEON paths with scalar fallbacks

#pragma once

#include <cmath>
#include <cstdint>
#include <numeric>
#include <vector>

#if defined(__aarch64__) || defined(__ARM_NEON)
    #define EQUITYBT_HAS_NEON 1
    #include <arm_neon.h>
#else
    #define EQUITYBT_HAS_NEON 0
#endif

namespace equitybt {
namespace simd {

// ============================================================================
// Vector Operations over double columns
// ============================================================================

class VectorOps {
public:
    static double sum(const double* data, size_t n) {
#if EQUITYBT_HAS_NEON
        size_t i = 0;
        float64x2_t vsum = vdupq_n_f64(0.0);
        for (; i + 1 < n; i += 2) {
            vsum = vaddq_f64(vsum, vld1q_f64(data + i));
        }
        double result = vgetq_lane_f64(vsum, 0) + vgetq_lane_f64(vsum, 1);
        for (; i < n; ++i) {
            result += data[i];
        }
        return result;
#else
        return std::accumulate(data, data + n, 0.0);
#endif
    }

    static double mean(const double* data, size_t n) {
        if (n == 0) return 0.0;
        return sum(data, n) / static_cast<double>(n);
    }

    // Sum of squared deviations from mean_val
    static double sum_sq_dev(const double* data, size_t n, double mean_val) {
#if EQUITYBT_HAS_NEON
        size_t i = 0;
        float64x2_t vmean = vdupq_n_f64(mean_val);
        float64x2_t vsum = vdupq_n_f64(0.0);
        for (; i + 1 < n; i += 2) {
            float64x2_t diff = vsubq_f64(vld1q_f64(data + i), vmean);
            vsum = vfmaq_f64(vsum, diff, diff);
        }
        double result = vgetq_lane_f64(vsum, 0) + vgetq_lane_f64(vsum, 1);
        for (; i < n; ++i) {
            double diff = data[i] - mean_val;
            result += diff * diff;
        }
        return result;
#else
        double total = 0.0;
        for (size_t i = 0; i < n; ++i) {
            double diff = data[i] - mean_val;
            total += diff * diff;
        }
        return total;
#endif
    }

    // Sample variance (n - 1 denominator)
    static double sample_variance(const double* data, size_t n, double mean_val) {
        if (n < 2) return 0.0;
        return sum_sq_dev(data, n, mean_val) / static_cast<double>(n - 1);
    }

    static double sample_std_dev(const double* data, size_t n, double mean_val) {
        return std::sqrt(sample_variance(data, n, mean_val));
    }
};

// ============================================================================
// Byte-mask Operations for predicate evaluation
// ============================================================================

class MaskOps {
public:
    static void and_into(uint8_t* dst, const uint8_t* src, size_t n) {
        for (size_t i = 0; i < n; ++i) dst[i] &= src[i];
    }

    static void or_into(uint8_t* dst, const uint8_t* src, size_t n) {
        for (size_t i = 0; i < n; ++i) dst[i] |= src[i];
    }

    static void invert(uint8_t* dst, size_t n) {
        for (size_t i = 0; i < n; ++i) dst[i] ^= 1u;
    }
};

// ============================================================================
// Statistical helpers over return series
// ============================================================================

class StatisticalOps {
public:
    struct MeanStd {
        double mean;
        double std_dev;
    };

    static MeanStd mean_std(const std::vector<double>& data) {
        if (data.empty()) return {0.0, 0.0};
        const double m = VectorOps::mean(data.data(), data.size());
        return {m, VectorOps::sample_std_dev(data.data(), data.size(), m)};
    }

    // Sample std of the negative entries only
    static double downside_std(const std::vector<double>& data) {
        std::vector<double> negatives;
        for (double v : data) {
            if (v < 0.0) negatives.push_back(v);
        }
        return mean_std(negatives).std_dev;
    }
};

} // namespace simd
} // namespace equitybt
