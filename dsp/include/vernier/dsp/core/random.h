// ==============================================================================
// Layer 0: Core Utilities
// random.h - Seedable Pseudo-Random Numbers for UI Randomization
// ==============================================================================
// - No allocation, no locks, no exceptions
// - Xorshift32 engine plus a process-wide instance for the UI thread
// ==============================================================================

#pragma once

#include <vernier/dsp/core/range_scaling.h>

#include <cstdint>

namespace Vernier {
namespace DSP {

// ==============================================================================
// Xorshift32 PRNG
// ==============================================================================

/// Fast 32-bit pseudo-random number generator (Marsaglia xorshift, 13/17/5).
///
/// Period 2^32-1. Good enough for randomizing control values; NOT
/// cryptographically secure.
///
/// @example
///     Xorshift32 rng(12345);
///     float cutoff = rng.nextInRange(12.0f, 20000.0f);
///
class Xorshift32 {
public:
    /// Default seed used when 0 is passed (0 would lock the generator at 0)
    static constexpr uint32_t kDefaultSeed = 2463534242u;

    /// @param seedValue Initial seed (0 is replaced with kDefaultSeed)
    explicit constexpr Xorshift32(uint32_t seedValue = kDefaultSeed) noexcept
        : state_(seedValue != 0 ? seedValue : kDefaultSeed) {}

    /// @return Next raw value in [1, 2^32-1]
    [[nodiscard]] constexpr uint32_t next() noexcept {
        state_ ^= state_ << 13;
        state_ ^= state_ >> 17;
        state_ ^= state_ << 5;
        return state_;
    }

    /// @return Next float in [0.0, 1.0]
    [[nodiscard]] constexpr float nextUnipolar() noexcept {
        return static_cast<float>(next()) * kToFloat;
    }

    /// Uniform float in [minimum, maximum].
    /// @pre maximum >= minimum
    [[nodiscard]] constexpr float nextInRange(float minimum, float maximum) noexcept {
        // Float rounding of minimum + 1.0 * span can land one ulp past maximum
        return clampToRange(normalizedToValue(nextUnipolar(), minimum, maximum),
                            minimum, maximum);
    }

    /// Reseed the generator (0 is replaced with kDefaultSeed).
    constexpr void seed(uint32_t seedValue) noexcept {
        state_ = (seedValue != 0) ? seedValue : kDefaultSeed;
    }

    [[nodiscard]] constexpr uint32_t state() const noexcept {
        return state_;
    }

private:
    /// 1.0 / (2^32 - 1)
    static constexpr float kToFloat = 2.3283064370807974e-10f;

    uint32_t state_;
};

// ==============================================================================
// Process-wide generator
// ==============================================================================
// Shared by every randomize action in the process. UI/main thread only: the
// generator state is not synchronized.

/// @return The process-wide generator, seeded with Xorshift32::kDefaultSeed
///         on first use so that an unseeded run is reproducible.
[[nodiscard]] inline Xorshift32& processRandom() noexcept {
    static Xorshift32 generator;
    return generator;
}

/// Reseed the process-wide generator.
inline void seedProcessRandom(uint32_t seedValue) noexcept {
    processRandom().seed(seedValue);
}

} // namespace DSP
} // namespace Vernier
