// ==============================================================================
// Layer 0: Core Utility - Range Scaling
// ==============================================================================
// Linear mapping between the normalized [0, 1] domain used by controls and
// parameters, and an arbitrary [minimum, maximum] value range.
//
// - Real-time safe (no allocation, noexcept)
// - constexpr, usable in parameter tables
// - No dependencies on higher layers
// ==============================================================================

#pragma once

namespace Vernier {
namespace DSP {

// =============================================================================
// Normalized <-> Value
// =============================================================================

/// @brief Position of a value inside [minimum, maximum] as a normalized fraction.
///
/// @param value Value to convert
/// @param minimum Lower bound of the range
/// @param maximum Upper bound of the range
/// @return (value - minimum) / (maximum - minimum), unclamped
///
/// @pre maximum > minimum. A degenerate range divides by zero and the result
///      is meaningless; callers own range validation.
///
/// @example
/// @code
/// constexpr float half = valueToNormalized(50.0f, 0.0f, 100.0f);  // = 0.5
/// @endcode
[[nodiscard]] constexpr float valueToNormalized(
    float value,
    float minimum,
    float maximum
) noexcept {
    return (value - minimum) / (maximum - minimum);
}

/// @brief Value at a normalized position inside [minimum, maximum].
///
/// @param normalized Position, nominally in [0, 1]
/// @param minimum Value returned at position 0
/// @param maximum Value returned at position 1
/// @return minimum + normalized * (maximum - minimum), unclamped
///
/// @note Positions outside [0, 1] extrapolate linearly.
///
/// @example
/// @code
/// constexpr float v = normalizedToValue(0.25f, 10.0f, 20.0f);  // = 12.5
/// @endcode
[[nodiscard]] constexpr float normalizedToValue(
    float normalized,
    float minimum,
    float maximum
) noexcept {
    return minimum + normalized * (maximum - minimum);
}

// =============================================================================
// Clamping
// =============================================================================

/// @brief Clamp a value into [minimum, maximum].
[[nodiscard]] constexpr float clampToRange(
    float value,
    float minimum,
    float maximum
) noexcept {
    return value < minimum ? minimum : (value > maximum ? maximum : value);
}

/// @brief True when value lies inside [minimum, maximum] (inclusive).
[[nodiscard]] constexpr bool isInRange(
    float value,
    float minimum,
    float maximum
) noexcept {
    return value >= minimum && value <= maximum;
}

} // namespace DSP
} // namespace Vernier
