#pragma once

// ==============================================================================
// Demo Parameter Ranges
// ==============================================================================
// Ranges and defaults for every slider in the audio demo. The table is the
// single source of truth for slider scaling: properties and VST3 parameters
// are both built from it.
// ==============================================================================

#include "model/property.h"

#include <array>
#include <string_view>

namespace Vernier::Model {

// IMPORTANT: Field order matters for aggregate initialization of the table.
struct PropertyRange {
    std::string_view name;      // Lookup key ("halfPowerPoint")
    float minimum;
    float maximum;
    float defaultValue;
    std::string_view units;     // Display units, empty when unitless
};

// ==============================================================================
// Range Table
// ==============================================================================

inline constexpr std::array<PropertyRange, 5> kDemoPropertyRanges{{
    // High-pass filter half-power point: 12 Hz - 20 kHz
    {"halfPowerPoint", 12.0f, 20000.0f, 1000.0f, "Hz"},
    // White/pink noise mix: 0 = white, 1 = pink
    {"noiseBalance", 0.0f, 1.0f, 0.5f, ""},
    // Modulating LFO rate
    {"lfoFrequency", 0.01f, 10.0f, 0.3f, "Hz"},
    // Stereo position: -1 = left, +1 = right
    {"pan", -1.0f, 1.0f, 0.0f, ""},
    {"amplitude", 0.0f, 1.0f, 0.5f, ""},
}};

/// @return The range registered under name, or nullptr if there is none.
[[nodiscard]] constexpr const PropertyRange* findPropertyRange(std::string_view name) noexcept {
    for (const auto& range : kDemoPropertyRanges) {
        if (range.name == name) {
            return &range;
        }
    }
    return nullptr;
}

/// Create a property positioned at the range's default.
[[nodiscard]] inline Property makeProperty(const PropertyRange& range) noexcept {
    return Property(range.defaultValue, range.minimum, range.maximum);
}

} // namespace Vernier::Model
