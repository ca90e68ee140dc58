#pragma once

// ==============================================================================
// Property - Ranged Model Value
// ==============================================================================
// A floating-point value with a fixed [minimum, maximum] range and the value
// it was created with. This is what a slider edits: the UI reads the range to
// position the control and writes user edits back through setValue().
//
// Assignments are clamped into range, never rejected.
// ==============================================================================

#include "platform/debug_log.h"

#include <vernier/dsp/core/random.h>
#include <vernier/dsp/core/range_scaling.h>

namespace Vernier::Model {

class Property {
public:
    /// @pre maximum > minimum (not validated)
    Property(float initialValue, float minimum, float maximum) noexcept
        : minimum_(minimum)
        , maximum_(maximum)
        , initialValue_(DSP::clampToRange(initialValue, minimum, maximum))
        , value_(initialValue_) {}

    [[nodiscard]] float value() const noexcept { return value_; }
    [[nodiscard]] float minimum() const noexcept { return minimum_; }
    [[nodiscard]] float maximum() const noexcept { return maximum_; }
    [[nodiscard]] float initialValue() const noexcept { return initialValue_; }

    /// Assign a new value, clamped into [minimum, maximum].
    void setValue(float newValue) noexcept {
        if (!DSP::isInRange(newValue, minimum_, maximum_)) {
            VERNIER_DEBUG_LOG("[Vernier] property value %g outside [%g, %g], clamped\n",
                              static_cast<double>(newValue),
                              static_cast<double>(minimum_),
                              static_cast<double>(maximum_));
        }
        value_ = DSP::clampToRange(newValue, minimum_, maximum_);
    }

    /// Restore the value the property was created with.
    void reset() noexcept { value_ = initialValue_; }

    /// Draw a new value uniformly from the range using the process generator.
    void randomize() noexcept {
        value_ = DSP::processRandom().nextInRange(minimum_, maximum_);
    }

    /// Current value as a position in [0, 1].
    [[nodiscard]] float normalizedValue() const noexcept {
        return DSP::valueToNormalized(value_, minimum_, maximum_);
    }

private:
    float minimum_;
    float maximum_;
    float initialValue_;
    float value_;
};

} // namespace Vernier::Model
