#pragma once

// ==============================================================================
// SliderHelper - Range Scaling Between Controls and Values
// ==============================================================================
// Stateless helpers that position a control from a value in an arbitrary
// [minimum, maximum] range and read a control back into that range.
//
// Controls are addressed by their normalized position [0.0, 1.0], so the
// control's own min/max do not matter. Positions written here are clamped by
// the control itself (CControl::setValueNormalized).
//
// Positioning a control does NOT notify its listener; only user edits do.
// UI/main thread only.
//
// Precondition for every range argument: maximum > minimum. Degenerate
// ranges are not checked and give meaningless results.
// ==============================================================================

#include "model/property.h"

#include <vernier/dsp/core/random.h>
#include <vernier/dsp/core/range_scaling.h>

#include "public.sdk/source/vst/vstparameters.h"
#include "vstgui/lib/controls/ccontrol.h"

namespace Vernier::UI::SliderHelper {

/// Position control so that it shows value inside [minimum, maximum].
/// setControlToValue(slider, 50, 0, 100) puts the slider at 0.5.
inline void setControlToValue(VSTGUI::CControl& control,
                              float value,
                              float minimum,
                              float maximum) {
    control.setValueNormalized(DSP::valueToNormalized(value, minimum, maximum));
    control.invalid();
}

/// Position control from a property's value and range.
inline void setControlFromProperty(VSTGUI::CControl& control,
                                   const Model::Property& property) {
    setControlToValue(control, property.value(), property.minimum(), property.maximum());
}

/// Position control from a VST3 range parameter's plain value and range.
inline void setControlFromProperty(VSTGUI::CControl& control,
                                   const Steinberg::Vst::RangeParameter& parameter) {
    const auto plain = parameter.toPlain(parameter.getNormalized());
    setControlToValue(control,
                      static_cast<float>(plain),
                      static_cast<float>(parameter.getMin()),
                      static_cast<float>(parameter.getMax()));
}

/// Value shown by control, scaled into [minimum, maximum].
/// A control at 0.25 read into [10, 20] gives 12.5.
[[nodiscard]] inline float scaleValueFromControl(const VSTGUI::CControl& control,
                                                 float minimum,
                                                 float maximum) {
    return DSP::normalizedToValue(control.getValueNormalized(), minimum, maximum);
}

/// Uniform random value in [minimum, maximum].
/// Advances the process-wide generator (DSP::processRandom()).
[[nodiscard]] inline float randomFloat(float minimum, float maximum) noexcept {
    return DSP::processRandom().nextInRange(minimum, maximum);
}

} // namespace Vernier::UI::SliderHelper
