#pragma once

// ==============================================================================
// Parameter Helper Functions
// ==============================================================================
// Builds VST3 parameters from the demo range table so that a host-facing
// parameter and the slider that edits it always agree on the range.
//
// KEY INSIGHT: Basic Parameter::toPlain() returns the normalized value
// unchanged. RangeParameter::toPlain() scales into [min, max], which is what
// slider scaling needs.
// ==============================================================================

#include "model/demo_parameters.h"

#include "public.sdk/source/vst/vstparameters.h"
#include "pluginterfaces/base/ustring.h"

namespace Vernier::Model {

// ==============================================================================
// createRangeParameter - Continuous parameter from a PropertyRange
// ==============================================================================
// Usage:
//   parameters.addParameter(createRangeParameter(
//       STR16("Cutoff"), kCutoffId, *findPropertyRange("halfPowerPoint")));
//
// The returned parameter carries one reference owned by the caller
// (ParameterContainer::addParameter takes it over).
// ==============================================================================

inline Steinberg::Vst::RangeParameter* createRangeParameter(
    const Steinberg::Vst::TChar* title,
    Steinberg::Vst::ParamID id,
    const PropertyRange& range) {

    return new Steinberg::Vst::RangeParameter(
        title,
        id,
        nullptr,  // units string is display-only, kept in PropertyRange
        static_cast<Steinberg::Vst::ParamValue>(range.minimum),
        static_cast<Steinberg::Vst::ParamValue>(range.maximum),
        static_cast<Steinberg::Vst::ParamValue>(range.defaultValue),
        0,        // continuous
        Steinberg::Vst::ParameterInfo::kCanAutomate
    );
}

} // namespace Vernier::Model
