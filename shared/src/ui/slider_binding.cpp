// ==============================================================================
// SliderBinding Implementation
// ==============================================================================

#include "slider_binding.h"
#include "slider_helper.h"

#include "platform/debug_log.h"

namespace Vernier::UI {

SliderBinding::SliderBinding(VSTGUI::CControl* control, Model::Property& property)
    : control_(control)
    , property_(property)
{
    if (control_) {
        control_->setListener(this);
        refresh();
    }
}

SliderBinding::~SliderBinding() {
    if (control_ && control_->getListener() == this) {
        control_->setListener(nullptr);
    }
}

void SliderBinding::refresh() {
    if (!control_) return;
    SliderHelper::setControlFromProperty(*control_.get(), property_);
}

void SliderBinding::reset() {
    property_.reset();
    refresh();
    notifyChange();
}

void SliderBinding::randomize() {
    property_.randomize();
    refresh();
    notifyChange();
}

// =============================================================================
// IControlListener
// =============================================================================

void SliderBinding::valueChanged(VSTGUI::CControl* control) {
    if (!control || control != control_.get()) return;

    property_.setValue(SliderHelper::scaleValueFromControl(
        *control, property_.minimum(), property_.maximum()));

    VERNIER_DEBUG_LOG("[Vernier] tag %d -> %g\n",
                      static_cast<int>(control->getTag()),
                      static_cast<double>(property_.value()));

    notifyChange();
}

void SliderBinding::notifyChange() {
    if (onChange_) {
        onChange_(property_);
    }
}

} // namespace Vernier::UI
