#pragma once

// ==============================================================================
// SliderBinding - Keeps One Control and One Property in Sync
// ==============================================================================
// Registers itself as the control's IControlListener:
//   - user edits on the control are scaled into the property's range and
//     written to the property
//   - refresh() / reset() / randomize() move the control to the property
//
// The binding retains the control for its lifetime. The property is borrowed
// and must outlive the binding.
// ==============================================================================

#include "model/property.h"

#include "vstgui/lib/controls/ccontrol.h"
#include "vstgui/lib/controls/icontrollistener.h"
#include "vstgui/lib/vstguibase.h"

#include <functional>
#include <utility>

namespace Vernier::UI {

class SliderBinding : public VSTGUI::IControlListener {
public:
    /// Called after the property changed through this binding.
    using ChangeCallback = std::function<void(const Model::Property&)>;

    /// Positions control from property and takes over its listener slot.
    SliderBinding(VSTGUI::CControl* control, Model::Property& property);
    ~SliderBinding() override;

    SliderBinding(const SliderBinding&) = delete;
    SliderBinding& operator=(const SliderBinding&) = delete;

    void setChangeCallback(ChangeCallback callback) { onChange_ = std::move(callback); }

    /// Move the control to the property's current value.
    void refresh();

    /// Restore the property's initial value and show it.
    void reset();

    /// Give the property a random value in its range and show it.
    void randomize();

    [[nodiscard]] VSTGUI::CControl* getControl() const { return control_; }
    [[nodiscard]] const Model::Property& getProperty() const { return property_; }

    // IControlListener
    void valueChanged(VSTGUI::CControl* control) override;

private:
    void notifyChange();

    VSTGUI::SharedPointer<VSTGUI::CControl> control_;
    Model::Property& property_;
    ChangeCallback onChange_;
};

} // namespace Vernier::UI
