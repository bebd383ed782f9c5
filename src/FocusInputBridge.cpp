#include "FocusInputBridge.h"

#include "NativeWindowController.h"

namespace PrimeEmbed {

FocusInputBridge::FocusInputBridge(NativeWindowController& controller)
    : controller_(controller) {}

void FocusInputBridge::gotFocus() {
  controller_.setFocus();
}

void FocusInputBridge::previewKeyDown(KeyDownEvent& event) {
  event.handled = true;
}

} // namespace PrimeEmbed
