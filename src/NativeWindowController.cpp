#include "NativeWindowController.h"

#include "EmbedLog.h"

namespace PrimeEmbed {

NativeWindowController::NativeWindowController(NativeWindowApi& api,
                                               NativeWindowHandle handle,
                                               const EmbedLog& log,
                                               bool repaintOnMove)
    : api_(api),
      handle_(handle),
      log_(log),
      repaintOnMove_(repaintOnMove) {}

void NativeWindowController::configureAsChildStyle() {
  report("setChildStyle", api_.setChildStyle(handle_));
}

void NativeWindowController::reparent(HostAnchor parent) {
  report("setParent", api_.setParent(handle_, parent));
}

void NativeWindowController::setVisible(bool show) {
  report("setVisible", api_.setVisible(handle_, show));
}

void NativeWindowController::sendActivationState(bool active) {
  report("sendActivation", api_.sendActivation(handle_, active));
}

void NativeWindowController::moveResize(const DeviceRect& rect) {
  report("moveResize", api_.moveResize(handle_, rect, repaintOnMove_));
}

EmbedResult<DeviceRect> NativeWindowController::queryBounds() const {
  auto bounds = api_.windowBounds(handle_);
  if (!bounds) {
    log_.debug(failureMessage("windowBounds", bounds.error()));
  }
  return bounds;
}

void NativeWindowController::setFocus() {
  report("setFocus", api_.setFocus(handle_));
}

NativeWindowHandle NativeWindowController::handle() const {
  return handle_;
}

void NativeWindowController::report(std::string_view operation, const EmbedStatus& status) const {
  if (status) {
    return;
  }
  log_.debug(failureMessage(operation, status.error()));
}

} // namespace PrimeEmbed
