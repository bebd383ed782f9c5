#pragma once

#include <string_view>

#include "PrimeEmbed/NativeWindowApi.h"

namespace PrimeEmbed {

class EmbedLog;

// Fire-and-forget command set over one borrowed window. Native failures are logged
// and never surface to the caller, except for queryBounds.
class NativeWindowController {
public:
  NativeWindowController(NativeWindowApi& api, NativeWindowHandle handle, const EmbedLog& log, bool repaintOnMove);

  void configureAsChildStyle();
  void reparent(HostAnchor parent);
  void setVisible(bool show);
  void sendActivationState(bool active);
  void moveResize(const DeviceRect& rect);
  EmbedResult<DeviceRect> queryBounds() const;
  void setFocus();

  NativeWindowHandle handle() const;

private:
  void report(std::string_view operation, const EmbedStatus& status) const;

  NativeWindowApi& api_;
  NativeWindowHandle handle_{};
  const EmbedLog& log_;
  bool repaintOnMove_ = true;
};

} // namespace PrimeEmbed
