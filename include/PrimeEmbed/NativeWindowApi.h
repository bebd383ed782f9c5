#pragma once

#include <memory>

#include "PrimeEmbed/Embed.h"

namespace PrimeEmbed {

class NativeWindowApi {
public:
  virtual ~NativeWindowApi() = default;

  virtual EmbedStatus setChildStyle(NativeWindowHandle window) = 0;
  // A null parent detaches the window without destroying it.
  virtual EmbedStatus setParent(NativeWindowHandle window, HostAnchor parent) = 0;
  virtual EmbedStatus setVisible(NativeWindowHandle window, bool visible) = 0;
  virtual EmbedStatus sendActivation(NativeWindowHandle window, bool active) = 0;
  virtual EmbedStatus moveResize(NativeWindowHandle window, const DeviceRect& rect, bool repaint) = 0;
  virtual EmbedResult<DeviceRect> windowBounds(NativeWindowHandle window) const = 0;
  virtual EmbedStatus setFocus(NativeWindowHandle window) = 0;
};

EmbedResult<std::unique_ptr<NativeWindowApi>> createNativeWindowApi();

} // namespace PrimeEmbed
