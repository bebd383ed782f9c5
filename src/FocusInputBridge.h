#pragma once

#include "PrimeEmbed/Embed.h"

namespace PrimeEmbed {

class NativeWindowController;

class FocusInputBridge {
public:
  explicit FocusInputBridge(NativeWindowController& controller);

  void gotFocus();
  // Every key is swallowed so host shortcuts and focus traversal never run while the
  // embedded window holds input.
  void previewKeyDown(KeyDownEvent& event);

private:
  NativeWindowController& controller_;
};

} // namespace PrimeEmbed
