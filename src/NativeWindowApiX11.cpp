#if defined(__linux__)

#include "NativeWindowApiBackends.h"

#include <X11/Xlib.h>

#include <algorithm>
#include <memory>
#include <utility>

namespace PrimeEmbed {
namespace {

constexpr long kXEmbedVersion = 0;
constexpr long kXEmbedMapped = 1;

constexpr long kXEmbedEmbeddedNotify = 0;
constexpr long kXEmbedWindowActivate = 1;
constexpr long kXEmbedWindowDeactivate = 2;
constexpr long kXEmbedFocusIn = 4;
constexpr long kXEmbedFocusCurrent = 0;

// Xlib reports errors asynchronously through a process-wide handler. All calls come
// from the UI thread, so one slot is enough.
int gTrappedError = Success;

int trap_x_error(Display* display, XErrorEvent* event) {
  (void)display;
  gTrappedError = event->error_code;
  return 0;
}

class XErrorTrap {
public:
  explicit XErrorTrap(Display* display)
      : display_(display) {
    XSync(display_, False);
    gTrappedError = Success;
    previous_ = XSetErrorHandler(trap_x_error);
  }

  ~XErrorTrap() { restore(); }

  XErrorTrap(const XErrorTrap&) = delete;
  XErrorTrap& operator=(const XErrorTrap&) = delete;

  EmbedStatus finish() {
    XSync(display_, False);
    restore();
    if (gTrappedError != Success) {
      return std::unexpected(EmbedError{EmbedErrorCode::PlatformFailure});
    }
    return {};
  }

private:
  void restore() {
    if (!installed_) {
      return;
    }
    XSetErrorHandler(previous_);
    installed_ = false;
  }

  Display* display_ = nullptr;
  XErrorHandler previous_ = nullptr;
  bool installed_ = true;
};

struct DisplayCloser {
  void operator()(Display* display) const {
    if (display) {
      XCloseDisplay(display);
    }
  }
};

Window to_window(NativeWindowHandle handle) {
  return static_cast<Window>(handle.value);
}

Window to_window(HostAnchor anchor) {
  return static_cast<Window>(anchor.value);
}

class NativeWindowApiX11 final : public NativeWindowApi {
public:
  explicit NativeWindowApiX11(std::unique_ptr<Display, DisplayCloser> display)
      : display_(std::move(display)) {
    xembed_ = XInternAtom(display_.get(), "_XEMBED", False);
    xembedInfo_ = XInternAtom(display_.get(), "_XEMBED_INFO", False);
  }

  EmbedStatus setChildStyle(NativeWindowHandle window) override {
    if (!window.isValid()) {
      return std::unexpected(EmbedError{EmbedErrorCode::InvalidHandle});
    }
    XErrorTrap trap(display_.get());
    long info[2] = {kXEmbedVersion, kXEmbedMapped};
    XChangeProperty(display_.get(), to_window(window), xembedInfo_, xembedInfo_, 32, PropModeReplace,
                    reinterpret_cast<unsigned char*>(info), 2);
    return trap.finish();
  }

  EmbedStatus setParent(NativeWindowHandle window, HostAnchor parent) override {
    if (!window.isValid()) {
      return std::unexpected(EmbedError{EmbedErrorCode::InvalidHandle});
    }
    XErrorTrap trap(display_.get());
    if (parent.isValid()) {
      XReparentWindow(display_.get(), to_window(window), to_window(parent), 0, 0);
      sendXEmbed(to_window(window), kXEmbedEmbeddedNotify, 0, static_cast<long>(to_window(parent)));
      return trap.finish();
    }

    // Keep the current (parked) position so the window does not jump to the origin.
    Window root = None;
    int x = 0;
    int y = 0;
    unsigned int width = 0u;
    unsigned int height = 0u;
    unsigned int border = 0u;
    unsigned int depth = 0u;
    if (!XGetGeometry(display_.get(), to_window(window), &root, &x, &y, &width, &height, &border, &depth)) {
      (void)trap.finish();
      return std::unexpected(EmbedError{EmbedErrorCode::PlatformFailure});
    }
    XReparentWindow(display_.get(), to_window(window), DefaultRootWindow(display_.get()), x, y);
    return trap.finish();
  }

  EmbedStatus setVisible(NativeWindowHandle window, bool visible) override {
    if (!window.isValid()) {
      return std::unexpected(EmbedError{EmbedErrorCode::InvalidHandle});
    }
    XErrorTrap trap(display_.get());
    if (visible) {
      XMapWindow(display_.get(), to_window(window));
    } else {
      XUnmapWindow(display_.get(), to_window(window));
    }
    return trap.finish();
  }

  EmbedStatus sendActivation(NativeWindowHandle window, bool active) override {
    if (!window.isValid()) {
      return std::unexpected(EmbedError{EmbedErrorCode::InvalidHandle});
    }
    XErrorTrap trap(display_.get());
    sendXEmbed(to_window(window), active ? kXEmbedWindowActivate : kXEmbedWindowDeactivate, 0, 0);
    return trap.finish();
  }

  EmbedStatus moveResize(NativeWindowHandle window, const DeviceRect& rect, bool repaint) override {
    if (!window.isValid()) {
      return std::unexpected(EmbedError{EmbedErrorCode::InvalidHandle});
    }
    // X11 rejects zero-sized windows.
    auto width = static_cast<unsigned int>(std::max(rect.width, 1));
    auto height = static_cast<unsigned int>(std::max(rect.height, 1));
    XErrorTrap trap(display_.get());
    XMoveResizeWindow(display_.get(), to_window(window), rect.x, rect.y, width, height);
    if (repaint) {
      XClearArea(display_.get(), to_window(window), 0, 0, 0u, 0u, True);
    }
    return trap.finish();
  }

  EmbedResult<DeviceRect> windowBounds(NativeWindowHandle window) const override {
    if (!window.isValid()) {
      return std::unexpected(EmbedError{EmbedErrorCode::InvalidHandle});
    }
    XErrorTrap trap(display_.get());
    XWindowAttributes attributes{};
    Status status = XGetWindowAttributes(display_.get(), to_window(window), &attributes);
    auto trapped = trap.finish();
    if (!status || !trapped) {
      return std::unexpected(EmbedError{EmbedErrorCode::PlatformFailure});
    }
    return DeviceRect{attributes.x, attributes.y, attributes.width, attributes.height};
  }

  EmbedStatus setFocus(NativeWindowHandle window) override {
    if (!window.isValid()) {
      return std::unexpected(EmbedError{EmbedErrorCode::InvalidHandle});
    }
    XErrorTrap trap(display_.get());
    XSetInputFocus(display_.get(), to_window(window), RevertToParent, CurrentTime);
    sendXEmbed(to_window(window), kXEmbedFocusIn, kXEmbedFocusCurrent, 0);
    return trap.finish();
  }

private:
  void sendXEmbed(Window target, long message, long detail, long data1) const {
    if (xembed_ == None) {
      return;
    }
    XEvent event{};
    event.xclient.type = ClientMessage;
    event.xclient.window = target;
    event.xclient.message_type = xembed_;
    event.xclient.format = 32;
    event.xclient.data.l[0] = CurrentTime;
    event.xclient.data.l[1] = message;
    event.xclient.data.l[2] = detail;
    event.xclient.data.l[3] = data1;
    event.xclient.data.l[4] = 0;
    XSendEvent(display_.get(), target, False, NoEventMask, &event);
  }

  std::unique_ptr<Display, DisplayCloser> display_;
  Atom xembed_ = None;
  Atom xembedInfo_ = None;
};

} // namespace

EmbedResult<std::unique_ptr<NativeWindowApi>> createNativeWindowApiX11() {
  std::unique_ptr<Display, DisplayCloser> display(XOpenDisplay(nullptr));
  if (!display) {
    return std::unexpected(EmbedError{EmbedErrorCode::PlatformFailure});
  }
  return std::make_unique<NativeWindowApiX11>(std::move(display));
}

} // namespace PrimeEmbed

#endif
