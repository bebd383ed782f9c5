#include "PrimeEmbed/PrimeEmbed.h"

#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <X11/keysym.h>

#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <string_view>

using namespace PrimeEmbed;

namespace {

constexpr double kMarginLeft = 24.0;
constexpr double kMarginTop = 48.0;
constexpr unsigned int kInitialWidth = 960u;
constexpr unsigned int kInitialHeight = 640u;

std::string_view level_label(LogLevel level) {
  switch (level) {
    case LogLevel::Debug:
      return "debug";
    case LogLevel::Info:
      return "info";
    case LogLevel::Warning:
      return "warning";
    case LogLevel::Error:
      return "error";
  }
  return "unknown";
}

std::optional<uint64_t> parse_window_id(const char* text) {
  try {
    size_t consumed = 0u;
    uint64_t value = std::stoull(text, &consumed, 0);
    if (text[consumed] != '\0') {
      return std::nullopt;
    }
    return value;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

// Host window with a single embedding slot inset by a fixed margin.
class X11HostSurface final : public HostSurface {
public:
  X11HostSurface(Window window, double scale)
      : window_(window),
        scale_(scale) {}

  void setListener(SurfaceListener* listener) override { listener_ = listener; }

  LayoutSubscriptionId subscribeLayoutUpdated(std::function<void()> callback) override {
    LayoutSubscriptionId id = nextId_++;
    layoutCallbacks_[id] = std::move(callback);
    return id;
  }

  void unsubscribeLayoutUpdated(LayoutSubscriptionId id) override { layoutCallbacks_.erase(id); }

  std::optional<Transform2D> rootAncestorTransform() const override {
    if (!mapped_) {
      return std::nullopt;
    }
    Transform2D transform{};
    transform.offsetX = kMarginLeft;
    transform.offsetY = kMarginTop;
    return transform;
  }

  ScaleFactor scalingFactor() const override { return ScaleFactor{scale_, scale_}; }

  HostAnchor presentationSurfaceHandle() const override {
    if (!mapped_) {
      return HostAnchor{};
    }
    return HostAnchor{static_cast<uint64_t>(window_)};
  }

  LogicalSize actualSize() const override {
    double width = static_cast<double>(deviceWidth_) / scale_ - 2.0 * kMarginLeft;
    double height = static_cast<double>(deviceHeight_) / scale_ - kMarginTop - kMarginLeft;
    return LogicalSize{width > 0.0 ? width : 0.0, height > 0.0 ? height : 0.0};
  }

  void post(std::function<void()> task) override { posted_.push_back(std::move(task)); }

  void runPosted() {
    while (!posted_.empty()) {
      auto task = std::move(posted_.front());
      posted_.pop_front();
      task();
    }
  }

  void layoutUpdated() {
    std::deque<std::function<void()>> callbacks;
    for (const auto& entry : layoutCallbacks_) {
      callbacks.push_back(entry.second);
    }
    for (const auto& callback : callbacks) {
      callback();
    }
  }

  void setMapped(bool mapped) { mapped_ = mapped; }

  void resize(unsigned int width, unsigned int height) {
    deviceWidth_ = width;
    deviceHeight_ = height;
  }

  void setVisible(bool visible) {
    visible_ = visible;
    if (listener_) {
      listener_->visibilityChanged(visible);
    }
  }

  bool visible() const { return visible_; }

  void gotFocus() {
    if (listener_) {
      listener_->gotFocus();
    }
  }

  bool previewKeyDown(uint32_t keyCode) {
    KeyDownEvent event{};
    event.keyCode = keyCode;
    if (listener_) {
      listener_->previewKeyDown(event);
    }
    return event.handled;
  }

private:
  Window window_ = None;
  double scale_ = 1.0;
  SurfaceListener* listener_ = nullptr;
  std::map<LayoutSubscriptionId, std::function<void()>> layoutCallbacks_;
  LayoutSubscriptionId nextId_ = 1u;
  std::deque<std::function<void()>> posted_;
  unsigned int deviceWidth_ = kInitialWidth;
  unsigned int deviceHeight_ = kInitialHeight;
  bool mapped_ = false;
  bool visible_ = false;
};

} // namespace

int main(int argc, char** argv) {
  std::cout << "PrimeEmbed v" << PrimeEmbedVersion << " X11 host example" << std::endl;

  if (argc < 2) {
    std::cerr << "usage: " << argv[0] << " <window-id> [scale]\n";
    return 1;
  }
  auto windowId = parse_window_id(argv[1]);
  if (!windowId) {
    std::cerr << "invalid window id: " << argv[1] << "\n";
    return 1;
  }
  double scale = 1.0;
  if (argc > 2) {
    try {
      scale = std::stod(argv[2]);
    } catch (const std::exception&) {
      std::cerr << "invalid scale: " << argv[2] << "\n";
      return 1;
    }
    if (!(scale > 0.0)) {
      std::cerr << "scale must be positive\n";
      return 1;
    }
  }

  Display* display = XOpenDisplay(nullptr);
  if (!display) {
    std::cerr << "cannot open X display\n";
    return 1;
  }

  Window hostWindow = XCreateSimpleWindow(display, DefaultRootWindow(display), 0, 0, kInitialWidth, kInitialHeight,
                                          0, BlackPixel(display, DefaultScreen(display)),
                                          WhitePixel(display, DefaultScreen(display)));
  XStoreName(display, hostWindow, "PrimeEmbed Host");
  XSelectInput(display, hostWindow,
               StructureNotifyMask | KeyPressMask | ButtonPressMask | FocusChangeMask | ExposureMask);
  Atom wmDelete = XInternAtom(display, "WM_DELETE_WINDOW", False);
  XSetWMProtocols(display, hostWindow, &wmDelete, 1);

  auto apiResult = createNativeWindowApi();
  if (!apiResult) {
    std::cerr << "native window api unavailable (" << static_cast<int>(apiResult.error().code) << ")\n";
    XDestroyWindow(display, hostWindow);
    XCloseDisplay(display);
    return 1;
  }
  auto api = std::move(apiResult.value());

  X11HostSurface host(hostWindow, scale);
  auto surfaceResult = createEmbeddingSurface(NativeWindowHandle{*windowId}, host, *api);
  if (!surfaceResult) {
    std::cerr << "failed to create embedding surface (" << static_cast<int>(surfaceResult.error().code)
              << ")\n";
    XDestroyWindow(display, hostWindow);
    XCloseDisplay(display);
    return 1;
  }
  auto surface = std::move(surfaceResult.value());
  surface->setLogCallback([](LogLevel level, Utf8TextView message) {
    std::cout << "[embed " << level_label(level) << "] " << message << "\n";
  });

  XMapWindow(display, hostWindow);
  XFlush(display);

  std::cout << "Controls: click the host window to toggle the embedded window, V shows it, ESC quits."
            << std::endl;

  bool running = true;
  while (running) {
    XEvent event{};
    XNextEvent(display, &event);
    switch (event.type) {
      case MapNotify:
        host.setMapped(true);
        if (!host.visible()) {
          host.setVisible(true);
        }
        break;
      case UnmapNotify:
        if (host.visible()) {
          host.setVisible(false);
        }
        host.setMapped(false);
        break;
      case ConfigureNotify:
        host.resize(static_cast<unsigned int>(event.xconfigure.width),
                    static_cast<unsigned int>(event.xconfigure.height));
        host.layoutUpdated();
        break;
      case Expose:
        if (event.xexpose.count == 0) {
          host.layoutUpdated();
        }
        break;
      case FocusIn:
        if (host.visible()) {
          host.gotFocus();
        }
        break;
      case ButtonPress:
        host.setVisible(!host.visible());
        break;
      case KeyPress: {
        KeySym keysym = XLookupKeysym(&event.xkey, 0);
        if (host.visible()) {
          if (host.previewKeyDown(static_cast<uint32_t>(keysym))) {
            break;
          }
        }
        if (keysym == XK_Escape) {
          running = false;
        } else if (keysym == XK_v) {
          host.setVisible(true);
        }
        break;
      }
      case ClientMessage:
        if (static_cast<Atom>(event.xclient.data.l[0]) == wmDelete) {
          running = false;
        }
        break;
      default:
        break;
    }
    host.runPosted();
  }

  if (host.visible()) {
    host.setVisible(false);
    host.runPosted();
  }
  surface.reset();
  XDestroyWindow(display, hostWindow);
  XCloseDisplay(display);
  return 0;
}
