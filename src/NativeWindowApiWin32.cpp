#if defined(_WIN32)

#include "NativeWindowApiBackends.h"

#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <Windows.h>

#include <cstdint>
#include <memory>

namespace PrimeEmbed {
namespace {

HWND to_hwnd(NativeWindowHandle handle) {
  return reinterpret_cast<HWND>(static_cast<uintptr_t>(handle.value));
}

HWND to_hwnd(HostAnchor anchor) {
  return reinterpret_cast<HWND>(static_cast<uintptr_t>(anchor.value));
}

EmbedStatus platform_failure() {
  return std::unexpected(EmbedError{EmbedErrorCode::PlatformFailure});
}

EmbedStatus check_window(NativeWindowHandle window) {
  if (!window.isValid()) {
    return std::unexpected(EmbedError{EmbedErrorCode::InvalidHandle});
  }
  if (!::IsWindow(to_hwnd(window))) {
    return platform_failure();
  }
  return {};
}

class NativeWindowApiWin32 final : public NativeWindowApi {
public:
  EmbedStatus setChildStyle(NativeWindowHandle window) override {
    auto valid = check_window(window);
    if (!valid) {
      return valid;
    }
    // Same style bits an HwndHost child carries.
    constexpr LONG_PTR kChildStyle = WS_CHILDWINDOW | WS_VISIBLE | WS_CLIPCHILDREN;
    ::SetLastError(ERROR_SUCCESS);
    if (::SetWindowLongPtrW(to_hwnd(window), GWL_STYLE, kChildStyle) == 0 && ::GetLastError() != ERROR_SUCCESS) {
      return platform_failure();
    }
    return {};
  }

  EmbedStatus setParent(NativeWindowHandle window, HostAnchor parent) override {
    auto valid = check_window(window);
    if (!valid) {
      return valid;
    }
    // Connecting the windows couples both message queues until the window is detached.
    ::SetLastError(ERROR_SUCCESS);
    if (::SetParent(to_hwnd(window), parent.isValid() ? to_hwnd(parent) : nullptr) == nullptr &&
        ::GetLastError() != ERROR_SUCCESS) {
      return platform_failure();
    }
    return {};
  }

  EmbedStatus setVisible(NativeWindowHandle window, bool visible) override {
    auto valid = check_window(window);
    if (!valid) {
      return valid;
    }
    ::ShowWindow(to_hwnd(window), visible ? SW_SHOW : SW_HIDE);
    return {};
  }

  EmbedStatus sendActivation(NativeWindowHandle window, bool active) override {
    auto valid = check_window(window);
    if (!valid) {
      return valid;
    }
    ::SendMessageW(to_hwnd(window), WM_ACTIVATE, active ? WA_ACTIVE : WA_INACTIVE, 0);
    return {};
  }

  EmbedStatus moveResize(NativeWindowHandle window, const DeviceRect& rect, bool repaint) override {
    auto valid = check_window(window);
    if (!valid) {
      return valid;
    }
    if (!::MoveWindow(to_hwnd(window), rect.x, rect.y, rect.width, rect.height, repaint ? TRUE : FALSE)) {
      return platform_failure();
    }
    return {};
  }

  EmbedResult<DeviceRect> windowBounds(NativeWindowHandle window) const override {
    auto valid = check_window(window);
    if (!valid) {
      return std::unexpected(valid.error());
    }
    RECT rect{};
    if (!::GetWindowRect(to_hwnd(window), &rect)) {
      return std::unexpected(EmbedError{EmbedErrorCode::PlatformFailure});
    }
    return DeviceRect{rect.left, rect.top, rect.right - rect.left, rect.bottom - rect.top};
  }

  EmbedStatus setFocus(NativeWindowHandle window) override {
    auto valid = check_window(window);
    if (!valid) {
      return valid;
    }
    ::SetLastError(ERROR_SUCCESS);
    if (::SetFocus(to_hwnd(window)) == nullptr && ::GetLastError() != ERROR_SUCCESS) {
      return platform_failure();
    }
    return {};
  }
};

} // namespace

EmbedResult<std::unique_ptr<NativeWindowApi>> createNativeWindowApiWin32() {
  return std::make_unique<NativeWindowApiWin32>();
}

} // namespace PrimeEmbed

#endif
