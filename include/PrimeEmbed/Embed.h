#pragma once

#include <cstdint>
#include <expected>
#include <functional>
#include <string_view>

namespace PrimeEmbed {

using Utf8TextView = std::string_view;

enum class EmbedErrorCode {
  Unsupported,
  PlatformFailure,
  InvalidHandle,
  InvalidConfig,
  Unknown,
};

struct EmbedError {
  EmbedErrorCode code = EmbedErrorCode::Unknown;
};

template <typename T>
using EmbedResult = std::expected<T, EmbedError>;

using EmbedStatus = std::expected<void, EmbedError>;

enum class LogLevel {
  Debug,
  Info,
  Warning,
  Error,
};

using LogCallback = std::function<void(LogLevel, Utf8TextView)>;

// Borrowed handle of the foreign window. PrimeEmbed never creates or destroys it.
struct NativeWindowHandle {
  uint64_t value = 0u;

  constexpr bool isValid() const { return value != 0u; }
};

constexpr bool operator==(NativeWindowHandle a, NativeWindowHandle b) { return a.value == b.value; }
constexpr bool operator!=(NativeWindowHandle a, NativeWindowHandle b) { return a.value != b.value; }

// Native handle of the container presenting the host's visual tree. Zero means none.
struct HostAnchor {
  uint64_t value = 0u;

  constexpr bool isValid() const { return value != 0u; }
};

constexpr bool operator==(HostAnchor a, HostAnchor b) { return a.value == b.value; }
constexpr bool operator!=(HostAnchor a, HostAnchor b) { return a.value != b.value; }

enum class EmbeddingState {
  Detached,
  Attached,
};

struct LogicalPoint {
  double x = 0.0;
  double y = 0.0;
};

struct LogicalSize {
  double width = 0.0;
  double height = 0.0;
};

struct ScaleFactor {
  double x = 1.0;
  double y = 1.0;
};

struct DevicePoint {
  int32_t x = 0;
  int32_t y = 0;
};

struct DeviceRect {
  int32_t x = 0;
  int32_t y = 0;
  int32_t width = 0;
  int32_t height = 0;
};

constexpr bool operator==(const DeviceRect& a, const DeviceRect& b) {
  return a.x == b.x && a.y == b.y && a.width == b.width && a.height == b.height;
}
constexpr bool operator!=(const DeviceRect& a, const DeviceRect& b) { return !(a == b); }

struct LayoutSnapshot {
  LogicalPoint offset{};
  LogicalSize size{};
  ScaleFactor scale{};
};

struct Transform2D {
  double m11 = 1.0;
  double m12 = 0.0;
  double m21 = 0.0;
  double m22 = 1.0;
  double offsetX = 0.0;
  double offsetY = 0.0;

  constexpr LogicalPoint apply(LogicalPoint point) const {
    return LogicalPoint{point.x * m11 + point.y * m21 + offsetX, point.x * m12 + point.y * m22 + offsetY};
  }
};

constexpr int32_t ParkedCoordinate = -32000;

struct EmbedConfig {
  DevicePoint parkPosition{ParkedCoordinate, ParkedCoordinate};
  bool repaintOnMove = true;
};

struct KeyDownEvent {
  uint32_t keyCode = 0u;
  bool repeat = false;
  bool handled = false;
};

} // namespace PrimeEmbed
