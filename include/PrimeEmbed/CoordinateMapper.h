#pragma once

#include <cmath>
#include <cstdint>
#include <limits>

#include "PrimeEmbed/Embed.h"

namespace PrimeEmbed {

inline int32_t truncateToDevice(double value) {
  if (!std::isfinite(value)) {
    return 0;
  }
  constexpr double kMax = static_cast<double>(std::numeric_limits<int32_t>::max());
  constexpr double kMin = static_cast<double>(std::numeric_limits<int32_t>::min());
  if (value >= kMax) {
    return std::numeric_limits<int32_t>::max();
  }
  if (value <= kMin) {
    return std::numeric_limits<int32_t>::min();
  }
  return static_cast<int32_t>(std::trunc(value));
}

inline DeviceRect mapToDevice(LogicalPoint offset, LogicalSize size, ScaleFactor scale) {
  DeviceRect rect{};
  rect.x = truncateToDevice(offset.x * scale.x);
  rect.y = truncateToDevice(offset.y * scale.y);
  rect.width = truncateToDevice(size.width * scale.x);
  rect.height = truncateToDevice(size.height * scale.y);
  return rect;
}

inline DeviceRect mapToDevice(const LayoutSnapshot& snapshot) {
  return mapToDevice(snapshot.offset, snapshot.size, snapshot.scale);
}

} // namespace PrimeEmbed
