#pragma once

#include "PrimeEmbed/Embed.h"

namespace PrimeEmbed {

inline EmbedStatus validateEmbedConfig(const EmbedConfig& config) {
  if (config.parkPosition.x >= 0 || config.parkPosition.y >= 0) {
    return std::unexpected(EmbedError{EmbedErrorCode::InvalidConfig});
  }
  return {};
}

inline EmbedStatus validateEmbedHandle(NativeWindowHandle handle) {
  if (!handle.isValid()) {
    return std::unexpected(EmbedError{EmbedErrorCode::InvalidHandle});
  }
  return {};
}

} // namespace PrimeEmbed
