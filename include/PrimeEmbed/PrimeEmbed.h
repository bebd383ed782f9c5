#pragma once

#include <cstdint>

#include "PrimeEmbed/CoordinateMapper.h"
#include "PrimeEmbed/Embed.h"
#include "PrimeEmbed/EmbedConfigValidation.h"
#include "PrimeEmbed/EmbeddingSurface.h"
#include "PrimeEmbed/HostSurface.h"
#include "PrimeEmbed/NativeWindowApi.h"

namespace PrimeEmbed {

constexpr uint32_t PrimeEmbedVersion = 1u;

} // namespace PrimeEmbed
