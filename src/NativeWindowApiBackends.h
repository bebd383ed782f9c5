#pragma once

#include <memory>

#include "PrimeEmbed/NativeWindowApi.h"

namespace PrimeEmbed {

#if defined(__linux__)
EmbedResult<std::unique_ptr<NativeWindowApi>> createNativeWindowApiX11();
#elif defined(_WIN32)
EmbedResult<std::unique_ptr<NativeWindowApi>> createNativeWindowApiWin32();
#endif

} // namespace PrimeEmbed
