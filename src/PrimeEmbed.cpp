#include "PrimeEmbed/PrimeEmbed.h"

#include "NativeWindowApiBackends.h"

namespace PrimeEmbed {

EmbedResult<std::unique_ptr<NativeWindowApi>> createNativeWindowApi() {
#if defined(__linux__)
  return createNativeWindowApiX11();
#elif defined(_WIN32)
  return createNativeWindowApiWin32();
#else
  return std::unexpected(EmbedError{EmbedErrorCode::Unsupported});
#endif
}

} // namespace PrimeEmbed
