#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "PrimeEmbed/Embed.h"

namespace PrimeEmbed {

class EmbedLog {
public:
  void setCallback(LogCallback callback) { callback_ = std::move(callback); }

  void log(LogLevel level, Utf8TextView message) const {
    if (!callback_) {
      return;
    }
    callback_(level, message);
  }

  void debug(Utf8TextView message) const { log(LogLevel::Debug, message); }

private:
  LogCallback callback_;
};

inline std::string failureMessage(std::string_view operation, const EmbedError& error) {
  std::string message(operation);
  message += " failed (code ";
  message += std::to_string(static_cast<int>(error.code));
  message += ")";
  return message;
}

} // namespace PrimeEmbed
