#pragma once
#include <string>
#include <utility>

namespace vc {

struct Error {
  std::string code;     // e.g. "UNKNOWN_INDICATOR"
  std::string message;  // human text
};

inline Error makeError(const char* code, std::string message) {
  Error e;
  e.code = code;
  e.message = std::move(message);
  return e;
}

} // namespace vc
