/**
 * @file ByteArray.cpp
 * @brief Diagnostic formatting for byte buffers.
 */

#include "src/core/inc/ByteArray.hpp"

#include <fmt/core.h>

namespace regiface {

/* ----------------------------- API ----------------------------- */

std::string toHexString(std::span<const std::uint8_t> bytes) {
  std::string out;
  out.reserve(2 + bytes.size() * 6);
  out.push_back('[');

  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += fmt::format("0x{:02x}", bytes[i]);
  }

  out.push_back(']');
  return out;
}

} // namespace regiface
