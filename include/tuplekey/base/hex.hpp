#pragma once

#include "tuplekey/base/result.hpp"
#include "tuplekey/base/slice.hpp"

#include <string>
#include <string_view>

namespace tuplekey {

/// Upper case hex of every byte, two digits per byte.
inline std::string ToHex(Slice bytes) {
  static const char kHexDigits[] = "0123456789ABCDEF";
  std::string output;
  output.reserve(bytes.size() * 2);
  for (size_t i = 0U; i < bytes.size(); i++) {
    output.push_back(kHexDigits[bytes[i] >> 4]);
    output.push_back(kHexDigits[bytes[i] & 15]);
  }
  return output;
}

/// Parses hex digits of either case into bytes. Spaces are skipped so that
/// dumps like "15 01" are accepted.
Result<std::string> FromHex(std::string_view hex);

/// Renders bytes for humans: printable ASCII is kept, backslash is doubled
/// and every other byte is written as \xNN.
std::string Printable(Slice bytes);

} // namespace tuplekey
