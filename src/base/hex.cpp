#include "tuplekey/base/hex.hpp"

#include "tuplekey/base/error.hpp"

#include <format>
#include <string>

namespace tuplekey {

namespace {

int HexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

} // namespace

Result<std::string> FromHex(std::string_view hex) {
  std::string output;
  output.reserve(hex.size() / 2);

  int high = -1;
  for (size_t i = 0; i < hex.size(); i++) {
    if (hex[i] == ' ') {
      continue;
    }
    auto digit = HexValue(hex[i]);
    if (digit < 0) {
      return Error::InvalidHex(std::format("unexpected character at position {}", i));
    }
    if (high < 0) {
      high = digit;
      continue;
    }
    output.push_back(static_cast<char>((high << 4) | digit));
    high = -1;
  }

  if (high >= 0) {
    return Error::InvalidHex("odd number of digits");
  }
  return output;
}

std::string Printable(Slice bytes) {
  std::string output;
  output.reserve(bytes.size());
  for (size_t i = 0; i < bytes.size(); i++) {
    auto b = bytes[i];
    if (b == '\\') {
      output.append("\\\\");
    } else if (b >= 32 && b < 127) {
      output.push_back(static_cast<char>(b));
    } else {
      output.append(std::format("\\x{:02x}", b));
    }
  }
  return output;
}

} // namespace tuplekey
