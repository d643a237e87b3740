#pragma once

#include <cstdint>
#include <string>

namespace tuplekey {

inline void AppendBigEndian(std::string& buf, uint64_t v, uint32_t bytes) {
  for (uint32_t i = 0; i < bytes; ++i) {
    uint32_t shift = (bytes - 1 - i) * 8;
    buf.push_back(static_cast<char>((v >> shift) & 0xFF));
  }
}

inline uint64_t FromBigEndian(const uint8_t* data, uint32_t bytes) {
  uint64_t v = 0;
  for (uint32_t i = 0; i < bytes; ++i) {
    v = (v << 8) | data[i];
  }
  return v;
}

inline void AppendLittleEndian(std::string& buf, uint64_t v, uint32_t bytes) {
  for (uint32_t i = 0; i < bytes; ++i) {
    buf.push_back(static_cast<char>((v >> (i * 8)) & 0xFF));
  }
}

} // namespace tuplekey
