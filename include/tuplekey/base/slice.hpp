#pragma once

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <string_view>

namespace tuplekey {

/// Non-owning byte slice, read-only. Slices order by unsigned byte-wise
/// comparison, a shorter slice sorts first when it is a prefix of the other,
/// which is the order of keys in the store.
class Slice {
public:
  using const_slice_t = std::span<const uint8_t>;

  Slice() : slice_() {
  }

  Slice(const std::string& str) : slice_(reinterpret_cast<const uint8_t*>(str.data()), str.size()) {
  }

  Slice(std::string_view str) : slice_(reinterpret_cast<const uint8_t*>(str.data()), str.size()) {
  }

  Slice(const uint8_t* data, size_t size) : slice_(data, size) {
  }

  Slice(const char* data) : slice_(reinterpret_cast<const uint8_t*>(data), std::strlen(data)) {
  }

  Slice(const char* data, size_t size) : slice_(reinterpret_cast<const uint8_t*>(data), size) {
  }

  const uint8_t* data() const { // NOLINT: mimic std::string_view interface
    return slice_.data();
  }

  uint64_t size() const { // NOLINT: mimic std::string_view interface
    return slice_.size();
  }

  bool empty() const { // NOLINT: mimic std::string_view interface
    return slice_.empty();
  }

  void remove_prefix(size_t n) { // NOLINT: mimic std::string_view interface
    slice_ = slice_.subspan(n);
  }

  /// Returns the sub slice [offset, offset + length), clamped to the end.
  Slice SubSlice(size_t offset, size_t length = SIZE_MAX) const {
    offset = std::min<size_t>(offset, slice_.size());
    length = std::min<size_t>(length, slice_.size() - offset);
    return Slice(slice_.data() + offset, length);
  }

  /// Three-way byte-wise comparison, returns <0, 0, or >0 like memcmp.
  static int Compare(const Slice& lhs, const Slice& rhs) {
    const size_t min_size = std::min(lhs.slice_.size(), rhs.slice_.size());
    int cmp = min_size == 0 ? 0 : std::memcmp(lhs.slice_.data(), rhs.slice_.data(), min_size);
    if (cmp != 0) {
      return cmp;
    }
    if (lhs.slice_.size() == rhs.slice_.size()) {
      return 0;
    }
    return lhs.slice_.size() < rhs.slice_.size() ? -1 : 1;
  }

  friend bool operator==(const Slice& lhs, const Slice& rhs) {
    return Compare(lhs, rhs) == 0;
  }

  friend bool operator<(const Slice& lhs, const Slice& rhs) {
    return Compare(lhs, rhs) < 0;
  }

  friend bool operator<=(const Slice& lhs, const Slice& rhs) {
    return (lhs < rhs) || (lhs == rhs);
  }

  friend bool operator>(const Slice& lhs, const Slice& rhs) {
    return !(lhs <= rhs);
  }

  friend bool operator>=(const Slice& lhs, const Slice& rhs) {
    return !(lhs < rhs);
  }

  friend bool operator!=(const Slice& lhs, const Slice& rhs) {
    return !(lhs == rhs);
  }

  uint8_t operator[](size_t index) const {
    return slice_[index];
  }

  std::string ToString() const {
    return std::string(reinterpret_cast<const char*>(slice_.data()), slice_.size());
  }

private:
  const_slice_t slice_;
};

} // namespace tuplekey
