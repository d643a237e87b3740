#include "tuplekey/tuple/element.hpp"

#include "tuplekey/base/error.hpp"
#include "tuplekey/base/hex.hpp"

#include <bit>
#include <cstdint>
#include <format>
#include <string>
#include <string_view>

namespace tuplekey {

namespace {

// Positions of the dashes in the 8-4-4-4-12 form.
constexpr size_t kUuidStringSize = 36;
constexpr size_t kUuidDashes[] = {8, 13, 18, 23};

bool IsUuidDash(size_t pos) {
  for (auto dash : kUuidDashes) {
    if (pos == dash) {
      return true;
    }
  }
  return false;
}

std::string QuoteText(std::string_view text) {
  std::string quoted;
  quoted.reserve(text.size() + 2);
  quoted.push_back('"');
  for (char c : text) {
    auto b = static_cast<uint8_t>(c);
    if (c == '"' || c == '\\') {
      quoted.push_back('\\');
      quoted.push_back(c);
    } else if (b < 32 || b == 127) {
      quoted.append(std::format("\\x{:02x}", b));
    } else {
      // UTF-8 continuation and lead bytes are kept as they are
      quoted.push_back(c);
    }
  }
  quoted.push_back('"');
  return quoted;
}

} // namespace

Result<Uuid> Uuid::FromString(std::string_view str) {
  if (str.size() != kUuidStringSize) {
    return Error::InvalidUuid(str);
  }

  std::string hex;
  hex.reserve(32);
  for (size_t i = 0; i < str.size(); i++) {
    if (IsUuidDash(i)) {
      if (str[i] != '-') {
        return Error::InvalidUuid(str);
      }
      continue;
    }
    if (str[i] == ' ') {
      return Error::InvalidUuid(str);
    }
    hex.push_back(str[i]);
  }

  auto bytes = FromHex(hex);
  if (!bytes) {
    return Error::InvalidUuid(str);
  }

  const auto* data = reinterpret_cast<const uint8_t*>(bytes.value().data());
  uint32_t words[4];
  for (int i = 0; i < 4; i++) {
    words[i] = (static_cast<uint32_t>(data[i * 4]) << 24) |
               (static_cast<uint32_t>(data[i * 4 + 1]) << 16) |
               (static_cast<uint32_t>(data[i * 4 + 2]) << 8) | data[i * 4 + 3];
  }
  return Uuid(words[0], words[1], words[2], words[3]);
}

std::string Uuid::ToString() const {
  return std::format("{:08x}-{:04x}-{:04x}-{:04x}-{:04x}{:08x}", words_[0], words_[1] >> 16,
                     words_[1] & 0xFFFF, words_[2] >> 16, words_[2] & 0xFFFF, words_[3]);
}

bool Element::operator==(const Element& other) const {
  if (GetType() != other.GetType()) {
    return false;
  }

  switch (GetType()) {
  case ElementType::kNull:
    return true;
  case ElementType::kBytes:
    return As<Bytes>() == other.As<Bytes>();
  case ElementType::kText:
    return As<Text>() == other.As<Text>();
  case ElementType::kTuple:
    return As<Tuple>() == other.As<Tuple>();
  case ElementType::kInt:
    return As<Int>() == other.As<Int>();
  case ElementType::kFloat:
    return std::bit_cast<uint32_t>(As<float>()) == std::bit_cast<uint32_t>(other.As<float>());
  case ElementType::kDouble:
    return std::bit_cast<uint64_t>(As<double>()) == std::bit_cast<uint64_t>(other.As<double>());
  case ElementType::kBool:
    return As<bool>() == other.As<bool>();
  case ElementType::kUuid:
    return As<Uuid>() == other.As<Uuid>();
  case ElementType::kVersionStamp:
    return As<CompleteVersionStamp>() == other.As<CompleteVersionStamp>();
  case ElementType::kIncompleteVersionStamp:
    return As<IncompleteVersionStamp>() == other.As<IncompleteVersionStamp>();
  }
  return false;
}

std::string ToString(const Element& element) {
  switch (element.GetType()) {
  case ElementType::kNull:
    return "null";
  case ElementType::kBytes:
    return std::format("b\"{}\"", Printable(element.As<Bytes>().data_));
  case ElementType::kText:
    return QuoteText(element.As<Text>().data_);
  case ElementType::kTuple:
    return ToString(element.As<Tuple>());
  case ElementType::kInt:
    return element.As<Int>().str();
  case ElementType::kFloat:
    return std::format("{}f", element.As<float>());
  case ElementType::kDouble:
    return std::format("{}", element.As<double>());
  case ElementType::kBool:
    return element.As<bool>() ? "true" : "false";
  case ElementType::kUuid:
    return element.As<Uuid>().ToString();
  case ElementType::kVersionStamp:
    return element.As<CompleteVersionStamp>().ToString();
  case ElementType::kIncompleteVersionStamp:
    return element.As<IncompleteVersionStamp>().ToString();
  }
  return "";
}

std::string ToString(const Tuple& tuple) {
  std::string str = "(";
  for (size_t i = 0; i < tuple.size(); i++) {
    if (i > 0) {
      str.append(", ");
    }
    str.append(ToString(tuple[i]));
  }
  // single element tuples keep the trailing comma to read as a tuple
  if (tuple.size() == 1) {
    str.push_back(',');
  }
  str.push_back(')');
  return str;
}

size_t CountIncompleteVersionStamps(const Tuple& tuple) {
  size_t count = 0;
  for (const auto& element : tuple) {
    if (element.Is<IncompleteVersionStamp>()) {
      count++;
    } else if (element.Is<Tuple>()) {
      count += CountIncompleteVersionStamps(element.As<Tuple>());
    }
  }
  return count;
}

} // namespace tuplekey
