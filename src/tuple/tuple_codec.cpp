#include "tuplekey/tuple/tuple_codec.hpp"

#include "tuple/big_endian.hpp"
#include "tuplekey/base/error.hpp"
#include "tuplekey/base/hex.hpp"
#include "tuplekey/base/log.hpp"

#include <bit>
#include <cstdint>
#include <iterator>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tuplekey {

namespace {

constexpr uint8_t ToByte(TupleTag tag) {
  return static_cast<uint8_t>(tag);
}

constexpr uint32_t kFloatSignBit = 0x80000000u;
constexpr uint64_t kDoubleSignBit = 0x8000000000000000ull;

/// Largest integer byte length expressed by the tag alone.
constexpr size_t kMaxTagIntBytes = 8;

/// Largest offset the 2-byte versionstamp trailer can hold.
constexpr size_t kMaxVersionstampOffset = std::numeric_limits<uint16_t>::max();

// Flip the sign bit of non-negative values and all bits of negative values,
// so that the big-endian bit patterns sort in numeric order.
inline uint32_t EncodeFloat32(float f) {
  auto u = std::bit_cast<uint32_t>(f);
  return (u & kFloatSignBit) ? ~u : (u | kFloatSignBit);
}

inline float DecodeFloat32(uint32_t u) {
  u = (u & kFloatSignBit) ? (u ^ kFloatSignBit) : ~u;
  return std::bit_cast<float>(u);
}

inline uint64_t EncodeFloat64(double d) {
  auto u = std::bit_cast<uint64_t>(d);
  return (u & kDoubleSignBit) ? ~u : (u | kDoubleSignBit);
}

inline double DecodeFloat64(uint64_t u) {
  u = (u & kDoubleSignBit) ? (u ^ kDoubleSignBit) : ~u;
  return std::bit_cast<double>(u);
}

/// Checks well-formed UTF-8: no overlong forms, no surrogates, nothing above
/// U+10FFFF.
bool IsValidUtf8(std::string_view str) {
  const auto* data = reinterpret_cast<const uint8_t*>(str.data());
  size_t size = str.size();
  size_t i = 0;
  while (i < size) {
    uint8_t lead = data[i];
    if (lead < 0x80) {
      i++;
      continue;
    }

    size_t len = 0;
    uint8_t lower = 0x80;
    uint8_t upper = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
      len = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
      len = 3;
      if (lead == 0xE0) {
        lower = 0xA0;
      } else if (lead == 0xED) {
        upper = 0x9F;
      }
    } else if (lead >= 0xF0 && lead <= 0xF4) {
      len = 4;
      if (lead == 0xF0) {
        lower = 0x90;
      } else if (lead == 0xF4) {
        upper = 0x8F;
      }
    } else {
      return false;
    }

    if (i + len > size) {
      return false;
    }
    // the range restriction applies to the second byte only
    if (data[i + 1] < lower || data[i + 1] > upper) {
      return false;
    }
    for (size_t j = 2; j < len; j++) {
      if (data[i + j] < 0x80 || data[i + j] > 0xBF) {
        return false;
      }
    }
    i += len;
  }
  return true;
}

/// Appends the encoding of elements to a destination buffer, recording where
/// incomplete versionstamp placeholders start.
class TupleEncoder {
public:
  explicit TupleEncoder(std::string& dest) : dest_(dest) {
  }

  Result<void> EncodeTuple(const Tuple& tuple, bool nested) {
    for (const auto& element : tuple) {
      if (auto res = EncodeElement(element, nested); !res) {
        return std::move(res).error();
      }
    }
    return {};
  }

  const std::vector<size_t>& PlaceholderOffsets() const {
    return placeholder_offsets_;
  }

private:
  Result<void> EncodeElement(const Element& element, bool nested) {
    switch (element.GetType()) {
    case ElementType::kNull: {
      PutTag(TupleTag::kNull);
      if (nested) {
        dest_.push_back(static_cast<char>(TupleCodec::kEscape));
      }
      return {};
    }
    case ElementType::kBytes: {
      EncodeEscaped(TupleTag::kBytes, element.As<Bytes>().data_);
      return {};
    }
    case ElementType::kText: {
      EncodeEscaped(TupleTag::kText, element.As<Text>().data_);
      return {};
    }
    case ElementType::kTuple: {
      PutTag(TupleTag::kNested);
      if (auto res = EncodeTuple(element.As<Tuple>(), true); !res) {
        return std::move(res).error();
      }
      dest_.push_back(static_cast<char>(TupleCodec::kTerminator));
      return {};
    }
    case ElementType::kInt: {
      return EncodeInt(element.As<Int>());
    }
    case ElementType::kFloat: {
      PutTag(TupleTag::kFloat);
      AppendBigEndian(dest_, EncodeFloat32(element.As<float>()), 4);
      return {};
    }
    case ElementType::kDouble: {
      PutTag(TupleTag::kDouble);
      AppendBigEndian(dest_, EncodeFloat64(element.As<double>()), 8);
      return {};
    }
    case ElementType::kBool: {
      PutTag(element.As<bool>() ? TupleTag::kTrue : TupleTag::kFalse);
      return {};
    }
    case ElementType::kUuid: {
      PutTag(TupleTag::kUuid);
      for (auto word : element.As<Uuid>().Words()) {
        AppendBigEndian(dest_, word, 4);
      }
      return {};
    }
    case ElementType::kVersionStamp: {
      PutTag(TupleTag::kVersionStamp);
      element.As<CompleteVersionStamp>().EncodeTo(dest_);
      return {};
    }
    case ElementType::kIncompleteVersionStamp: {
      PutTag(TupleTag::kVersionStamp);
      placeholder_offsets_.push_back(dest_.size());
      element.As<IncompleteVersionStamp>().EncodeTo(dest_);
      return {};
    }
    }
    return Error::NotImplemented("unsupported element type");
  }

  void PutTag(TupleTag tag) {
    dest_.push_back(static_cast<char>(ToByte(tag)));
  }

  void EncodeEscaped(TupleTag tag, const std::string& data) {
    PutTag(tag);
    for (char c : data) {
      dest_.push_back(c);
      if (static_cast<uint8_t>(c) == TupleCodec::kTerminator) {
        dest_.push_back(static_cast<char>(TupleCodec::kEscape));
      }
    }
    dest_.push_back(static_cast<char>(TupleCodec::kTerminator));
  }

  /// Zero has its own tag. Other values write their magnitude big-endian in
  /// the fewest bytes, the byte count is folded into the tag for up to 8
  /// bytes and written after an extreme tag beyond that. Negative values
  /// write the one's complement of the magnitude and of the length byte, so
  /// larger magnitudes sort first.
  Result<void> EncodeInt(const Int& value) {
    if (value == 0) {
      PutTag(TupleTag::kIntZero);
      return {};
    }

    const bool negative = value < 0;
    const Int abs_value = boost::multiprecision::abs(value);
    std::vector<uint8_t> magnitude;
    boost::multiprecision::export_bits(abs_value, std::back_inserter(magnitude), 8);
    const size_t num_bytes = magnitude.size();
    if (num_bytes > TupleCodec::kMaxIntBytes) {
      return Error::IntegerOutOfRange(num_bytes, TupleCodec::kMaxIntBytes);
    }

    const uint8_t zero = ToByte(TupleTag::kIntZero);
    if (!negative) {
      if (num_bytes <= kMaxTagIntBytes) {
        dest_.push_back(static_cast<char>(zero + num_bytes));
      } else {
        PutTag(TupleTag::kPosIntArbitrary);
        dest_.push_back(static_cast<char>(num_bytes));
      }
      dest_.append(magnitude.begin(), magnitude.end());
      return {};
    }

    if (num_bytes <= kMaxTagIntBytes) {
      dest_.push_back(static_cast<char>(zero - num_bytes));
    } else {
      PutTag(TupleTag::kNegIntArbitrary);
      dest_.push_back(static_cast<char>(num_bytes ^ 0xFF));
    }
    for (auto b : magnitude) {
      dest_.push_back(static_cast<char>(static_cast<uint8_t>(~b)));
    }
    return {};
  }

  std::string& dest_;
  std::vector<size_t> placeholder_offsets_;
};

/// Single pass decoder over one encoded tuple. Every element starts with its
/// tag byte, nested tuples recurse until their terminator.
class TupleDecoder {
public:
  TupleDecoder(Slice input, const CodecOption& option) : input_(input), option_(option) {
  }

  /// Decode elements until the input is exhausted.
  Result<Tuple> DecodeAll() {
    Tuple tuple;
    while (pos_ < input_.size()) {
      auto tag_offset = pos_;
      auto tag = input_[pos_++];
      auto res = DecodeElement(tag, tag_offset, 0);
      if (!res) {
        return std::move(res).error();
      }
      tuple.push_back(std::move(res).value());
    }
    return tuple;
  }

private:
  bool Available(size_t n) const {
    return input_.size() - pos_ >= n;
  }

  Error Truncated(ElementType type) const {
    return Error::Truncated(EnumTraits<ElementType>::ToString(type), pos_);
  }

  Result<Element> DecodeElement(uint8_t tag, size_t tag_offset, uint32_t depth) {
    if (tag >= ToByte(TupleTag::kNegIntArbitrary) && tag <= ToByte(TupleTag::kPosIntArbitrary)) {
      return DecodeInt(tag);
    }

    switch (static_cast<TupleTag>(tag)) {
    case TupleTag::kNull: {
      return Element(Null{});
    }
    case TupleTag::kBytes: {
      auto res = DecodeEscaped(ElementType::kBytes);
      if (!res) {
        return std::move(res).error();
      }
      return Element(Bytes{std::move(res).value()});
    }
    case TupleTag::kText: {
      auto res = DecodeEscaped(ElementType::kText);
      if (!res) {
        return std::move(res).error();
      }
      if (!IsValidUtf8(res.value())) {
        return Error::InvalidUtf8(tag_offset);
      }
      return Element(Text{std::move(res).value()});
    }
    case TupleTag::kNested: {
      auto res = DecodeNested(tag_offset, depth + 1);
      if (!res) {
        return std::move(res).error();
      }
      return Element(std::move(res).value());
    }
    case TupleTag::kFloat: {
      if (!Available(4)) {
        return Truncated(ElementType::kFloat);
      }
      auto bits = static_cast<uint32_t>(FromBigEndian(input_.data() + pos_, 4));
      pos_ += 4;
      return Element(DecodeFloat32(bits));
    }
    case TupleTag::kDouble: {
      if (!Available(8)) {
        return Truncated(ElementType::kDouble);
      }
      auto bits = FromBigEndian(input_.data() + pos_, 8);
      pos_ += 8;
      return Element(DecodeFloat64(bits));
    }
    case TupleTag::kFalse: {
      return Element(false);
    }
    case TupleTag::kTrue: {
      return Element(true);
    }
    case TupleTag::kUuid: {
      if (!Available(16)) {
        return Truncated(ElementType::kUuid);
      }
      uint32_t words[4];
      for (int i = 0; i < 4; i++) {
        words[i] = static_cast<uint32_t>(FromBigEndian(input_.data() + pos_, 4));
        pos_ += 4;
      }
      return Element(Uuid(words[0], words[1], words[2], words[3]));
    }
    case TupleTag::kVersionStamp: {
      if (!Available(CompleteVersionStamp::kSize)) {
        return Truncated(ElementType::kVersionStamp);
      }
      auto res = CompleteVersionStamp::FromBytes(input_.SubSlice(pos_, CompleteVersionStamp::kSize));
      if (!res) {
        return std::move(res).error();
      }
      pos_ += CompleteVersionStamp::kSize;
      return Element(res.value());
    }
    default: {
      return Error::UnknownTag(static_cast<uint32_t>(tag), tag_offset);
    }
    }
  }

  /// Reads a byte string up to its unescaped terminator.
  Result<std::string> DecodeEscaped(ElementType type) {
    std::string data;
    while (true) {
      if (pos_ >= input_.size()) {
        return Truncated(type);
      }
      auto b = input_[pos_++];
      if (b == TupleCodec::kTerminator) {
        if (pos_ < input_.size() && input_[pos_] == TupleCodec::kEscape) {
          data.push_back('\0');
          pos_++;
          continue;
        }
        return data;
      }
      data.push_back(static_cast<char>(b));
    }
  }

  /// Reads nested elements up to the nested terminator. Inside a nested
  /// tuple a null element is written as 0x00 0xFF.
  Result<Tuple> DecodeNested(size_t start, uint32_t depth) {
    if (depth > option_.max_nesting_depth_) {
      return Error::NestingTooDeep(depth, option_.max_nesting_depth_);
    }

    Tuple tuple;
    while (true) {
      if (pos_ >= input_.size()) {
        return Error::InvalidNestedTuple(start);
      }
      auto tag_offset = pos_;
      auto tag = input_[pos_++];
      if (tag == TupleCodec::kTerminator) {
        if (pos_ < input_.size() && input_[pos_] == TupleCodec::kEscape) {
          pos_++;
          tuple.emplace_back(Null{});
          continue;
        }
        return tuple;
      }

      auto res = DecodeElement(tag, tag_offset, depth);
      if (!res) {
        return std::move(res).error();
      }
      tuple.push_back(std::move(res).value());
    }
  }

  Result<Element> DecodeInt(uint8_t tag) {
    const uint8_t zero = ToByte(TupleTag::kIntZero);
    if (tag == zero) {
      return Element(Int(0));
    }

    bool negative = tag < zero;
    size_t num_bytes = 0;
    if (tag == ToByte(TupleTag::kPosIntArbitrary) || tag == ToByte(TupleTag::kNegIntArbitrary)) {
      if (!Available(1)) {
        return Truncated(ElementType::kInt);
      }
      num_bytes = negative ? (input_[pos_] ^ 0xFF) : input_[pos_];
      pos_++;
    } else {
      num_bytes = negative ? (zero - tag) : (tag - zero);
    }

    if (!Available(num_bytes)) {
      return Truncated(ElementType::kInt);
    }
    if (num_bytes == 0) {
      return Element(Int(0));
    }
    std::vector<uint8_t> magnitude(input_.data() + pos_, input_.data() + pos_ + num_bytes);
    pos_ += num_bytes;
    if (negative) {
      for (auto& b : magnitude) {
        b = static_cast<uint8_t>(~b);
      }
    }

    Int value;
    boost::multiprecision::import_bits(value, magnitude.begin(), magnitude.end(), 8);
    if (negative) {
      value = -value;
    }
    return Element(std::move(value));
  }

  Slice input_;
  size_t pos_ = 0;
  const CodecOption& option_;
};

} // namespace

Result<std::string> TupleCodec::Encode(const Tuple& tuple) {
  std::string encoded;
  if (auto res = EncodeTo(tuple, encoded); !res) {
    return std::move(res).error();
  }
  return encoded;
}

Result<void> TupleCodec::EncodeTo(const Tuple& tuple, std::string& dest) {
  const auto orig_size = dest.size();
  TupleEncoder encoder(dest);
  if (auto res = encoder.EncodeTuple(tuple, false); !res) {
    dest.resize(orig_size);
    return std::move(res).error();
  }
  return {};
}

Result<std::string> TupleCodec::EncodeForVersionstampedMutation(const Tuple& tuple, Slice prefix) {
  auto num_stamps = CountIncompleteVersionStamps(tuple);
  if (num_stamps != 1) {
    return Error::VersionstampCount(num_stamps);
  }

  std::string encoded = prefix.ToString();
  TupleEncoder encoder(encoded);
  if (auto res = encoder.EncodeTuple(tuple, false); !res) {
    return std::move(res).error();
  }

  auto offset = encoder.PlaceholderOffsets().front();
  if (offset > kMaxVersionstampOffset) {
    return Error::VersionstampOffset(offset, kMaxVersionstampOffset);
  }
  AppendLittleEndian(encoded, offset, kVersionstampTrailerSize);
  return encoded;
}

Result<Tuple> TupleCodec::Decode(Slice encoded, const CodecOption& option) {
  auto res = TupleDecoder(encoded, option).DecodeAll();
  if (!res) {
    TK_DLOG("Decode tuple failed, error={}, input={}", res.error().ToString(), ToHex(encoded));
  }
  return res;
}

} // namespace tuplekey
