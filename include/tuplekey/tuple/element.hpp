#pragma once

#include "tuplekey/base/enum_traits.hpp"
#include "tuplekey/base/result.hpp"
#include "tuplekey/tuple/versionstamp.hpp"

#include <boost/multiprecision/cpp_int.hpp>

#include <array>
#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace tuplekey {

class Element;

/// An ordered sequence of elements, encoded as one key or as a nested tuple.
using Tuple = std::vector<Element>;

/// Arbitrary-precision signed integer.
using Int = boost::multiprecision::cpp_int;

/// The null element.
struct Null {
  bool operator==(const Null&) const = default;
};

/// A byte string element.
struct Bytes {
  std::string data_;

  bool operator==(const Bytes&) const = default;
};

/// A unicode string element, stored as UTF-8.
struct Text {
  std::string data_;

  bool operator==(const Text&) const = default;
};

/// A 128-bit UUID held as four 32-bit words, most significant word first.
class Uuid {
public:
  Uuid() = default;

  Uuid(uint32_t w0, uint32_t w1, uint32_t w2, uint32_t w3) : words_{w0, w1, w2, w3} {
  }

  /// Parses the canonical 8-4-4-4-12 hex form, either case.
  static Result<Uuid> FromString(std::string_view str);

  const std::array<uint32_t, 4>& Words() const {
    return words_;
  }

  /// Lower case 8-4-4-4-12 form.
  std::string ToString() const;

  friend auto operator<=>(const Uuid&, const Uuid&) = default;

private:
  std::array<uint32_t, 4> words_ = {0, 0, 0, 0};
};

/// Element types, in the order of the alternatives held by Element.
enum class ElementType : uint8_t {
  kNull = 0,
  kBytes,
  kText,
  kTuple,
  kInt,
  kFloat,
  kDouble,
  kBool,
  kUuid,
  kVersionStamp,
  kIncompleteVersionStamp,
};

template <>
struct EnumTraits<ElementType> {
  static std::string_view ToString(ElementType type) {
    static constexpr std::string_view kNames[] = {
        "null",  "bytes", "text", "tuple",        "int",
        "float", "double", "bool", "uuid", "versionstamp", "incomplete_versionstamp",
    };
    return kNames[static_cast<uint8_t>(type)];
  }
};

/// One value of a tuple. Element is a closed union of the types the tuple
/// encoding supports, it is an immutable value type compared structurally.
///
/// Float and double elements compare by their IEEE-754 bit patterns: a NaN
/// equals a NaN with the same bits, and -0.0 differs from 0.0.
///
/// Example usage:
///   Tuple key = {Element(Text{"users"}), Element(42), Element(Null{})};
///   auto nested = Element(Tuple{Element(true), Element(1.5)});
class Element {
public:
  using value_t = std::variant<Null, Bytes, Text, Tuple, Int, float, double, bool, Uuid,
                               CompleteVersionStamp, IncompleteVersionStamp>;

  /// Construct a null element.
  Element() : value_(Null{}) {
  }

  Element(Null v) : value_(v) { // NOLINT (google-explicit-constructor)
  }

  Element(Bytes v) : value_(std::move(v)) { // NOLINT (google-explicit-constructor)
  }

  Element(Text v) : value_(std::move(v)) { // NOLINT (google-explicit-constructor)
  }

  Element(Tuple v) : value_(std::move(v)) { // NOLINT (google-explicit-constructor)
  }

  Element(Int v) : value_(std::move(v)) { // NOLINT (google-explicit-constructor)
  }

  /// Construct an integer element from any built-in integer type.
  template <std::integral T>
    requires(!std::same_as<T, bool>)
  Element(T v) : value_(Int(v)) { // NOLINT (google-explicit-constructor)
  }

  Element(float v) : value_(v) { // NOLINT (google-explicit-constructor)
  }

  Element(double v) : value_(v) { // NOLINT (google-explicit-constructor)
  }

  Element(bool v) : value_(v) { // NOLINT (google-explicit-constructor)
  }

  /// String literals must say whether they are Bytes or Text.
  Element(const char*) = delete;

  Element(Uuid v) : value_(v) { // NOLINT (google-explicit-constructor)
  }

  Element(CompleteVersionStamp v) : value_(v) { // NOLINT (google-explicit-constructor)
  }

  Element(IncompleteVersionStamp v) : value_(v) { // NOLINT (google-explicit-constructor)
  }

  ElementType GetType() const {
    return static_cast<ElementType>(value_.index());
  }

  template <typename T>
  bool Is() const {
    return std::holds_alternative<T>(value_);
  }

  /// Typed access, the element must hold a T.
  template <typename T>
  const T& As() const {
    return std::get<T>(value_);
  }

  bool operator==(const Element& other) const;

  bool operator!=(const Element& other) const {
    return !(*this == other);
  }

private:
  value_t value_;
};

/// Human-readable rendering, e.g. ("users", 42, b"\x00\x01", null, 1.5f).
std::string ToString(const Element& element);
std::string ToString(const Tuple& tuple);

/// Number of incomplete versionstamps in the tuple, nested tuples included.
size_t CountIncompleteVersionStamps(const Tuple& tuple);

} // namespace tuplekey
