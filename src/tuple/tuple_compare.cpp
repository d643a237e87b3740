#include "tuplekey/tuple/tuple_compare.hpp"

#include "tuplekey/base/slice.hpp"

#include <algorithm>
#include <bit>
#include <cstdint>

namespace tuplekey {

namespace {

/// Rank of the element type in the key order. Complete and incomplete
/// versionstamps share a rank since they share a tag.
int TypeRank(ElementType type) {
  switch (type) {
  case ElementType::kNull:
    return 0;
  case ElementType::kBytes:
    return 1;
  case ElementType::kText:
    return 2;
  case ElementType::kTuple:
    return 3;
  case ElementType::kInt:
    return 4;
  case ElementType::kFloat:
    return 5;
  case ElementType::kDouble:
    return 6;
  case ElementType::kBool:
    return 7;
  case ElementType::kUuid:
    return 8;
  case ElementType::kVersionStamp:
  case ElementType::kIncompleteVersionStamp:
  default:
    return 9;
  }
}

template <typename T>
int ThreeWay(const T& lhs, const T& rhs) {
  if (lhs < rhs) {
    return -1;
  }
  return rhs < lhs ? 1 : 0;
}

// IEEE-754 total order key, the same transformation the encoding applies.
uint32_t TotalOrderKey(float f) {
  auto u = std::bit_cast<uint32_t>(f);
  return (u & 0x80000000u) ? ~u : (u | 0x80000000u);
}

uint64_t TotalOrderKey(double d) {
  auto u = std::bit_cast<uint64_t>(d);
  return (u & 0x8000000000000000ull) ? ~u : (u | 0x8000000000000000ull);
}

CompleteVersionStamp AsComplete(const Element& element) {
  if (element.Is<IncompleteVersionStamp>()) {
    return element.As<IncompleteVersionStamp>().Complete(UINT64_MAX, UINT16_MAX);
  }
  return element.As<CompleteVersionStamp>();
}

} // namespace

int Compare(const Element& lhs, const Element& rhs) {
  auto lhs_rank = TypeRank(lhs.GetType());
  auto rhs_rank = TypeRank(rhs.GetType());
  if (lhs_rank != rhs_rank) {
    return ThreeWay(lhs_rank, rhs_rank);
  }

  switch (lhs.GetType()) {
  case ElementType::kNull:
    return 0;
  case ElementType::kBytes:
    return Slice::Compare(lhs.As<Bytes>().data_, rhs.As<Bytes>().data_);
  case ElementType::kText:
    return Slice::Compare(lhs.As<Text>().data_, rhs.As<Text>().data_);
  case ElementType::kTuple:
    return Compare(lhs.As<Tuple>(), rhs.As<Tuple>());
  case ElementType::kInt:
    return lhs.As<Int>().compare(rhs.As<Int>());
  case ElementType::kFloat:
    return ThreeWay(TotalOrderKey(lhs.As<float>()), TotalOrderKey(rhs.As<float>()));
  case ElementType::kDouble:
    return ThreeWay(TotalOrderKey(lhs.As<double>()), TotalOrderKey(rhs.As<double>()));
  case ElementType::kBool:
    return ThreeWay(lhs.As<bool>(), rhs.As<bool>());
  case ElementType::kUuid:
    return ThreeWay(lhs.As<Uuid>(), rhs.As<Uuid>());
  case ElementType::kVersionStamp:
  case ElementType::kIncompleteVersionStamp:
    return ThreeWay(AsComplete(lhs), AsComplete(rhs));
  }
  return 0;
}

int Compare(const Tuple& lhs, const Tuple& rhs) {
  const auto common = std::min(lhs.size(), rhs.size());
  for (size_t i = 0; i < common; i++) {
    if (auto cmp = Compare(lhs[i], rhs[i]); cmp != 0) {
      return cmp;
    }
  }
  return ThreeWay(lhs.size(), rhs.size());
}

} // namespace tuplekey
