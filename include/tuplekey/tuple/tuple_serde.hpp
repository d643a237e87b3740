#pragma once

#include "tuplekey/tuple/element.hpp"

#include <string>

namespace tuplekey {

/// Rendering of decoded tuples for tools and logs.
class TupleSerde {
public:
  /// Convert the tuple to a JSON array with one {"type", "value"} object per
  /// element. Integers, floats and doubles are written as strings so that
  /// arbitrary precision and NaN survive, bytes as upper case hex, nested
  /// tuples as nested arrays. Versionstamps are objects of their numeric
  /// fields, an incomplete one holds only "user_version".
  static std::string ToJson(const Tuple& tuple);
};

} // namespace tuplekey
