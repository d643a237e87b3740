#pragma once

#include <cstdint>

namespace tuplekey {

/// The options for decoding tuples.
struct CodecOption {
  static constexpr uint32_t kDefaultMaxNestingDepth = 256;

  /// Maximum depth of nested tuples accepted by the decoder. The top level
  /// tuple has depth 0, each nested tuple adds one.
  uint32_t max_nesting_depth_ = kDefaultMaxNestingDepth;
};

} // namespace tuplekey
