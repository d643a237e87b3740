#pragma once

#include "tuplekey/base/error.hpp"
#include "tuplekey/tuple/element.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace tuplekey {

/// Tuple command line tool, decodes hex encoded keys and prints the tuples
/// they hold in human-readable format.
class TupleDump {
public:
  /// Print format
  enum class Format : uint8_t {
    kUnknown = 0,
    kText,
    kJson,
  };

  /// Constructor. An empty hex string makes Run() read one key per line from
  /// stdin.
  TupleDump(std::string_view hex, uint64_t prefix_len, std::string_view format)
      : hex_(hex),
        prefix_len_(prefix_len),
        print_format_(FormatFromString(format)) {
  }

  /// Run the tuple printer, returns the process exit code.
  int Run();

  /// Convert string to Format enum
  static Format FormatFromString(std::string_view format);

  /// Print a decoded tuple
  static std::string FormatTuple(const Tuple& tuple, Format format);

private:
  /// Decode and print one hex encoded key.
  bool DumpOne(std::string_view hex);

  /// Hex encoded key given on the command line.
  std::string hex_;

  /// Number of subspace prefix bytes to skip before the tuple.
  uint64_t prefix_len_;

  /// Print format
  Format print_format_;
};

} // namespace tuplekey
