#include "tuple_dump.hpp"

#include "tuplekey/base/hex.hpp"
#include "tuplekey/base/log.hpp"
#include "tuplekey/tuple/tuple_codec.hpp"
#include "tuplekey/tuple/tuple_serde.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <format>
#include <iostream>
#include <string>

namespace tuplekey {

int TupleDump::Run() {
  if (print_format_ == Format::kUnknown) {
    std::cerr << "Unknown format, available: text, json" << std::endl;
    return EXIT_FAILURE;
  }

  if (!hex_.empty()) {
    return DumpOne(hex_) ? EXIT_SUCCESS : EXIT_FAILURE;
  }

  bool all_ok = true;
  uint64_t num_keys = 0;
  std::string line;
  while (std::getline(std::cin, line)) {
    if (line.empty()) {
      continue;
    }
    num_keys++;
    all_ok = DumpOne(line) && all_ok;
  }
  Log::Info("Dumped {} keys from stdin", num_keys);
  return all_ok ? EXIT_SUCCESS : EXIT_FAILURE;
}

bool TupleDump::DumpOne(std::string_view hex) {
  // Lambda for error report
  auto report_error = [&](const Error& error) {
    std::cerr << hex << ": " << error << std::endl;
    return false;
  };

  auto bytes = FromHex(hex);
  if (!bytes) {
    return report_error(bytes.error());
  }

  Slice key(bytes.value());
  if (key.size() < prefix_len_) {
    return report_error(Error::InvalidArgument(
        std::format("key is {} bytes, shorter than prefix of {} bytes", key.size(), prefix_len_)));
  }
  key.remove_prefix(prefix_len_);

  auto tuple = TupleCodec::Decode(key);
  if (!tuple) {
    return report_error(tuple.error());
  }

  Log::Debug("Decoded key, size={}, elements={}", bytes.value().size(), tuple.value().size());
  std::cout << FormatTuple(tuple.value(), print_format_) << std::endl;
  return true;
}

TupleDump::Format TupleDump::FormatFromString(std::string_view format) {
  static constexpr const char* kTuplePrintFormatNames[] = {
      "unknown",
      "text",
      "json",
  };

  auto lower_format = std::string(format.size(), '\0');
  std::ranges::transform(format, lower_format.begin(), ::tolower);

  if (lower_format == kTuplePrintFormatNames[static_cast<int>(Format::kText)]) {
    return Format::kText;
  }
  if (lower_format == kTuplePrintFormatNames[static_cast<int>(Format::kJson)]) {
    return Format::kJson;
  }
  return Format::kUnknown;
}

std::string TupleDump::FormatTuple(const Tuple& tuple, Format format) {
  switch (format) {
  case Format::kJson: {
    return TupleSerde::ToJson(tuple);
  }
  case Format::kText:
  default: {
    return ToString(tuple);
  }
  }
}

} // namespace tuplekey
