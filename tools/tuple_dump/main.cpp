#include "tuple_dump.hpp"

#include "tuplekey/base/enum_traits.hpp"
#include "tuplekey/base/log.hpp"
#include "tuplekey/config/log_option.hpp"

#include <tanakh-cmdline/cmdline.h>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

namespace {

constexpr auto kArgHex = "hex";
constexpr auto kArgPrefixLen = "prefix_len";
constexpr auto kArgFormat = "format";
constexpr auto kArgLogLevel = "log_level";

cmdline::parser ArgParse(int argc, char** argv) {
  cmdline::parser args;
  args.add<std::string>(kArgHex, 0, "Hex encoded key, read from stdin when omitted", false, "");
  args.add<uint64_t>(kArgPrefixLen, 0, "Number of subspace prefix bytes to skip", false, 0);
  args.add<std::string>(kArgFormat, 0, "Output format, available: text, json", false, "text");
  args.add<std::string>(kArgLogLevel, 0, "Log level, available: debug, info, warn, error", false,
                        "warn");
  args.parse_check(argc, argv);
  return args;
}

} // namespace

/// Entry point for the tuple command line tool.
int main(int argc, char** argv) {
  auto args = ArgParse(argc, argv);

  auto log_level = tuplekey::EnumTraits<tuplekey::LogLevel>::FromString(
      args.get<std::string>(kArgLogLevel));
  if (!log_level) {
    std::cerr << "Unknown log level: " << args.get<std::string>(kArgLogLevel) << std::endl;
    return EXIT_FAILURE;
  }
  tuplekey::Log::Init(tuplekey::LogOption{.level_ = *log_level, .log_file_ = ""});

  auto exit_code = tuplekey::TupleDump(args.get<std::string>(kArgHex),
                                       args.get<uint64_t>(kArgPrefixLen),
                                       args.get<std::string>(kArgFormat))
                       .Run();
  tuplekey::Log::Deinit();
  return exit_code;
}
