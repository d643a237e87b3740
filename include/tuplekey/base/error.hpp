#pragma once

#include "tuplekey/base/stacktrace.hpp"

#include <cstdint>
#include <format>
#include <ostream>
#include <string>

namespace tuplekey {

/// Forward declaration of Error class
class Error;

/// All the error code names, values, and message formats are listed in this macro.
///
/// To add a new error code, simply add a new line in this macro with the
/// format, all the other code will be generated automatically.
#define TK_ERROR_CODE_LIST(ACTION)                                                                 \
  ACTION(General, 1, "{}")                                                                         \
  ACTION(NotImplemented, 2, "{}")                                                                  \
  ACTION(InvalidArgument, 3, "{}")                                                                 \
  ACTION(Truncated, 200, "Input truncated while decoding {}, offset={}")                           \
  ACTION(UnknownTag, 201, "Unknown type tag, tag=0x{:02X}, offset={}")                             \
  ACTION(InvalidNestedTuple, 202, "Nested tuple missing terminator, start={}")                     \
  ACTION(InvalidUtf8, 203, "Text element is not valid UTF-8, offset={}")                           \
  ACTION(NestingTooDeep, 204, "Nested tuple too deep, depth={}, limit={}")                         \
  ACTION(IntegerOutOfRange, 205, "Integer too large to encode, bytes={}, max={}")                  \
  ACTION(VersionstampCount, 206, "Expected exactly one incomplete versionstamp, found={}")         \
  ACTION(VersionstampOffset, 207, "Versionstamp offset out of trailer range, offset={}, max={}")   \
  ACTION(InvalidHex, 208, "Invalid hex string, {}")                                                \
  ACTION(InvalidUuid, 209, "Invalid UUID string, uuid={}")

#define TK_ERROR_CODE(ename) k##ename

#define TK_ERROR_FMT(ename) k##ename##MsgFmt

#define TK_DEFINE_ERROR_CODE(ename, evalue, ...) TK_ERROR_CODE(ename) = evalue,

#define TK_DEFINE_ERROR_BUILDER(ename, ...)                                                        \
  template <typename... Args>                                                                      \
  static Error ename(Args&&... args) {                                                             \
    return Error(Error::Code::TK_ERROR_CODE(ename),                                                \
                 std::vformat(TK_ERROR_FMT(ename), std::make_format_args(args...)));               \
  }
#define TK_DEFINE_ERROR_FMT(ename, evalue, efmt, ...)                                              \
  static const constexpr char* TK_ERROR_FMT(ename) = efmt;

/// Representation of an error with code, message, and stack trace if available.
///
/// 1. All the error codes and corresponding message formats are listed in
///    TK_ERROR_CODE_LIST macro.
///
/// 2. Errors should be created using the static factory methods. All factory
///    method names are the same as the error code names. Factory method
///    arguments should match the format string parameters in the
///    TK_ERROR_CODE_LIST macro.
///
/// 3. Two errors are considered equal if they have the same error code and
///    message.
///
/// Example usage:
///   auto err1 = Error::General("A general error occurred");
///   auto err2 = Error::Truncated("bytes", offset);
///   auto err3 = std::move(err2);
class Error {
public:
  /// Error codes.
  enum Code : int64_t { TK_ERROR_CODE_LIST(TK_DEFINE_ERROR_CODE) };

  /// Returns the error code.
  Code GetCode() const {
    return code_;
  }

  /// Returns the error message without code and stack trace.
  const std::string& GetMessage() const {
    return message_;
  }

  /// Returns the string representation of the Error, including stack trace if available.
  std::string ToString() const {
    if (stacktrace_.empty()) {
      return std::format("[ERR-{:03}] {}", static_cast<int64_t>(code_), message_);
    }
    return std::format("[ERR-{:03}] {}\n{}", static_cast<int64_t>(code_), message_, stacktrace_);
  }

  /// Stream output operator for Error.
  friend std::ostream& operator<<(std::ostream& os, const Error& error) {
    return os << error.ToString();
  }

  /// Equality operator for Error.
  bool operator==(const Error& other) const {
    return code_ == other.code_ && message_ == other.message_;
  }

  /// Inequality operator for Error.
  bool operator!=(const Error& other) const {
    return !(*this == other);
  }

  /// Factory methods for creating errors for each error code.
  TK_ERROR_CODE_LIST(TK_DEFINE_ERROR_BUILDER);

private:
  /// Make constructor private to enforce usage of factory methods.
  Error(Code code, std::string&& message)
      : code_(code),
        message_(std::move(message)),
#ifdef DEBUG
        stacktrace_(Stacktrace(1))
#else
        stacktrace_("")
#endif
  {
  }

  /// Message formats for each error code.
  TK_ERROR_CODE_LIST(TK_DEFINE_ERROR_FMT);

  Code code_;              // error code.
  std::string message_;    // error message.
  std::string stacktrace_; // stack trace at error creation.
};

#undef TK_ERROR_CODE_LIST
#undef TK_ERROR_CODE
#undef TK_ERROR_FMT
#undef TK_DEFINE_ERROR_CODE
#undef TK_DEFINE_ERROR_BUILDER
#undef TK_DEFINE_ERROR_FMT

} // namespace tuplekey
