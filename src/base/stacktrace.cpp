#include "tuplekey/base/stacktrace.hpp"

#include <cpptrace/basic.hpp>

#include <cstddef>
#include <string>

namespace tuplekey {

std::string Stacktrace(size_t skip) {
  // +1 for this frame
  auto trace = cpptrace::generate_trace(skip + 1);
  return trace.to_string(false);
}

} // namespace tuplekey
