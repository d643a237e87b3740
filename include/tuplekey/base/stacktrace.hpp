#pragma once

#include <cstddef>
#include <string>

namespace tuplekey {

/// Returns the call stack of the caller, one frame per line. The innermost
/// skip frames above the caller are left out.
std::string Stacktrace(size_t skip = 0);

} // namespace tuplekey
