#pragma once

#include "tuplekey/tuple/element.hpp"

namespace tuplekey {

/// Semantic three-way comparison of two elements, returns <0, 0, or >0.
///
/// Elements of different types order by type: null, bytes, text, tuple, int,
/// float, double, bool, uuid, versionstamp. Within a type, integers compare
/// numerically, floats and doubles by IEEE-754 total order (-NaN first, NaN
/// last, -0.0 before 0.0), bytes and text byte-wise, tuples element-wise with
/// a prefix first, versionstamps by their fields with the fields of an
/// incomplete stamp taken as all ones.
///
/// The sign of the result always equals the sign of comparing the encodings
/// of the two elements byte-wise.
int Compare(const Element& lhs, const Element& rhs);

/// Element-wise comparison, a tuple sorts before any tuple it is a prefix of.
int Compare(const Tuple& lhs, const Tuple& rhs);

} // namespace tuplekey
