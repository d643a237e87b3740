#pragma once

#include "tuplekey/base/result.hpp"
#include "tuplekey/base/slice.hpp"
#include "tuplekey/config/codec_option.hpp"
#include "tuplekey/tuple/element.hpp"

#include <cstdint>
#include <string>

namespace tuplekey {

/// Type tags of the order-preserving tuple encoding. Tags sort in the same
/// order as the types they introduce.
enum class TupleTag : uint8_t {
  kNull = 0x00,
  kBytes = 0x01,
  kText = 0x02,
  kNested = 0x05,
  kNegIntArbitrary = 0x0B, // followed by the complemented length byte
  kIntZero = 0x14,         // 0x0C..0x13 negative, 0x15..0x1C positive, by byte length
  kPosIntArbitrary = 0x1D, // followed by the length byte
  kFloat = 0x20,
  kDouble = 0x21,
  kFalse = 0x26,
  kTrue = 0x27,
  kUuid = 0x30,
  kVersionStamp = 0x33,
};

/// Codec between tuples and their order-preserving byte encoding. The
/// unsigned byte-wise order of two encodings is the order of the tuples they
/// encode, so encoded tuples are used directly as keys of the store.
///
/// All methods are pure functions of their inputs and safe to call from any
/// thread.
class TupleCodec {
public:
  /// Terminator of byte strings, text and nested tuples.
  static constexpr uint8_t kTerminator = 0x00;

  /// Second byte of an escaped 0x00 inside byte strings and text, and of a
  /// null element inside a nested tuple.
  static constexpr uint8_t kEscape = 0xFF;

  /// Size of the versionstamp offset trailer.
  static constexpr size_t kVersionstampTrailerSize = 2;

  /// Largest integer magnitude in bytes, bounded by the length byte of the
  /// arbitrary-precision integer forms.
  static constexpr size_t kMaxIntBytes = 255;

  /// Encode a tuple. Fails only for integers larger than kMaxIntBytes bytes.
  ///
  /// An IncompleteVersionStamp is written as its 12-byte placeholder without
  /// any offset trailer, the result does not decode back to the incomplete
  /// stamp: it decodes as a complete stamp whose version fields are all ones.
  /// Use EncodeForVersionstampedMutation() for keys handed to the database.
  static Result<std::string> Encode(const Tuple& tuple);

  /// Append the encoding of a tuple to dest. dest is left unchanged on error.
  static Result<void> EncodeTo(const Tuple& tuple, std::string& dest);

  /// Encode a tuple as the key argument of a set-versionstamped-key mutation:
  /// prefix, then the tuple encoding, then a 2-byte little-endian trailer
  /// holding the offset of the 10-byte placeholder from the start of the
  /// returned buffer. The database patches the placeholder with the commit
  /// version and strips the trailer.
  ///
  /// The tuple must contain exactly one IncompleteVersionStamp, nested tuples
  /// included.
  static Result<std::string> EncodeForVersionstampedMutation(const Tuple& tuple,
                                                             Slice prefix = {});

  /// Decode a tuple from its full encoding. Any malformed input fails the
  /// whole decode, no partial tuple is returned.
  static Result<Tuple> Decode(Slice encoded, const CodecOption& option = {});
};

} // namespace tuplekey
