#include "common/tuple_test_suite.hpp"
#include "tuplekey/base/error.hpp"
#include "tuplekey/config/codec_option.hpp"
#include "tuplekey/tuple/element.hpp"
#include "tuplekey/tuple/tuple_codec.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

namespace tuplekey::test {

class TupleCodecTest : public TupleTestSuite {
protected:
  /// Wraps the element in the given number of nested tuples.
  static Tuple Nest(Element element, uint32_t levels) {
    for (uint32_t i = 0; i < levels; i++) {
      element = Element(Tuple{std::move(element)});
    }
    return Tuple{std::move(element)};
  }

  static Error::Code DecodeErrorCode(const std::string& encoded,
                                     const CodecOption& option = CodecOption{}) {
    auto res = TupleCodec::Decode(encoded, option);
    EXPECT_FALSE(res) << "input=" << ToHex(encoded);
    return res ? Error::Code::kGeneral : res.error().GetCode();
  }
};

TEST_F(TupleCodecTest, EmptyTuple) {
  ExpectEncoding(Tuple{}, "");
}

TEST_F(TupleCodecTest, Null) {
  ExpectEncoding(Tuple{Null{}}, MakeBytes({0x00}));
  ExpectEncoding(Tuple{Null{}, Null{}}, MakeBytes({0x00, 0x00}));
}

TEST_F(TupleCodecTest, Bytes) {
  ExpectEncoding(Tuple{Bytes{"hello"}}, MakeBytes({0x01, 'h', 'e', 'l', 'l', 'o', 0x00}));
  ExpectEncoding(Tuple{Bytes{""}}, MakeBytes({0x01, 0x00}));

  // embedded zeros are escaped, 0xFF is written as is
  ExpectEncoding(Tuple{Bytes{MakeBytes({0x00, 0xff})}}, MakeBytes({0x01, 0x00, 0xff, 0xff, 0x00}));
  ExpectEncoding(Tuple{Bytes{MakeBytes({'a', 0x00, 0x00})}},
                 MakeBytes({0x01, 'a', 0x00, 0xff, 0x00, 0xff, 0x00}));
}

TEST_F(TupleCodecTest, Text) {
  std::string unicode = "I\xC3\xB1t\xC3\xABrn\xC3\xA2ti\xC3\xB4n\xC3\xA0li\xC5\xBE\xC3\xA6ti\xC3\xB8n";
  std::string expected = MakeBytes({0x02}) + unicode + MakeBytes({0x00});
  ExpectEncoding(Tuple{Text{unicode}}, expected);

  ExpectEncoding(Tuple{Text{"a"}, Bytes{"a"}}, MakeBytes({0x02, 'a', 0x00, 0x01, 'a', 0x00}));
  ExpectEncoding(Tuple{Text{MakeBytes({'x', 0x00})}}, MakeBytes({0x02, 'x', 0x00, 0xff, 0x00}));
}

TEST_F(TupleCodecTest, NestedTuple) {
  ExpectEncoding(Tuple{Element(Tuple{Element(1)})}, MakeBytes({0x05, 0x15, 0x01, 0x00}));
  ExpectEncoding(Tuple{Element(Tuple{})}, MakeBytes({0x05, 0x00}));

  // null inside a nested tuple is escaped so it is not read as the terminator
  ExpectEncoding(Tuple{Element(Tuple{Null{}, Bytes{"a"}})},
                 MakeBytes({0x05, 0x00, 0xff, 0x01, 'a', 0x00, 0x00}));
  ExpectEncoding(Tuple{Element(Tuple{Element(Tuple{Null{}})}), Null{}},
                 MakeBytes({0x05, 0x05, 0x00, 0xff, 0x00, 0x00, 0x00}));
}

TEST_F(TupleCodecTest, SmallIntegers) {
  ExpectEncoding(Tuple{0}, MakeBytes({0x14}));
  ExpectEncoding(Tuple{1}, MakeBytes({0x15, 0x01}));
  ExpectEncoding(Tuple{-5}, MakeBytes({0x13, 0xfa}));
  ExpectEncoding(Tuple{123456789}, MakeBytes({0x18, 0x07, 0x5b, 0xcd, 0x15}));
  ExpectEncoding(Tuple{255}, MakeBytes({0x15, 0xff}));
  ExpectEncoding(Tuple{256}, MakeBytes({0x16, 0x01, 0x00}));
  ExpectEncoding(Tuple{-255}, MakeBytes({0x13, 0x00}));
  ExpectEncoding(Tuple{-256}, MakeBytes({0x12, 0xfe, 0xff}));
}

TEST_F(TupleCodecTest, IntegerLimits) {
  ExpectEncoding(Tuple{std::numeric_limits<uint64_t>::max()},
                 MakeBytes({0x1c, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff}));
  ExpectEncoding(Tuple{std::numeric_limits<int64_t>::max()},
                 MakeBytes({0x1c, 0x7f, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff}));
  ExpectEncoding(Tuple{std::numeric_limits<int64_t>::min()},
                 MakeBytes({0x0c, 0x7f, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff}));
}

TEST_F(TupleCodecTest, ArbitraryPrecisionIntegers) {
  Int two_pow_64 = Int(1) << 64;
  ExpectEncoding(Tuple{two_pow_64},
                 MakeBytes({0x1d, 0x09, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}));
  ExpectEncoding(Tuple{Int(-two_pow_64)},
                 MakeBytes({0x0b, 0xf6, 0xfe, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff}));

  // the largest magnitude the length byte can describe
  Int largest = (Int(1) << (8 * TupleCodec::kMaxIntBytes)) - 1;
  auto encoded = MustEncode(Tuple{largest});
  ASSERT_EQ(encoded.size(), 2 + TupleCodec::kMaxIntBytes);
  ASSERT_EQ(static_cast<uint8_t>(encoded[0]), 0x1d);
  ASSERT_EQ(static_cast<uint8_t>(encoded[1]), 0xff);
  ASSERT_EQ(MustDecode(encoded), Tuple{largest});

  encoded = MustEncode(Tuple{Int(-largest)});
  ASSERT_EQ(static_cast<uint8_t>(encoded[0]), 0x0b);
  ASSERT_EQ(static_cast<uint8_t>(encoded[1]), 0x00);
  ASSERT_EQ(MustDecode(encoded), Tuple{Int(-largest)});
}

TEST_F(TupleCodecTest, IntegerOutOfRange) {
  Int too_large = Int(1) << (8 * TupleCodec::kMaxIntBytes);
  auto res = TupleCodec::Encode(Tuple{Text{"k"}, too_large});
  ASSERT_FALSE(res);
  ASSERT_EQ(res.error().GetCode(), Error::Code::kIntegerOutOfRange);

  // a failed append leaves the destination as it was
  std::string dest = "prefix";
  auto append_res = TupleCodec::EncodeTo(Tuple{Text{"k"}, Int(-too_large)}, dest);
  ASSERT_FALSE(append_res);
  ASSERT_EQ(dest, "prefix");
}

TEST_F(TupleCodecTest, FloatingPoint) {
  ExpectEncoding(Tuple{1.5f}, MakeBytes({0x20, 0xbf, 0xc0, 0x00, 0x00}));
  ExpectEncoding(Tuple{1.5}, MakeBytes({0x21, 0xbf, 0xf8, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}));
  ExpectEncoding(Tuple{-1.5f}, MakeBytes({0x20, 0x40, 0x3f, 0xff, 0xff}));
  ExpectEncoding(Tuple{0.0}, MakeBytes({0x21, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}));
  ExpectEncoding(Tuple{-0.0}, MakeBytes({0x21, 0x7f, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff}));
}

TEST_F(TupleCodecTest, FloatingPointSpecialValues) {
  ExpectEncoding(Tuple{std::numeric_limits<double>::infinity()},
                 MakeBytes({0x21, 0xff, 0xf0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}));
  ExpectEncoding(Tuple{-std::numeric_limits<float>::infinity()},
                 MakeBytes({0x20, 0x00, 0x7f, 0xff, 0xff}));

  // NaN keeps its bit pattern
  auto decoded = MustDecode(MustEncode(Tuple{std::numeric_limits<double>::quiet_NaN()}));
  ASSERT_EQ(decoded.size(), 1u);
  ASSERT_TRUE(std::isnan(decoded[0].As<double>()));
  ASSERT_EQ(decoded, Tuple{std::numeric_limits<double>::quiet_NaN()});

  decoded = MustDecode(MustEncode(Tuple{std::numeric_limits<float>::denorm_min()}));
  ASSERT_EQ(decoded, Tuple{std::numeric_limits<float>::denorm_min()});
}

TEST_F(TupleCodecTest, Bool) {
  ExpectEncoding(Tuple{true}, MakeBytes({0x27}));
  ExpectEncoding(Tuple{false}, MakeBytes({0x26}));
}

TEST_F(TupleCodecTest, Uuid) {
  auto uuid = Uuid::FromString("87245765-c8d1-42f8-8529-ff2f5e20e2fc");
  ASSERT_TRUE(uuid);
  ExpectEncoding(Tuple{uuid.value()},
                 MakeBytes({48, 135, 36, 87, 101, 200, 209, 66, 248, 133, 41, 255, 47, 94, 32,
                            226, 252}));
}

TEST_F(TupleCodecTest, CompleteVersionStamp) {
  ExpectEncoding(Tuple{CompleteVersionStamp(0xdeadbeefdeadbeef, 0xbeef, 12)},
                 MakeBytes({51, 222, 173, 190, 239, 222, 173, 190, 239, 190, 239, 0, 12}));
}

TEST_F(TupleCodecTest, MixedTuple) {
  auto uuid = Uuid(1, 2, 3, 4);
  Tuple tuple = {Text{"users"},
                 42,
                 Null{},
                 Bytes{MakeBytes({0x00, 0x01})},
                 Element(Tuple{Null{}, -7, Text{""}, Element(Tuple{})}),
                 3.25f,
                 -2.5,
                 true,
                 uuid,
                 CompleteVersionStamp(7, 1, 2),
                 Int(Int(1) << 100)};
  ASSERT_EQ(MustDecode(MustEncode(tuple)), tuple);
}

TEST_F(TupleCodecTest, EncodeToAppends) {
  std::string dest = MakeBytes({0xfe});
  ASSERT_TRUE(TupleCodec::EncodeTo(Tuple{1}, dest));
  ASSERT_TRUE(TupleCodec::EncodeTo(Tuple{Null{}}, dest));
  ASSERT_EQ(dest, MakeBytes({0xfe, 0x15, 0x01, 0x00}));
}

TEST_F(TupleCodecTest, ConcatenationIsTupleConcatenation) {
  Tuple lhs = {Text{"a"}, 1};
  Tuple rhs = {Element(Tuple{Null{}}), false};
  Tuple both = {Text{"a"}, 1, Element(Tuple{Null{}}), false};
  ASSERT_EQ(MustEncode(lhs) + MustEncode(rhs), MustEncode(both));
}

TEST_F(TupleCodecTest, DecodeTruncated) {
  ASSERT_EQ(DecodeErrorCode(MakeBytes({0x01, 'a', 'b'})), Error::Code::kTruncated);
  ASSERT_EQ(DecodeErrorCode(MakeBytes({0x02})), Error::Code::kTruncated);
  ASSERT_EQ(DecodeErrorCode(MakeBytes({0x18, 0x07})), Error::Code::kTruncated);
  ASSERT_EQ(DecodeErrorCode(MakeBytes({0x1d})), Error::Code::kTruncated);
  ASSERT_EQ(DecodeErrorCode(MakeBytes({0x0b, 0xf6, 0xfe})), Error::Code::kTruncated);
  ASSERT_EQ(DecodeErrorCode(MakeBytes({0x20, 0xbf, 0xc0})), Error::Code::kTruncated);
  ASSERT_EQ(DecodeErrorCode(MakeBytes({0x21, 0xbf})), Error::Code::kTruncated);
  ASSERT_EQ(DecodeErrorCode(MakeBytes({0x30, 0x01, 0x02})), Error::Code::kTruncated);
  ASSERT_EQ(DecodeErrorCode(MakeBytes({0x33, 0x00, 0x00, 0x00})), Error::Code::kTruncated);
}

TEST_F(TupleCodecTest, DecodeUnknownTag) {
  auto res = TupleCodec::Decode(MakeBytes({0x14, 0x03}));
  ASSERT_FALSE(res);
  ASSERT_EQ(res.error(), Error::UnknownTag(0x03, 1));

  ASSERT_EQ(DecodeErrorCode(MakeBytes({0xff})), Error::Code::kUnknownTag);
  ASSERT_EQ(DecodeErrorCode(MakeBytes({0x05, 0x40, 0x00})), Error::Code::kUnknownTag);
}

TEST_F(TupleCodecTest, DecodeInvalidNestedTuple) {
  auto res = TupleCodec::Decode(MakeBytes({0x14, 0x05, 0x15, 0x01}));
  ASSERT_FALSE(res);
  ASSERT_EQ(res.error(), Error::InvalidNestedTuple(1));

  // an escaped null is not a terminator
  ASSERT_EQ(DecodeErrorCode(MakeBytes({0x05, 0x00, 0xff})), Error::Code::kInvalidNestedTuple);
}

TEST_F(TupleCodecTest, DecodeInvalidUtf8) {
  // overlong encoding of '/'
  ASSERT_EQ(DecodeErrorCode(MakeBytes({0x02, 0xc0, 0xaf, 0x00})), Error::Code::kInvalidUtf8);
  // UTF-16 surrogate
  ASSERT_EQ(DecodeErrorCode(MakeBytes({0x02, 0xed, 0xa0, 0x80, 0x00})), Error::Code::kInvalidUtf8);
  // lone continuation byte
  ASSERT_EQ(DecodeErrorCode(MakeBytes({0x02, 'a', 0x80, 0x00})), Error::Code::kInvalidUtf8);
  // cut multi-byte sequence
  ASSERT_EQ(DecodeErrorCode(MakeBytes({0x02, 0xe2, 0x82, 0x00})), Error::Code::kInvalidUtf8);

  // the same bytes are fine as a byte string
  ASSERT_EQ(MustDecode(MakeBytes({0x01, 0xc0, 0xaf, 0x00})),
            Tuple{Bytes{MakeBytes({0xc0, 0xaf})}});
}

TEST_F(TupleCodecTest, NestingDepth) {
  CodecOption option{.max_nesting_depth_ = 2};

  auto encoded = MustEncode(Nest(Element(1), 2));
  auto res = TupleCodec::Decode(encoded, option);
  ASSERT_TRUE(res) << res.error().ToString();
  ASSERT_EQ(res.value(), Nest(Element(1), 2));

  encoded = MustEncode(Nest(Element(1), 3));
  res = TupleCodec::Decode(encoded, option);
  ASSERT_FALSE(res);
  ASSERT_EQ(res.error(), Error::NestingTooDeep(3, 2));
}

TEST_F(TupleCodecTest, DefaultNestingDepth) {
  std::string encoded(CodecOption::kDefaultMaxNestingDepth + 1, static_cast<char>(0x05));
  encoded.append(CodecOption::kDefaultMaxNestingDepth + 1, static_cast<char>(0x00));
  ASSERT_EQ(DecodeErrorCode(encoded), Error::Code::kNestingTooDeep);

  auto nested = Nest(Null{}, CodecOption::kDefaultMaxNestingDepth);
  ASSERT_EQ(MustDecode(MustEncode(nested)), nested);
}

} // namespace tuplekey::test
