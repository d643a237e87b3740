#include "base/json.hpp"
#include "common/tuple_test_suite.hpp"
#include "tuplekey/tuple/element.hpp"
#include "tuplekey/tuple/tuple_serde.hpp"

#include <gtest/gtest.h>

#include <string>

namespace tuplekey::test {

class TupleSerdeTest : public TupleTestSuite {
protected:
  static utils::JsonArray Parse(const std::string& json) {
    utils::JsonArray json_array;
    auto res = json_array.Deserialize(json);
    EXPECT_TRUE(res) << json;
    return json_array;
  }

  static void ExpectStringValue(const utils::JsonArray& json_array, size_t index,
                                std::string_view type, std::string_view value) {
    auto json_obj = json_array.GetJsonObj(index);
    ASSERT_TRUE(json_obj.has_value()) << "index=" << index;
    ASSERT_EQ(json_obj->GetString("type"), type);
    ASSERT_EQ(json_obj->GetString("value"), value);
  }
};

TEST_F(TupleSerdeTest, EmptyTuple) {
  ASSERT_EQ(TupleSerde::ToJson(Tuple{}), "[]");
}

TEST_F(TupleSerdeTest, ScalarElements) {
  Tuple tuple = {Null{},
                 Bytes{MakeBytes({0x00, 0xab})},
                 Text{"users"},
                 Int(Int(1) << 80),
                 -42,
                 1.5f,
                 -0.25,
                 true,
                 Uuid(0x87245765, 0xc8d142f8, 0x8529ff2f, 0x5e20e2fc)};
  auto json_array = Parse(TupleSerde::ToJson(tuple));
  ASSERT_EQ(json_array.Size(), tuple.size());

  auto null_obj = json_array.GetJsonObj(0);
  ASSERT_TRUE(null_obj.has_value());
  ASSERT_EQ(null_obj->GetString("type"), "null");
  ASSERT_FALSE(null_obj->HasMember("value"));

  ExpectStringValue(json_array, 1, "bytes", "00AB");
  ExpectStringValue(json_array, 2, "text", "users");
  ExpectStringValue(json_array, 3, "int", "1208925819614629174706176");
  ExpectStringValue(json_array, 4, "int", "-42");
  ExpectStringValue(json_array, 5, "float", "1.5");
  ExpectStringValue(json_array, 6, "double", "-0.25");

  auto bool_obj = json_array.GetJsonObj(7);
  ASSERT_TRUE(bool_obj.has_value());
  ASSERT_EQ(bool_obj->GetString("type"), "bool");
  ASSERT_EQ(bool_obj->GetBool("value"), true);

  ExpectStringValue(json_array, 8, "uuid", "87245765-c8d1-42f8-8529-ff2f5e20e2fc");
}

TEST_F(TupleSerdeTest, VersionStamps) {
  Tuple tuple = {CompleteVersionStamp(0xdeadbeef, 3, 12), IncompleteVersionStamp(7)};
  auto json_array = Parse(TupleSerde::ToJson(tuple));
  ASSERT_EQ(json_array.Size(), 2u);

  auto complete = json_array.GetJsonObj(0);
  ASSERT_TRUE(complete.has_value());
  ASSERT_EQ(complete->GetString("type"), "versionstamp");
  auto complete_value = complete->GetJsonObj("value");
  ASSERT_TRUE(complete_value.has_value());
  ASSERT_EQ(complete_value->GetUint64("tx_version"), 0xdeadbeefu);
  ASSERT_EQ(complete_value->GetUint64("batch_number"), 3u);
  ASSERT_EQ(complete_value->GetUint64("user_version"), 12u);

  auto incomplete = json_array.GetJsonObj(1);
  ASSERT_TRUE(incomplete.has_value());
  ASSERT_EQ(incomplete->GetString("type"), "incomplete_versionstamp");
  auto incomplete_value = incomplete->GetJsonObj("value");
  ASSERT_TRUE(incomplete_value.has_value());
  ASSERT_FALSE(incomplete_value->HasMember("tx_version"));
  ASSERT_EQ(incomplete_value->GetUint64("user_version"), 7u);
}

TEST_F(TupleSerdeTest, NestedTuple) {
  Tuple tuple = {Element(Tuple{Null{}, Element(Tuple{Text{"deep"}})}), false};
  auto json_array = Parse(TupleSerde::ToJson(tuple));
  ASSERT_EQ(json_array.Size(), 2u);

  auto nested = json_array.GetJsonObj(0);
  ASSERT_TRUE(nested.has_value());
  ASSERT_EQ(nested->GetString("type"), "tuple");
  auto nested_array = nested->GetJsonArray("value");
  ASSERT_TRUE(nested_array.has_value());
  ASSERT_EQ(nested_array->Size(), 2u);

  auto inner = nested_array->GetJsonObj(1);
  ASSERT_TRUE(inner.has_value());
  auto inner_array = inner->GetJsonArray("value");
  ASSERT_TRUE(inner_array.has_value());
  ExpectStringValue(*inner_array, 0, "text", "deep");
}

} // namespace tuplekey::test
