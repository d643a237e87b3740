#include "tuplekey/tuple/tuple_serde.hpp"

#include "base/json.hpp"
#include "tuplekey/base/enum_traits.hpp"
#include "tuplekey/base/hex.hpp"

#include <format>
#include <string>

namespace tuplekey {

namespace {

constexpr auto kType = "type";
constexpr auto kValue = "value";
constexpr auto kTxVersion = "tx_version";
constexpr auto kBatchNumber = "batch_number";
constexpr auto kUserVersion = "user_version";

utils::JsonArray ToJsonArray(const Tuple& tuple);

utils::JsonObj ToJsonObj(const Element& element) {
  utils::JsonObj json_obj;
  json_obj.AddString(kType, EnumTraits<ElementType>::ToString(element.GetType()));

  switch (element.GetType()) {
  case ElementType::kNull: {
    break;
  }
  case ElementType::kBytes: {
    json_obj.AddString(kValue, ToHex(element.As<Bytes>().data_));
    break;
  }
  case ElementType::kText: {
    json_obj.AddString(kValue, element.As<Text>().data_);
    break;
  }
  case ElementType::kTuple: {
    json_obj.AddJsonArray(kValue, ToJsonArray(element.As<Tuple>()));
    break;
  }
  case ElementType::kInt: {
    json_obj.AddString(kValue, element.As<Int>().str());
    break;
  }
  case ElementType::kFloat: {
    json_obj.AddString(kValue, std::format("{}", element.As<float>()));
    break;
  }
  case ElementType::kDouble: {
    json_obj.AddString(kValue, std::format("{}", element.As<double>()));
    break;
  }
  case ElementType::kBool: {
    json_obj.AddBool(kValue, element.As<bool>());
    break;
  }
  case ElementType::kUuid: {
    json_obj.AddString(kValue, element.As<Uuid>().ToString());
    break;
  }
  case ElementType::kVersionStamp: {
    const auto& stamp = element.As<CompleteVersionStamp>();
    utils::JsonObj stamp_obj;
    stamp_obj.AddUint64(kTxVersion, stamp.TxVersion());
    stamp_obj.AddUint64(kBatchNumber, stamp.BatchNumber());
    stamp_obj.AddUint64(kUserVersion, stamp.UserVersion());
    json_obj.AddJsonObj(kValue, stamp_obj);
    break;
  }
  case ElementType::kIncompleteVersionStamp: {
    utils::JsonObj stamp_obj;
    stamp_obj.AddUint64(kUserVersion, element.As<IncompleteVersionStamp>().UserVersion());
    json_obj.AddJsonObj(kValue, stamp_obj);
    break;
  }
  }
  return json_obj;
}

utils::JsonArray ToJsonArray(const Tuple& tuple) {
  utils::JsonArray json_array;
  for (const auto& element : tuple) {
    json_array.AppendJsonObj(ToJsonObj(element));
  }
  return json_array;
}

} // namespace

std::string TupleSerde::ToJson(const Tuple& tuple) {
  return ToJsonArray(tuple).Serialize();
}

} // namespace tuplekey
