#include "base/json.hpp"

#include "tuplekey/base/error.hpp"
#include "tuplekey/base/result.hpp"

#define RAPIDJSON_NAMESPACE tuplekey::rapidjson
#define RAPIDJSON_NAMESPACE_BEGIN namespace tuplekey::rapidjson {
#define RAPIDJSON_NAMESPACE_END }

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#undef RAPIDJSON_NAMESPACE_END
#undef RAPIDJSON_NAMESPACE_BEGIN
#undef RAPIDJSON_NAMESPACE

#include <cstdint>
#include <format>
#include <string>
#include <string_view>

namespace tuplekey::utils {

//------------------------------------------------------------------------------
// JsonObj
//------------------------------------------------------------------------------

JsonObj::JsonObj() {
  doc_.SetObject();
}

JsonObj::JsonObj(JsonObj&& other) noexcept {
  doc_.SetObject();
  doc_.Swap(other.doc_);
}

JsonObj& JsonObj::operator=(JsonObj&& other) noexcept {
  if (this != &other) {
    doc_.SetObject();
    doc_.Swap(other.doc_);
  }
  return *this;
}

void JsonObj::AddMember(std::string_view key, rapidjson::Value& value) {
  auto& allocator = doc_.GetAllocator();
  rapidjson::Value name(key.data(), static_cast<rapidjson::SizeType>(key.size()), allocator);
  doc_.AddMember(name, value, allocator);
}

void JsonObj::AddBool(std::string_view key, bool value) {
  rapidjson::Value json_value(value);
  AddMember(key, json_value);
}

void JsonObj::AddUint64(std::string_view key, uint64_t value) {
  rapidjson::Value json_value(value);
  AddMember(key, json_value);
}

void JsonObj::AddString(std::string_view key, std::string_view value) {
  rapidjson::Value json_value(value.data(), static_cast<rapidjson::SizeType>(value.size()),
                              doc_.GetAllocator());
  AddMember(key, json_value);
}

void JsonObj::AddJsonObj(std::string_view key, const JsonObj& value) {
  rapidjson::Value json_value(value.doc_, doc_.GetAllocator());
  AddMember(key, json_value);
}

void JsonObj::AddJsonArray(std::string_view key, const JsonArray& value) {
  rapidjson::Value json_value(value.doc_, doc_.GetAllocator());
  AddMember(key, json_value);
}

const rapidjson::Value* JsonObj::FindMember(std::string_view key) const {
  auto it = doc_.FindMember(
      rapidjson::Value(rapidjson::StringRef(key.data(), static_cast<rapidjson::SizeType>(key.size()))));
  return it == doc_.MemberEnd() ? nullptr : &it->value;
}

std::optional<bool> JsonObj::GetBool(std::string_view key) const {
  const auto* value = FindMember(key);
  if (value == nullptr || !value->IsBool()) {
    return std::nullopt;
  }
  return value->GetBool();
}

std::optional<uint64_t> JsonObj::GetUint64(std::string_view key) const {
  const auto* value = FindMember(key);
  if (value == nullptr || !value->IsUint64()) {
    return std::nullopt;
  }
  return value->GetUint64();
}

std::optional<std::string_view> JsonObj::GetString(std::string_view key) const {
  const auto* value = FindMember(key);
  if (value == nullptr || !value->IsString()) {
    return std::nullopt;
  }
  return std::string_view(value->GetString(), value->GetStringLength());
}

std::optional<JsonObj> JsonObj::GetJsonObj(std::string_view key) const {
  const auto* value = FindMember(key);
  if (value == nullptr || !value->IsObject()) {
    return std::nullopt;
  }
  JsonObj json_obj;
  json_obj.doc_.CopyFrom(*value, json_obj.doc_.GetAllocator());
  return json_obj;
}

std::optional<JsonArray> JsonObj::GetJsonArray(std::string_view key) const {
  const auto* value = FindMember(key);
  if (value == nullptr || !value->IsArray()) {
    return std::nullopt;
  }
  JsonArray json_array;
  json_array.doc_.CopyFrom(*value, json_array.doc_.GetAllocator());
  return json_array;
}

bool JsonObj::HasMember(std::string_view key) const {
  return FindMember(key) != nullptr;
}

//------------------------------------------------------------------------------
// JsonArray
//------------------------------------------------------------------------------

JsonArray::JsonArray() {
  doc_.SetArray();
}

JsonArray::JsonArray(JsonArray&& other) noexcept {
  doc_.SetArray();
  doc_.Swap(other.doc_);
}

JsonArray& JsonArray::operator=(JsonArray&& other) noexcept {
  if (this != &other) {
    doc_.SetArray();
    doc_.Swap(other.doc_);
  }
  return *this;
}

std::string JsonArray::Serialize() const {
  rapidjson::StringBuffer buffer;
  rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
  doc_.Accept(writer);
  return std::string(buffer.GetString(), buffer.GetSize());
}

Result<void> JsonArray::Deserialize(std::string_view json) {
  doc_.Parse(json.data(), json.size());
  if (doc_.HasParseError()) {
    auto offset = doc_.GetErrorOffset();
    doc_.SetArray();
    return Error::General(std::format("Failed to parse JSON, offset={}, json={}", offset, json));
  }
  if (!doc_.IsArray()) {
    doc_.SetArray();
    return Error::General(std::format("JSON is not an array, json={}", json));
  }
  return {};
}

void JsonArray::AppendJsonObj(const JsonObj& value) {
  rapidjson::Value json_value(value.doc_, doc_.GetAllocator());
  doc_.PushBack(json_value, doc_.GetAllocator());
}

std::optional<JsonObj> JsonArray::GetJsonObj(size_t index) const {
  if (index >= doc_.Size() || !doc_[static_cast<rapidjson::SizeType>(index)].IsObject()) {
    return std::nullopt;
  }
  JsonObj json_obj;
  json_obj.doc_.CopyFrom(doc_[static_cast<rapidjson::SizeType>(index)], json_obj.doc_.GetAllocator());
  return json_obj;
}

uint64_t JsonArray::Size() const {
  return doc_.Size();
}

} // namespace tuplekey::utils
