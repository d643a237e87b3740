#pragma once

#include "tuplekey/base/result.hpp"

#define RAPIDJSON_NAMESPACE tuplekey::rapidjson
#define RAPIDJSON_NAMESPACE_BEGIN namespace tuplekey::rapidjson {
#define RAPIDJSON_NAMESPACE_END }

#include <rapidjson/document.h>

#undef RAPIDJSON_NAMESPACE_END
#undef RAPIDJSON_NAMESPACE_BEGIN
#undef RAPIDJSON_NAMESPACE

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tuplekey::utils {

class JsonArray;

/// A JSON object owning its rapidjson document. Values are copied in on add
/// and copied out on get, so objects can be nested freely. Move-only.
class JsonObj {
public:
  JsonObj();
  ~JsonObj() = default;

  JsonObj(const JsonObj&) = delete;
  JsonObj& operator=(const JsonObj&) = delete;

  JsonObj(JsonObj&& other) noexcept;
  JsonObj& operator=(JsonObj&& other) noexcept;

  void AddBool(std::string_view key, bool value);
  void AddUint64(std::string_view key, uint64_t value);
  void AddString(std::string_view key, std::string_view value);
  void AddJsonObj(std::string_view key, const JsonObj& value);
  void AddJsonArray(std::string_view key, const JsonArray& value);

  /// Getters return std::nullopt when the member is missing or has another
  /// JSON type.
  std::optional<bool> GetBool(std::string_view key) const;
  std::optional<uint64_t> GetUint64(std::string_view key) const;
  std::optional<std::string_view> GetString(std::string_view key) const;
  std::optional<JsonObj> GetJsonObj(std::string_view key) const;
  std::optional<JsonArray> GetJsonArray(std::string_view key) const;
  bool HasMember(std::string_view key) const;

private:
  const rapidjson::Value* FindMember(std::string_view key) const;

  void AddMember(std::string_view key, rapidjson::Value& value);

  rapidjson::Document doc_;

  friend class JsonArray;
};

/// A JSON array of objects. Move-only.
class JsonArray {
public:
  JsonArray();
  ~JsonArray() = default;

  JsonArray(const JsonArray&) = delete;
  JsonArray& operator=(const JsonArray&) = delete;

  JsonArray(JsonArray&& other) noexcept;
  JsonArray& operator=(JsonArray&& other) noexcept;

  /// Compact JSON text of the array.
  std::string Serialize() const;

  /// Replace the content with the parsed JSON text, which must be an array.
  Result<void> Deserialize(std::string_view json);

  void AppendJsonObj(const JsonObj& value);

  /// Returns the object at index, std::nullopt when out of range or not an
  /// object.
  std::optional<JsonObj> GetJsonObj(size_t index) const;

  uint64_t Size() const;

private:
  rapidjson::Document doc_;

  friend class JsonObj;
};

} // namespace tuplekey::utils
