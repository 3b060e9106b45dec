#pragma once

#include <eavdb/core/types.h>

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace eavdb::codec {

/**
 * @brief Attribute value
 *
 * A JSON document restricted to the kinds enumerated by ValueType. Binary
 * and discarded documents, and non-finite numbers, are rejected by serialize().
 */
using Value = nlohmann::json;

/**
 * @brief Attribute values keyed by attribute name
 */
using AttrMap = std::map<std::string, Value>;

/**
 * @brief Discriminant of the supported value kinds
 */
enum class ValueType { String, Number, Bool, Null, Array, Map };

/**
 * @brief Tag persisted in the attribute row's type column
 */
constexpr const char* valueTypeName(ValueType type) {
    switch (type) {
        case ValueType::String: return "string";
        case ValueType::Number: return "number";
        case ValueType::Bool: return "bool";
        case ValueType::Null: return "null";
        case ValueType::Array: return "array";
        case ValueType::Map: return "map";
    }
    return "string";
}

std::optional<ValueType> valueTypeFromName(std::string_view name);

/**
 * @brief Classify a value; SerializationError for unsupported kinds
 */
Result<ValueType> valueTypeOf(const Value& value);

/**
 * @brief Stored form of an attribute value
 */
struct SerializedValue {
    std::optional<std::string> typeTag;  ///< nullopt for verbatim strings
    std::string text;
};

/**
 * @brief Convert a value to its stored form
 *
 * Strings are stored verbatim without a tag; every other kind is stored as
 * JSON text tagged with valueTypeName().
 */
Result<SerializedValue> serialize(const Value& value);

/**
 * @brief Inverse of serialize()
 *
 * A tag other than "string" means the text is JSON; no tag returns the text
 * unchanged.
 */
Result<Value> deserialize(const std::string& text, const std::optional<std::string>& typeTag);

} // namespace eavdb::codec
