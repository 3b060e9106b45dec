#include <cmath>
#include <eavdb/codec/value_codec.h>

namespace eavdb::codec {

namespace {

Result<void> checkSupported(const Value& value) {
    switch (value.type()) {
        case Value::value_t::null:
        case Value::value_t::boolean:
        case Value::value_t::string:
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned:
            return {};
        case Value::value_t::number_float:
            if (!std::isfinite(value.get<double>())) {
                return Error{ErrorCode::SerializationError, "non-finite number has no JSON form"};
            }
            return {};
        case Value::value_t::array:
        case Value::value_t::object:
            // Iteration over an object visits its member values
            for (const auto& element : value) {
                auto r = checkSupported(element);
                if (!r) return r;
            }
            return {};
        case Value::value_t::binary:
            return Error{ErrorCode::SerializationError, "binary values are not supported"};
        case Value::value_t::discarded:
            return Error{ErrorCode::SerializationError, "discarded value cannot be stored"};
    }
    return Error{ErrorCode::SerializationError, "unknown value kind"};
}

} // namespace

std::optional<ValueType> valueTypeFromName(std::string_view name) {
    for (auto type : {ValueType::String, ValueType::Number, ValueType::Bool, ValueType::Null,
                      ValueType::Array, ValueType::Map}) {
        if (name == valueTypeName(type)) {
            return type;
        }
    }
    return std::nullopt;
}

Result<ValueType> valueTypeOf(const Value& value) {
    auto supported = checkSupported(value);
    if (!supported) {
        return supported.error();
    }
    switch (value.type()) {
        case Value::value_t::string: return ValueType::String;
        case Value::value_t::boolean: return ValueType::Bool;
        case Value::value_t::null: return ValueType::Null;
        case Value::value_t::array: return ValueType::Array;
        case Value::value_t::object: return ValueType::Map;
        default: return ValueType::Number;
    }
}

Result<SerializedValue> serialize(const Value& value) {
    auto type = valueTypeOf(value);
    if (!type) {
        return type.error();
    }
    if (type.value() == ValueType::String) {
        return SerializedValue{std::nullopt, value.get<std::string>()};
    }
    try {
        return SerializedValue{std::string(valueTypeName(type.value())), value.dump()};
    } catch (const Value::exception& e) {
        // Strings nested in containers must be valid UTF-8
        return Error{ErrorCode::SerializationError, e.what()};
    }
}

Result<Value> deserialize(const std::string& text, const std::optional<std::string>& typeTag) {
    if (!typeTag || typeTag->empty() || *typeTag == valueTypeName(ValueType::String)) {
        return Value(text);
    }
    try {
        return Value::parse(text);
    } catch (const Value::exception& e) {
        return Error{ErrorCode::InvalidData,
                     "stored value tagged '" + *typeTag + "' is not valid JSON: " + e.what()};
    }
}

} // namespace eavdb::codec
