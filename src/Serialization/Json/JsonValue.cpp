// @file JsonValue.cpp
// @brief JsonValueの構築・参照・トークン列への書き戻し。

#include "Serialization/Json/JsonValue.hpp"

#include <stdexcept>

#include "Common/AsciiCase.hpp"
#include "Serialization/Json/JsonParser.hpp"

namespace kirikae::serialization {

namespace {

[[noreturn]] void kindError(const char* expected, const JsonValue& actual) {
    throw std::runtime_error(std::string("JsonValue: expected ") + expected + " but was "
        + std::string(actual.kindName()));
}

}  // namespace

JsonValue JsonValue::read(JsonParser& parser) {
    switch (parser.nextTokenType()) {
    case JsonTokenType::Null:
        parser.skipValue();
        return JsonValue{};
    case JsonTokenType::Bool: {
        bool value{};
        parser.readTo(value);
        return JsonValue(value);
    }
    case JsonTokenType::Integer: {
        std::int64_t value{};
        parser.readTo(value);
        return JsonValue(value);
    }
    case JsonTokenType::Number: {
        double value{};
        parser.readTo(value);
        return JsonValue(value);
    }
    case JsonTokenType::String: {
        std::string value;
        parser.readTo(value);
        return JsonValue(std::move(value));
    }
    case JsonTokenType::StartArray: {
        Array elements;
        parser.startArray();
        while (!parser.nextIsEndArray()) {
            elements.push_back(read(parser));
        }
        parser.endArray();
        return JsonValue(std::move(elements));
    }
    case JsonTokenType::StartObject: {
        Object members;
        parser.startObject();
        while (!parser.nextIsEndObject()) {
            std::string key = parser.nextKey();
            JsonValue value = read(parser);
            members.push_back(Member{std::move(key), std::move(value)});
        }
        parser.endObject();
        return JsonValue(std::move(members));
    }
    default:
        throw std::runtime_error("JsonValue: unexpected "
            + std::string(tokenTypeName(parser.nextTokenType())) + " at position "
            + std::to_string(parser.nextPosition()));
    }
}

JsonValue JsonValue::fromTokens(const std::vector<JsonToken>& tokens, const ReadOptions& options) {
    TokenManager tokenManager(tokens);
    JsonParser parser(tokenManager, options);
    JsonValue value = read(parser);
    parser.expectEndOfStream();
    return value;
}

bool JsonValue::asBool() const {
    if (kind() != Kind::Bool) {
        kindError("Bool", *this);
    }
    return std::get<bool>(value_);
}

std::int64_t JsonValue::asInteger() const {
    if (kind() != Kind::Integer) {
        kindError("Integer", *this);
    }
    return std::get<std::int64_t>(value_);
}

double JsonValue::asNumber() const {
    if (kind() == Kind::Integer) {
        return static_cast<double>(std::get<std::int64_t>(value_));
    }
    if (kind() != Kind::Number) {
        kindError("Number", *this);
    }
    return std::get<double>(value_);
}

const std::string& JsonValue::asString() const {
    if (kind() != Kind::String) {
        kindError("String", *this);
    }
    return std::get<std::string>(value_);
}

const JsonValue::Array& JsonValue::asArray() const {
    if (kind() != Kind::Array) {
        kindError("Array", *this);
    }
    return std::get<Array>(value_);
}

const JsonValue::Object& JsonValue::asObject() const {
    if (kind() != Kind::Object) {
        kindError("Object", *this);
    }
    return std::get<Object>(value_);
}

const JsonValue* JsonValue::find(std::string_view key, bool ignoreCase) const {
    const auto* members = std::get_if<Object>(&value_);
    if (members == nullptr) {
        return nullptr;
    }
    for (const Member& member : *members) {
        if (member.key == key) {
            return &member.value;
        }
    }
    if (ignoreCase) {
        for (const Member& member : *members) {
            if (collection::equalsIgnoreAsciiCase(member.key, key)) {
                return &member.value;
            }
        }
    }
    return nullptr;
}

void JsonValue::appendTokens(std::vector<JsonToken>& out) const {
    using namespace json_token_detail;
    switch (kind()) {
    case Kind::Null:
        out.emplace_back(NullTag{}, 0);
        break;
    case Kind::Bool:
        out.emplace_back(BoolVal{std::get<bool>(value_)}, 0);
        break;
    case Kind::Integer:
        out.emplace_back(IntVal{std::get<std::int64_t>(value_)}, 0);
        break;
    case Kind::Number:
        out.emplace_back(NumVal{std::get<double>(value_)}, 0);
        break;
    case Kind::String:
        out.emplace_back(JsonTokenValue(std::in_place_type<StrVal>, std::get<std::string>(value_)), 0);
        break;
    case Kind::Array:
        out.emplace_back(StartArrayTag{}, 0);
        for (const JsonValue& element : std::get<Array>(value_)) {
            element.appendTokens(out);
        }
        out.emplace_back(EndArrayTag{}, 0);
        break;
    case Kind::Object:
        out.emplace_back(StartObjectTag{}, 0);
        for (const Member& member : std::get<Object>(value_)) {
            out.emplace_back(KeyVal{member.key}, 0);
            member.value.appendTokens(out);
        }
        out.emplace_back(EndObjectTag{}, 0);
        break;
    }
}

std::string_view JsonValue::kindName() const {
    switch (kind()) {
    case Kind::Null:    return "Null";
    case Kind::Bool:    return "Boolean";
    case Kind::Integer: return "Integer";
    case Kind::Number:  return "Float";
    case Kind::String:  return "String";
    case Kind::Array:   return "Array";
    case Kind::Object:  return "Object";
    }
    return "Unknown";
}

}  // namespace kirikae::serialization
