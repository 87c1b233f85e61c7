// @file JsonParser.cpp
// @brief JsonParserの非テンプレート部分の実装。

#include "Serialization/Json/JsonParser.hpp"

namespace kirikae::serialization {

JsonToken JsonParser::take() {
    JsonToken t = tokenManager_.take();
    switch (t.type()) {
    case JsonTokenType::StartObject:
    case JsonTokenType::StartArray:
        if (depth_ >= options_.maxDepth) {
            throw std::runtime_error("JsonParser: nesting depth exceeds "
                + std::to_string(options_.maxDepth) + " at position " + std::to_string(t.position));
        }
        ++depth_;
        break;
    case JsonTokenType::EndObject:
    case JsonTokenType::EndArray:
        if (depth_ == 0) {
            typeError("value", t);
        }
        --depth_;
        break;
    default:
        break;
    }
    return t;
}

std::size_t JsonParser::startObject() {
    return expectStructure<json_token_detail::StartObjectTag>("object start '{'");
}

std::size_t JsonParser::endObject() {
    return expectStructure<json_token_detail::EndObjectTag>("object end '}'");
}

std::size_t JsonParser::startArray() {
    return expectStructure<json_token_detail::StartArrayTag>("array start '['");
}

std::size_t JsonParser::endArray() {
    return expectStructure<json_token_detail::EndArrayTag>("array end ']'");
}

std::string JsonParser::nextKey() {
    JsonToken t = take();
    auto* key = std::get_if<json_token_detail::KeyVal>(&t.value);
    if (key == nullptr) {
        typeError("object key", t);
    }
    return std::move(key->v);
}

void JsonParser::readTo(bool& out) {
    const JsonToken t = take();
    const auto* value = std::get_if<json_token_detail::BoolVal>(&t.value);
    if (value == nullptr) {
        typeError("bool", t);
    }
    out = value->v;
}

void JsonParser::readTo(std::string& out) {
    JsonToken t = take();
    auto* value = std::get_if<json_token_detail::StrVal>(&t.value);
    if (value == nullptr) {
        typeError("string", t);
    }
    out = std::move(*value);
}

void JsonParser::readTo(char& out) {
    const JsonToken t = take();
    const auto* value = std::get_if<json_token_detail::StrVal>(&t.value);
    if (value == nullptr) {
        typeError("string", t);
    }
    if (value->size() != 1) {
        throw std::runtime_error("JsonParser: expected single character string at position "
            + std::to_string(t.position));
    }
    out = (*value)[0];
}

void JsonParser::skipValue() {
    const JsonToken t = take();
    switch (t.type()) {
    case JsonTokenType::Null:
    case JsonTokenType::Bool:
    case JsonTokenType::Integer:
    case JsonTokenType::Number:
    case JsonTokenType::String:
        return;
    case JsonTokenType::StartObject:
        while (!nextIsEndObject()) {
            (void)nextKey();
            skipValue();
        }
        endObject();
        return;
    case JsonTokenType::StartArray:
        while (!nextIsEndArray()) {
            skipValue();
        }
        endArray();
        return;
    default:
        typeError("value", t);
    }
}

std::vector<JsonToken> JsonParser::captureValue() {
    std::vector<JsonToken> captured;
    const std::size_t baseDepth = depth_;
    do {
        JsonToken t = take();
        switch (t.type()) {
        case JsonTokenType::EndOfStream:
            typeError("value", t);
        case JsonTokenType::Key:
            if (depth_ == baseDepth) {
                typeError("value", t);
            }
            break;
        case JsonTokenType::EndObject:
        case JsonTokenType::EndArray:
            if (depth_ < baseDepth) {
                typeError("value", t);
            }
            break;
        default:
            break;
        }
        captured.push_back(std::move(t));
    } while (depth_ > baseDepth);
    return captured;
}

void JsonParser::replay(std::vector<JsonToken> tokens) {
    tokenManager_.unread(std::move(tokens));
}

void JsonParser::expectEndOfStream() const {
    const JsonToken& t = peekToken();
    if (t.type() != JsonTokenType::EndOfStream) {
        typeError("end of input", t);
    }
}

void JsonParser::typeError(const char* expected, const JsonToken& actual) {
    throw std::runtime_error(std::string("JsonParser: expected ") + expected + " but got "
        + std::string(tokenTypeName(actual.type())) + " at position " + std::to_string(actual.position));
}

}  // namespace kirikae::serialization
