// @file StringValueConverter.hpp
// @brief 値1つを包む型を、入れ子のオブジェクトではなく文字列1つとして読み書きするコンバータ。

#pragma once

#include <concepts>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "Serialization/Json/JsonParser.hpp"
#include "Serialization/Json/JsonWriter.hpp"
#include "Serialization/ObjectConverter.hpp"
#include "Serialization/SerializationError.hpp"
#include "Serialization/TypeName.hpp"

namespace kirikae::serialization {

/// @brief 文字列から値を組み立てる関数オブジェクトのconcept。
template <typename Parser, typename T>
concept IsStringValueParser = requires(const Parser& parser, std::string_view text) {
    { parser.parse(text) } -> std::convertible_to<T>;
};

/// @brief 値を文字列表現にする（toString() があればそれを、算術型なら std::to_string を使う）
template <typename T>
std::string toValueText(const T& value) {
    if constexpr (requires { { value.toString() } -> std::convertible_to<std::string>; }) {
        return std::string(value.toString());
    } else if constexpr (std::is_arithmetic_v<T> && !std::is_same_v<T, bool>) {
        return std::to_string(value);
    } else {
        static_assert(AlwaysFalse<T>, "toValueText: T needs toString() or must be arithmetic");
    }
}

/// @brief 値ラッパー型を文字列1つとして変換するコンバータ
/// @tparam T 値ラッパー型
/// @tparam Parser parse(std::string_view) -> T を持つ型
/// @note 文字列以外のトークン（nullを含む）は UnexpectedToken で失敗する。
template <typename T, typename Parser>
struct StringValueConverter {
    static_assert(IsStringValueParser<Parser, T>,
        "StringValueConverter requires Parser::parse(std::string_view) returning T");
    using Value = T;

    explicit StringValueConverter(Parser parser = Parser{})
        : parser_(std::move(parser)) {}

    void write(JsonWriter& writer, const T& value) const {
        writer.writeObject(toValueText(value));
    }

    T read(JsonParser& parser) const {
        const JsonTokenType tokenType = parser.nextTokenType();
        if (tokenType != JsonTokenType::String) {
            throw SerializationError(SerializationErrorKind::UnexpectedToken,
                "Unexpected token or value when parsing " + getTypeName<T>()
                    + ". Token: " + std::string(tokenTypeName(tokenType)));
        }
        std::string text;
        parser.readTo(text);
        return parser_.parse(text);
    }

private:
    Parser parser_;
};

/// @brief null を許容する値ラッパーのコンバータ（null <-> std::nullopt）
template <typename T, typename Parser>
struct NullableStringValueConverter {
    using Value = std::optional<T>;

    explicit NullableStringValueConverter(Parser parser = Parser{})
        : inner_(std::move(parser)) {}

    void write(JsonWriter& writer, const Value& value) const {
        if (!value) {
            writer.null();
            return;
        }
        inner_.write(writer, *value);
    }

    Value read(JsonParser& parser) const {
        if (parser.nextIsNull()) {
            parser.skipValue();
            return std::nullopt;
        }
        return inner_.read(parser);
    }

private:
    StringValueConverter<T, Parser> inner_;
};

}  // namespace kirikae::serialization
