// @file JsonIO.hpp
// @brief JSON入出力の統合インターフェース。コンバータと連携してJSON変換を提供する。

#pragma once

#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "Serialization/Json/JsonParser.hpp"
#include "Serialization/Json/JsonTokenizer.hpp"
#include "Serialization/Json/JsonValue.hpp"
#include "Serialization/Json/JsonWriter.hpp"
#include "Serialization/MessageOutput.hpp"
#include "Serialization/ObjectConverter.hpp"
#include "Serialization/TextInputSource.hpp"
#include "Serialization/TokenManager.hpp"

namespace kirikae::serialization {

// ******************************************************************************** 書き出し

/// @brief コンバータを指定して値をJSON形式でストリームに書き出す。
template <typename T, typename Converter>
    requires IsJsonConverter<Converter, T>
void writeJsonToBuffer(const T& value, const Converter& converter, std::ostream& os,
    const WriteOptions& options = {}) {
    JsonWriter writer(os, options);
    converter.write(writer, value);
}

/// @brief 値を既定のコンバータでJSON形式としてストリームに書き出す。
/// @tparam T 変換対象の型。
/// @param obj 変換するオブジェクト。
/// @param os 出力先のストリーム。
template <typename T>
void writeJsonToBuffer(const T& obj, std::ostream& os, const WriteOptions& options = {}) {
    writeJsonToBuffer(obj, getConverter<T>(), os, options);
}

/// @brief 任意の型のオブジェクトをJSON形式で文字列化して返す。
template <typename T>
std::string getJsonContent(const T& obj, const WriteOptions& options = {}) {
    std::ostringstream oss;
    writeJsonToBuffer(obj, oss, options);
    return oss.str();
}

/// @brief コンバータを指定してJSON形式で文字列化して返す。
template <typename T, typename Converter>
    requires IsJsonConverter<Converter, T>
std::string getJsonContent(const T& value, const Converter& converter, const WriteOptions& options = {}) {
    std::ostringstream oss;
    writeJsonToBuffer(value, converter, oss, options);
    return oss.str();
}

// ******************************************************************************** 読み込み

/// @brief オブジェクトをJSONから読み込む（startObject/endObject含む）。
/// @note 既存のオブジェクトへ上書きで読み込む。
template <HasSerializer T>
void readJsonObject(JsonParser& parser, T& obj) {
    auto& fields = obj.serializer();
    parser.startObject();
    fields.readFields(parser, &obj);
    parser.endObject();
}

/// @brief JSON文字列をトークン化し、パーサーを読み取り関数に渡す（コア関数）。
/// @param jsonText JSON5形式の文字列。
/// @param options 読み込み設定。
/// @param unknownKeysOut 未知キーの収集先（nullptrなら収集しない）。
/// @param reader パーサーから値を読み取る関数。入力終端まで読み切ること。
template <typename Reader>
void readJsonText(std::string_view jsonText, const ReadOptions& options,
    std::vector<std::string>* unknownKeysOut, Reader&& reader) {
    TextInputSource inputSource(jsonText);
    TokenManager tokenManager;
    StdoutMessageOutput stdoutOutput;
    MessageOutput& warningOutput = options.warningOutput != nullptr ? *options.warningOutput : stdoutOutput;
    JsonTokenizer<TextInputSource, TokenManager> tokenizer(inputSource, tokenManager, warningOutput);
    tokenizer.tokenize();

    JsonParser parser(tokenManager, options);
    reader(parser);
    parser.expectEndOfStream();
    if (unknownKeysOut != nullptr) {
        *unknownKeysOut = parser.takeUnknownKeys();
    }
}

/// @brief コンバータを指定してJSON文字列から値を読み込む。
template <typename Converter>
typename Converter::Value readJsonWith(std::string_view jsonText, const Converter& converter,
    const ReadOptions& options = {}) {
    std::optional<typename Converter::Value> value;
    readJsonText(jsonText, options, nullptr, [&](JsonParser& parser) {
        value.emplace(converter.read(parser));
    });
    return std::move(*value);
}

/// @brief コンバータを指定してJSON文字列から値を読み込む（未知キーを収集）。
template <typename Converter>
typename Converter::Value readJsonWith(std::string_view jsonText, const Converter& converter,
    const ReadOptions& options, std::vector<std::string>& unknownKeysOut) {
    std::optional<typename Converter::Value> value;
    readJsonText(jsonText, options, &unknownKeysOut, [&](JsonParser& parser) {
        value.emplace(converter.read(parser));
    });
    return std::move(*value);
}

/// @brief JSON文字列から既定のコンバータで値を読み込む。
/// @tparam T 読み込み対象の型（明示的に指定する）。
template <typename T>
T readJsonString(std::string_view jsonText, const ReadOptions& options = {}) {
    return readJsonWith(jsonText, getConverter<T>(), options);
}

/// @brief JSON文字列からオブジェクトを読み込む（未知キーの収集先・読み込み設定を指定）。
template <typename T>
void readJsonString(std::string_view jsonText, T& out,
    std::vector<std::string>& unknownKeysOut, const ReadOptions& options = {}) {
    readJsonText(jsonText, options, &unknownKeysOut, [&](JsonParser& parser) {
        if constexpr (HasSerializer<T>) {
            readJsonObject(parser, out);
        } else {
            out = getConverter<T>().read(parser);
        }
    });
}

/// @brief JSON文字列からオブジェクトを読み込む。
/// @tparam T 読み込み対象の型。
/// @param jsonText JSON形式の文字列。
/// @param out 読み込み先のオブジェクト。
template <typename T>
void readJsonString(std::string_view jsonText, T& out) {
    std::vector<std::string> unknownKeysOut;
    readJsonString(jsonText, out, unknownKeysOut);
}

/// @brief JSON文字列を汎用のJSON木として読み込む。
inline JsonValue parseJsonValue(std::string_view jsonText, const ReadOptions& options = {}) {
    JsonValue value;
    readJsonText(jsonText, options, nullptr, [&](JsonParser& parser) {
        value = JsonValue::read(parser);
    });
    return value;
}

/// @brief JSON木の値をコンバータで読み直す。
/// @note 値をトークン列に戻し、新しいパーサーで読む。値全体を消費しなければ例外。
template <typename Converter>
typename Converter::Value readFromValue(const JsonValue& value, const Converter& converter,
    const ReadOptions& options = {}) {
    std::vector<JsonToken> tokens;
    value.appendTokens(tokens);
    TokenManager tokenManager(std::move(tokens));
    JsonParser parser(tokenManager, options);
    auto result = converter.read(parser);
    parser.expectEndOfStream();
    return result;
}

}  // namespace kirikae::serialization
