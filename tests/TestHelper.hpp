// @file TestHelper.hpp
// @brief テスト共通の補助関数。

#pragma once

#include <gtest/gtest.h>

#include <concepts>
#include <optional>
#include <string>
#include <string_view>

#include "Serialization/Json/JsonIO.hpp"
#include "Serialization/Json/JsonParser.hpp"
#include "Serialization/Json/JsonTokenizer.hpp"
#include "Serialization/MessageOutput.hpp"
#include "Serialization/ObjectConverter.hpp"
#include "Serialization/SerializationError.hpp"
#include "Serialization/TextInputSource.hpp"
#include "Serialization/TokenManager.hpp"

namespace kirikae::serialization::test {

/// @brief オブジェクトをJSON形式で書き出し、仕様との一致を確認し、読み込んで元と比較する。
/// @tparam T テスト対象の型。HasSerializerを満たす必要がある。
/// @param original 元のオブジェクト。
/// @param expectedJson 期待されるJSON文字列。
/// @note この関数は以下の手順を実行する：
///       1. JSON形式で文字列に書き出す
///       2. JSONの内容が仕様にあっていることを確認
///       3. そのJSONを読み込んでオブジェクトを構築
///       4. 元のオブジェクトと内容が一致していることを確認
template <typename T>
    requires HasSerializer<T> &&
             requires(const T& a, const T& b) { { a == b } -> std::convertible_to<bool>; }
void testJsonRoundTrip(const T& original, const std::string& expectedJson) {
    // JSON形式で書き出す
    auto json = getJsonContent(original);

    // JSONの内容が正しいか確認（全体比較）
    EXPECT_EQ(json, expectedJson);

    // JSONから読み込む
    T parsed;
    readJsonString(json, parsed);

    // 元のオブジェクトと内容が一致していることを確認
    EXPECT_EQ(parsed, original);
}

/// @brief 関数を実行し、送出された SerializationError を返す（送出されなければnullopt）。
template <typename Fn>
std::optional<SerializationError> captureSerializationError(Fn&& fn) {
    try {
        fn();
    } catch (const SerializationError& e) {
        return e;
    }
    return std::nullopt;
}

/// @brief 文字列をトークン化してパーサーを直接使うための入力一式。
/// @note メンバーの宣言順が初期化順になるため、入力→トークン→パーサーの順に並べる。
struct TokenizedInput {
    explicit TokenizedInput(std::string_view text, ReadOptions options = {})
        : source(text), parser(tokens, options) {
        JsonTokenizer<TextInputSource, TokenManager> tokenizer(source, tokens, warnings);
        tokenizer.tokenize();
    }

    TextInputSource source;
    TokenManager tokens;
    CollectingMessageOutput warnings;
    JsonParser parser;
};

} // namespace kirikae::serialization::test
