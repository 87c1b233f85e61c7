// @file JsonParser.hpp
// @brief JSON5パーサーの定義。トークン列からオブジェクトを構築する。

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "Serialization/DispatchSuppression.hpp"
#include "Serialization/TokenManager.hpp"

namespace kirikae::serialization {

class MessageOutput;

// @brief 読み込み時の設定
struct ReadOptions {
    bool propertyNameCaseInsensitive = false;  ///< キー名の照合でASCII英字の大文字小文字を区別しない
    MessageOutput* warningOutput = nullptr;    ///< トークナイザーの警告出力先（nullptrなら標準出力）
    std::size_t maxDepth = 64;                 ///< オブジェクト・配列の入れ子の上限。超えると例外。
};

// ******************************************************************************** JsonParser
// @brief JSON5パーサー（トークン列を前方向に1度だけ読む）
// @note 開いているオブジェクト・配列の数を深さとして追跡し、ReadOptions::maxDepth を超えたら例外を投げる。
class JsonParser {
    // ******************************************************************************** 構築
public:
    // @brief コンストラクタ（トークン管理オブジェクトを指定）
    // @param tokenManager トークン管理オブジェクトの参照
    // @param options 読み込み設定
    explicit JsonParser(TokenManager& tokenManager, ReadOptions options = {})
        : tokenManager_(tokenManager), options_(options) {}

    JsonParser(const JsonParser&) = delete;
    JsonParser& operator=(const JsonParser&) = delete;

    const ReadOptions& options() const { return options_; }

    // ******************************************************************************** トークン読み取り
public:
    // @brief 次のトークンの入力ストリーム内での開始位置
    std::size_t nextPosition() const { return peekToken().position; }

    // @brief 次のトークンの種類
    JsonTokenType nextTokenType() const { return peekToken().type(); }

    // @brief 現在開いているオブジェクト・配列の数
    std::size_t depth() const { return depth_; }

    // 構造トークン
    std::size_t startObject();
    std::size_t endObject();
    std::size_t startArray();
    std::size_t endArray();

    // 次が EndArray / EndObject / null か確認（消費しない）
    bool nextIsEndArray() const { return nextTokenType() == JsonTokenType::EndArray; }
    bool nextIsEndObject() const { return nextTokenType() == JsonTokenType::EndObject; }
    bool nextIsNull() const { return nextTokenType() == JsonTokenType::Null; }

    // キー
    std::string nextKey();

    // 値読み取り
    void readTo(bool& out);

    template <typename T>
        requires std::is_integral_v<T> && (!std::is_same_v<T, bool>) && (!std::is_same_v<T, char>)
    void readTo(T& out) {
        const JsonToken t = take();
        const auto* value = std::get_if<json_token_detail::IntVal>(&t.value);
        if (value == nullptr) {
            typeError("integer", t);
        }
        if (!std::in_range<T>(value->v)) {
            throw std::runtime_error("JsonParser: integer " + std::to_string(value->v)
                + " out of range at position " + std::to_string(t.position));
        }
        out = static_cast<T>(value->v);
    }

    template <typename T>
        requires std::is_floating_point_v<T>
    void readTo(T& out) {
        const JsonToken t = take();
        if (const auto* number = std::get_if<json_token_detail::NumVal>(&t.value)) {
            out = static_cast<T>(number->v);
            return;
        }
        if (const auto* integer = std::get_if<json_token_detail::IntVal>(&t.value)) {
            out = static_cast<T>(integer->v);
            return;
        }
        typeError("number", t);
    }

    void readTo(std::string& out);

    // @brief 1文字の文字列を読み込む
    void readTo(char& out);

    // @brief 値全体をスキップする。プリミティブ/配列/オブジェクトを丸ごと消費する。
    void skipValue();

    // @brief 次の値1つ分のトークン列を消費して返す
    // @note 深さは呼び出し前後で変わらない。
    std::vector<JsonToken> captureValue();

    // @brief captureValue()で取り出したトークン列を差し戻し、次に読まれるようにする
    void replay(std::vector<JsonToken> tokens);

    // @brief 入力終端であることを確認する（余分な値があれば例外）
    void expectEndOfStream() const;

    // ******************************************************************************** 振り分け抑止
public:
    DispatchSuppressionSet& dispatchSuppression() { return suppression_; }
    const DispatchSuppressionSet& dispatchSuppression() const { return suppression_; }

    // ******************************************************************************** 未知キー
public:
    // @brief 未知キーを記録する（後で診断に利用）
    void noteUnknownKey(std::string key) { unknownKeys_.push_back(std::move(key)); }

    // @brief 未知キーの一覧を取得して所有権を移動
    std::vector<std::string> takeUnknownKeys() { return std::move(unknownKeys_); }

    const std::vector<std::string>& unknownKeys() const { return unknownKeys_; }

private:
    // 次のトークンを取得して消費（深さを更新する）
    JsonToken take();

    const JsonToken& peekToken() const { return tokenManager_.peek(); }

    template <typename Tag>
    std::size_t expectStructure(const char* expected) {
        const JsonToken t = take();
        if (!std::holds_alternative<Tag>(t.value)) {
            typeError(expected, t);
        }
        return t.position;
    }

    [[noreturn]] static void typeError(const char* expected, const JsonToken& actual);

    // ******************************************************************************** メンバー変数
private:
    TokenManager& tokenManager_;              ///< トークン管理オブジェクトの参照
    ReadOptions options_;                     ///< 読み込み設定
    std::size_t depth_ = 0;                   ///< 開いているオブジェクト・配列の数
    DispatchSuppressionSet suppression_;      ///< 振り分け抑止状態
    std::vector<std::string> unknownKeys_{};  ///< 未知キー記録（診断用）
};

}  // namespace kirikae::serialization
