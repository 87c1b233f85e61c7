// @file TokenManager.hpp
// @brief JSONトークンの定義とトークン列の管理クラス

#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <iterator>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace kirikae::serialization {

// ******************************************************************************** トークン型定義（内部実装詳細）
namespace json_token_detail {

// @brief 入力ストリーム終端を示すタグ
struct EndOfStreamTag {};

// @brief null値を示すタグ
struct NullTag {};

// @brief オブジェクト開始を示すタグ
struct StartObjectTag {};

// @brief オブジェクト終了を示すタグ
struct EndObjectTag {};

// @brief 配列開始を示すタグ
struct StartArrayTag {};

// @brief 配列終了を示すタグ
struct EndArrayTag {};

// @brief 真偽値を保持する型
struct BoolVal {
    bool v{};
};

// @brief 整数値を保持する型
struct IntVal {
    std::int64_t v{};
};

// @brief 浮動小数点数値を保持する型
struct NumVal {
    double v{};
};

// @brief キー名を保持する型
struct KeyVal {
    std::string v;
};

// @brief 文字列値を保持する型（キーとは区別）
using StrVal = std::string;

}  // namespace json_token_detail

// @brief JSONトークンの種類を表す列挙型
// @note JsonTokenValueのvariantの並び順と一致させること
enum class JsonTokenType {
    EndOfStream,    ///< 入力ストリーム終端
    Null,           ///< null値
    Bool,           ///< 真偽値
    Integer,        ///< 整数値
    Number,         ///< 浮動小数点数値
    String,         ///< 文字列値
    Key,            ///< キー名
    StartObject,    ///< オブジェクト開始
    EndObject,      ///< オブジェクト終了
    StartArray,     ///< 配列開始
    EndArray        ///< 配列終了
};

// @brief エラーメッセージ用のトークン種別名
constexpr std::string_view tokenTypeName(JsonTokenType type) {
    switch (type) {
    case JsonTokenType::EndOfStream: return "None";
    case JsonTokenType::Null:        return "Null";
    case JsonTokenType::Bool:        return "Boolean";
    case JsonTokenType::Integer:     return "Integer";
    case JsonTokenType::Number:      return "Float";
    case JsonTokenType::String:      return "String";
    case JsonTokenType::Key:         return "PropertyName";
    case JsonTokenType::StartObject: return "StartObject";
    case JsonTokenType::EndObject:   return "EndObject";
    case JsonTokenType::StartArray:  return "StartArray";
    case JsonTokenType::EndArray:    return "EndArray";
    }
    return "Unknown";
}

// @brief JSONトークンのvariant表現
using JsonTokenValue =
    std::variant<json_token_detail::EndOfStreamTag, json_token_detail::NullTag,
                 json_token_detail::BoolVal, json_token_detail::IntVal, json_token_detail::NumVal,
                 json_token_detail::StrVal, json_token_detail::KeyVal,
                 json_token_detail::StartObjectTag, json_token_detail::EndObjectTag,
                 json_token_detail::StartArrayTag, json_token_detail::EndArrayTag>;

// @brief JSONトークン（値と入力位置を保持）
struct JsonToken {
    JsonTokenValue value{};    ///< トークンの種類と値
    std::size_t position{};    ///< 入力ストリーム内での開始位置

    JsonToken() = default;

    JsonToken(JsonTokenValue v, std::size_t pos)
        : value(std::move(v)), position(pos) {}

    // @brief トークンの種類
    JsonTokenType type() const {
        return static_cast<JsonTokenType>(value.index());
    }
};

// ******************************************************************************** トークン管理クラス
// @brief dequeを使用したトークン列の管理クラス
// @note 先頭のpopはO(1)。再読用の先頭への差し戻しは差し戻すトークン数に比例する。
class TokenManager {
public:
    TokenManager() = default;

    // @brief 記録済みトークン列から構築する（再読用）
    // @param tokens 1つ以上の値を表すトークン列。終端トークンは自動で追加する。
    explicit TokenManager(std::vector<JsonToken> tokens)
        : tokens_(std::make_move_iterator(tokens.begin()), std::make_move_iterator(tokens.end())) {
        const std::size_t endPosition = tokens_.empty() ? 0 : tokens_.back().position;
        tokens_.emplace_back(json_token_detail::EndOfStreamTag{}, endPosition);
    }

    TokenManager(const TokenManager&) = delete;
    TokenManager& operator=(const TokenManager&) = delete;

    // @brief トークンを追加
    void pushToken(JsonToken&& token) {
        tokens_.push_back(std::move(token));
    }

    // @brief 次のトークンを取得して消費
    JsonToken take() {
        if (tokens_.empty()) {
            throw std::runtime_error("TokenManager: token stream exhausted");
        }
        JsonToken t = std::move(tokens_.front());
        tokens_.pop_front();
        return t;
    }

    // @brief 次のトークンを取得（消費しない）
    const JsonToken& peek() const {
        if (tokens_.empty()) {
            throw std::runtime_error("TokenManager: token stream exhausted");
        }
        return tokens_.front();
    }

    // @brief 消費済みのトークン列を先頭へ差し戻す
    // @param tokens 差し戻すトークン列（元の順序のまま）
    void unread(std::vector<JsonToken>&& tokens) {
        tokens_.insert(tokens_.begin(),
            std::make_move_iterator(tokens.begin()), std::make_move_iterator(tokens.end()));
    }

    bool empty() const { return tokens_.empty(); }

private:
    std::deque<JsonToken> tokens_;  ///< トークン列
};

}  // namespace kirikae::serialization
