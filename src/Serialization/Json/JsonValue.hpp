// @file JsonValue.hpp
// @brief 汎用のJSON木（ランダムアクセス用のビュー）。

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "Serialization/Json/JsonParser.hpp"
#include "Serialization/TokenManager.hpp"

namespace kirikae::serialization {

// @brief JSONの値1つを表すタグ付き共用体
// @note オブジェクトのメンバーは出現順に保持し、重複キーもそのまま残す。
class JsonValue {
public:
    enum class Kind { Null, Bool, Integer, Number, String, Array, Object };

    struct Member;
    using Array = std::vector<JsonValue>;
    using Object = std::vector<Member>;

    JsonValue() = default;
    explicit JsonValue(bool value);
    explicit JsonValue(std::int64_t value);
    explicit JsonValue(double value);
    explicit JsonValue(std::string value);
    explicit JsonValue(Array value);
    explicit JsonValue(Object value);

    // @brief パーサーから値を1つ読み込んで構築する
    static JsonValue read(JsonParser& parser);

    // @brief captureValue()で得たトークン列から構築する
    // @note トークン列はちょうど1つの値を表していること。入れ子の上限は options に従う。
    static JsonValue fromTokens(const std::vector<JsonToken>& tokens, const ReadOptions& options = {});

    Kind kind() const { return static_cast<Kind>(value_.index()); }

    bool isNull() const { return kind() == Kind::Null; }
    bool isObject() const { return kind() == Kind::Object; }
    bool isArray() const { return kind() == Kind::Array; }

    bool asBool() const;
    std::int64_t asInteger() const;
    double asNumber() const;  // 整数も受け付ける
    const std::string& asString() const;
    const Array& asArray() const;
    const Object& asObject() const;

    // @brief オブジェクトのメンバーをキーで探す
    // @param ignoreCase trueならASCII英字の大文字小文字を区別しない。完全一致を優先し、次に出現順で最初の一致。
    // @return 見つからない、またはオブジェクトでなければnullptr
    const JsonValue* find(std::string_view key, bool ignoreCase = false) const;

    // @brief 値をトークン列として追加する（再読用）
    void appendTokens(std::vector<JsonToken>& out) const;

    // @brief 種別名（診断用）
    std::string_view kindName() const;

private:
    using Storage = std::variant<std::monostate, bool, std::int64_t, double, std::string, Array, Object>;
    Storage value_;
};

struct JsonValue::Member {
    std::string key;
    JsonValue value;
};

inline JsonValue::JsonValue(bool value) : value_(value) {}
inline JsonValue::JsonValue(std::int64_t value) : value_(value) {}
inline JsonValue::JsonValue(double value) : value_(value) {}
inline JsonValue::JsonValue(std::string value) : value_(std::move(value)) {}
inline JsonValue::JsonValue(Array value) : value_(std::move(value)) {}
inline JsonValue::JsonValue(Object value) : value_(std::move(value)) {}

}  // namespace kirikae::serialization
