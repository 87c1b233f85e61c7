// @file ObjectSerializer.hpp
// @brief メンバー単位の読み書き。serializer() を持つ型の既定の変換方法。

#pragma once

#include <array>
#include <bitset>
#include <concepts>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

#include "Common/SortedHashArrayMap.hpp"
#include "Serialization/Json/JsonParser.hpp"
#include "Serialization/Json/JsonWriter.hpp"

namespace kirikae::serialization {

// ******************************************************************************** 基底インターフェース

/// @brief オブジェクトのメンバーを読み書きする。
/// @note serializer() の戻り値型。派生型ごとに異なるフィールド集合を返せる。
class ObjectSerializer {
public:
    virtual ~ObjectSerializer() = default;

    /// @brief メンバーを key:value の並びとして書き出す。括弧は呼び出し側が書く。
    /// @param obj 最派生型のオブジェクトを指すポインタ。
    virtual void writeFields(JsonWriter& writer, const void* obj) const = 0;

    /// @brief 次の '}' までのメンバーを読み込む。
    /// @note 未知のキーは読み飛ばして parser に記録する。
    virtual void readFields(JsonParser& parser, void* obj) const = 0;
};

// ******************************************************************************** フィールド集合

/// @brief FieldsObjectSerializerの要素になれる型。
template <typename Field>
concept IsReadWriteField = requires(const Field& field, JsonParser& parser, JsonWriter& writer,
    typename Field::Owner& owner, const typename Field::Owner& constOwner) {
    { field.read(parser, owner) } -> std::same_as<void>;
    { field.write(writer, constOwner) } -> std::same_as<void>;
    { field.applyMissing(owner) } -> std::same_as<void>;
    { field.key } -> std::convertible_to<const char*>;
};

/// @brief フィールド定義の組で表したObjectSerializer。
/// @tparam Owner 読み書きするオブジェクトの型。
/// @tparam Fields フィールド定義の型。
template <typename Owner, typename... Fields>
class FieldsObjectSerializer : public ObjectSerializer {
    static_assert((IsReadWriteField<Fields> && ...),
        "FieldsObjectSerializer: every field needs read/write/applyMissing and a key");
    static_assert((std::is_base_of_v<typename Fields::Owner, Owner> && ...),
        "FieldsObjectSerializer: field owner must be Owner or its base");

    static constexpr std::size_t FieldCount = sizeof...(Fields);
    using KeyIndex = collection::SortedHashArrayMap<std::string_view, std::size_t, FieldCount>;
    using FieldReader = void (*)(const FieldsObjectSerializer&, JsonParser&, Owner&);

public:
    explicit FieldsObjectSerializer(Fields... fields)
        : fields_(std::move(fields)...),
          keyIndex_(makeKeyIndex(std::make_index_sequence<FieldCount>{})) {}

    void writeFields(JsonWriter& writer, const void* obj) const override {
        const Owner& owner = *static_cast<const Owner*>(obj);
        std::apply([&](const auto&... field) { (field.write(writer, owner), ...); }, fields_);
    }

    void readFields(JsonParser& parser, void* obj) const override {
        Owner& owner = *static_cast<Owner*>(obj);
        std::bitset<FieldCount> seen;
        while (!parser.nextIsEndObject()) {
            std::string key = parser.nextKey();
            const std::optional<std::size_t> index = lookup(key, parser.options().propertyNameCaseInsensitive);
            if (!index) {
                parser.skipValue();
                parser.noteUnknownKey(std::move(key));
                continue;
            }
            if (seen.test(*index)) {
                throw std::runtime_error("JsonParser: duplicate key '" + key + "'");
            }
            seen.set(*index);
            readers()[*index](*this, parser, owner);
        }
        applyMissingFields(owner, seen, std::make_index_sequence<FieldCount>{});
    }

private:
    // 完全一致を優先し、指定があれば大文字小文字を無視して探し直す
    std::optional<std::size_t> lookup(std::string_view key, bool ignoreCase) const {
        if (const std::size_t* index = keyIndex_.findValue(key)) {
            return *index;
        }
        return ignoreCase ? keyIndex_.findIndexIgnoreCase(key) : std::nullopt;
    }

    template <std::size_t I>
    static void readField(const FieldsObjectSerializer& self, JsonParser& parser, Owner& owner) {
        std::get<I>(self.fields_).read(parser, owner);
    }

    // フィールド番号から読み込み関数を引く表
    static const std::array<FieldReader, FieldCount>& readers() {
        static constexpr auto table = []<std::size_t... I>(std::index_sequence<I...>) {
            return std::array<FieldReader, FieldCount>{ &readField<I>... };
        }(std::make_index_sequence<FieldCount>{});
        return table;
    }

    template <std::size_t... I>
    void applyMissingFields(Owner& owner, const std::bitset<FieldCount>& seen, std::index_sequence<I...>) const {
        ((seen.test(I) ? void() : std::get<I>(fields_).applyMissing(owner)), ...);
    }

    template <std::size_t... I>
    KeyIndex makeKeyIndex(std::index_sequence<I...>) const {
        return KeyIndex(std::pair<std::string_view, std::size_t>{ std::get<I>(fields_).key, I }...);
    }

    std::tuple<Fields...> fields_;  ///< 定義順のフィールド
    KeyIndex keyIndex_;             ///< キー -> フィールド番号
};

// ******************************************************************************** ヘルパー関数

/// @brief 継承関係にある所有者型のうち派生側を選ぶ。
template <typename Left, typename Right>
using MoreDerivedOwner = std::conditional_t<std::is_base_of_v<Left, Right>, Right,
    std::conditional_t<std::is_base_of_v<Right, Left>, Left, void>>;

template <typename Owner, typename... Rest>
struct CommonOwner {
    using type = Owner;
};

template <typename Owner, typename Next, typename... Rest>
struct CommonOwner<Owner, Next, Rest...> {
    using Derived = MoreDerivedOwner<Owner, Next>;
    static_assert(!std::is_void_v<Derived>, "getFieldSet: field owners are unrelated types");
    using type = typename CommonOwner<Derived, Rest...>::type;
};

/// @brief フィールド定義からObjectSerializerを作る。
/// @note 基底クラスのメンバーを混ぜた場合、所有者型は最派生の型になる。
template <typename... Fields>
auto getFieldSet(Fields... fields) {
    static_assert(sizeof...(Fields) > 0, "getFieldSet requires at least one field");
    using Owner = typename CommonOwner<typename Fields::Owner...>::type;
    return FieldsObjectSerializer<Owner, Fields...>(std::move(fields)...);
}

}  // namespace kirikae::serialization
