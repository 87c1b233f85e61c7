// @file FieldSerializer.hpp
// @brief メンバー変数1つ分の読み書き。FieldsObjectSerializerの要素として使う。

#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include "Serialization/Json/JsonParser.hpp"
#include "Serialization/Json/JsonWriter.hpp"
#include "Serialization/ObjectConverter.hpp"

namespace kirikae::serialization {

// ******************************************************************************** メタプログラミング用の型特性

/// @brief メンバーポインタの特性を抽出するメタ関数。
/// @tparam T メンバーポインタ型。
template <typename T>
struct MemberPointerTraits;

template <typename Owner, typename Value>
struct MemberPointerTraits<Value Owner::*> {
    using OwnerType = Owner;
    using ValueType = Value;
};

// @brief JSON上にキーが無い場合の扱い
enum class FieldPresence {
    Required,  ///< 例外を送出する
    Optional,  ///< 何もしない（既存の値を残す）
    Default    ///< 既定値を代入する
};

// ******************************************************************************** フィールド定義

/// @brief メンバー変数とJSONキー、コンバータの組。
/// @tparam MemberPtrType メンバー変数へのポインタ型。
/// @tparam Converter 値のコンバータ型（値で保持する）。
template <typename MemberPtrType, typename Converter>
struct FieldSerializer {
    static_assert(std::is_member_object_pointer_v<MemberPtrType>,
        "FieldSerializer requires a data member pointer");
    using Traits = MemberPointerTraits<MemberPtrType>;
    using Owner = typename Traits::OwnerType;
    using Value = typename Traits::ValueType;
    static_assert(IsJsonConverter<Converter, Value>,
        "FieldSerializer requires Converter to be a JsonConverter for the member type");

    FieldSerializer(MemberPtrType memberPtr, const char* keyName, Converter conv, FieldPresence fieldPresence)
        : member(memberPtr), key(keyName), converter(std::move(conv)), presence(fieldPresence) {}

    void read(JsonParser& parser, Owner& owner) const {
        owner.*member = converter.read(parser);
    }

    // @note WriteOptions::skipNullValues が有効なら null になる値はキーごと省略する
    void write(JsonWriter& writer, const Owner& owner) const {
        const Value& value = owner.*member;
        if (writer.options().skipNullValues && isNullValue(value)) {
            return;
        }
        writer.key(key);
        converter.write(writer, value);
    }

    void applyMissing(Owner&) const {
        if (presence == FieldPresence::Required) {
            throw std::runtime_error(std::string("JsonParser: missing required key '") + key + "'");
        }
    }

    MemberPtrType member{};        ///< メンバー変数へのポインタ
    const char* key{};             ///< JSONキー名
    Converter converter;           ///< 値のコンバータ
    FieldPresence presence{};      ///< キーが無い場合の扱い
};

/// @brief キーが無い場合に既定値を代入するフィールド。
template <typename MemberPtrType, typename Converter>
struct DefaultFieldSerializer : FieldSerializer<MemberPtrType, Converter> {
    using Base = FieldSerializer<MemberPtrType, Converter>;
    using typename Base::Owner;
    using typename Base::Value;

    DefaultFieldSerializer(MemberPtrType memberPtr, const char* keyName, Converter conv, Value defaultVal)
        : Base(memberPtr, keyName, std::move(conv), FieldPresence::Default),
          defaultValue(std::move(defaultVal)) {}

    void applyMissing(Owner& owner) const {
        owner.*(this->member) = defaultValue;
    }

    Value defaultValue; ///< 既定値
};

// ******************************************************************************** ヘルパー関数

template <typename MemberPtrType>
using DefaultFieldConverter = ConverterType<typename MemberPointerTraits<MemberPtrType>::ValueType>;

/// @brief 必須フィールド（既定コンバータ）
template <typename MemberPtrType>
auto getRequiredField(MemberPtrType member, const char* key) {
    using Value = typename MemberPointerTraits<MemberPtrType>::ValueType;
    return FieldSerializer<MemberPtrType, DefaultFieldConverter<MemberPtrType>>(
        member, key, getConverter<Value>(), FieldPresence::Required);
}

/// @brief 必須フィールド（コンバータ指定）
template <typename MemberPtrType, typename Converter>
auto getRequiredField(MemberPtrType member, const char* key, const Converter& converter) {
    return FieldSerializer<MemberPtrType, Converter>(member, key, converter, FieldPresence::Required);
}

/// @brief 任意フィールド（既定コンバータ）
template <typename MemberPtrType>
auto getOptionalField(MemberPtrType member, const char* key) {
    using Value = typename MemberPointerTraits<MemberPtrType>::ValueType;
    return FieldSerializer<MemberPtrType, DefaultFieldConverter<MemberPtrType>>(
        member, key, getConverter<Value>(), FieldPresence::Optional);
}

/// @brief 任意フィールド（コンバータ指定）
template <typename MemberPtrType, typename Converter>
auto getOptionalField(MemberPtrType member, const char* key, const Converter& converter) {
    return FieldSerializer<MemberPtrType, Converter>(member, key, converter, FieldPresence::Optional);
}

/// @brief 既定値付きフィールド（既定コンバータ）
template <typename MemberPtrType>
auto getDefaultField(MemberPtrType member, const char* key,
    typename MemberPointerTraits<MemberPtrType>::ValueType defaultValue) {
    using Value = typename MemberPointerTraits<MemberPtrType>::ValueType;
    return DefaultFieldSerializer<MemberPtrType, DefaultFieldConverter<MemberPtrType>>(
        member, key, getConverter<Value>(), std::move(defaultValue));
}

/// @brief 既定値付きフィールド（コンバータ指定）
template <typename MemberPtrType, typename Converter>
auto getDefaultField(MemberPtrType member, const char* key,
    typename MemberPointerTraits<MemberPtrType>::ValueType defaultValue, const Converter& converter) {
    return DefaultFieldSerializer<MemberPtrType, Converter>(member, key, converter, std::move(defaultValue));
}

}  // namespace kirikae::serialization
