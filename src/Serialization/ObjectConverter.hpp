// @file ObjectConverter.hpp
// @brief JSONの値変換コンバータ群と、型ごとの既定コンバータの選択。

#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <ranges>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <utility>

#include "Common/SortedHashArrayMap.hpp"
#include "Serialization/Json/JsonParser.hpp"
#include "Serialization/Json/JsonWriter.hpp"
#include "Serialization/ObjectSerializer.hpp"
#include "Serialization/SerializationError.hpp"
#include "Serialization/TypeName.hpp"

namespace kirikae::serialization {

// ******************************************************************************** concept

/// @brief JSONへの書き出しと読み込みを行うコンバータに要求される条件を定義する concept。
/// @tparam Converter コンバータ型
/// @tparam Value コンバータが扱う値の型
template <typename Converter, typename Value>
concept IsJsonConverter = std::is_class_v<Converter>
    && requires { typename Converter::Value; }
    && std::is_same_v<typename Converter::Value, Value>
    && requires(const Converter& converter, JsonWriter& writer, const Value& value) {
        converter.write(writer, value);
    }
    && requires(const Converter& converter, JsonParser& parser) {
        { converter.read(parser) } -> std::same_as<Value>;
    };

// static_assert(false) をテンプレート内で遅延評価させるための補助
template <typename>
inline constexpr bool AlwaysFalse = false;

// 型ごとの既定コンバータ（定義はファイル末尾）
template <typename T>
struct ConverterSelector;

template <typename T>
using ConverterType = typename ConverterSelector<T>::type;

// フィールド単位の既定コンバータ（登録コンバータを経由しない）
template <typename T>
struct MemberwiseConverterSelector;

template <typename T>
using MemberwiseConverterType = typename MemberwiseConverterSelector<T>::type;

/// @brief 型 `T` の既定コンバータを返す。※インスタンスはstatic。
template <typename T>
const ConverterType<T>& getConverter();

/// @brief フィールド単位の既定コンバータを返す。※インスタンスはstatic。
template <typename T>
const MemberwiseConverterType<T>& getMemberwiseConverter();

// ******************************************************************************** 基本型用変換方法

/// @brief プリミティブ型（int, double, bool など）かどうかを判定するconcept。
template <typename T>
concept IsFundamentalValue = std::is_fundamental_v<T> && !std::is_void_v<T> && !std::is_null_pointer_v<T>;

/// @brief プリミティブ型、文字列型の変換方法。
template <typename T>
struct FundamentalConverter {
    static_assert(IsFundamentalValue<T> || std::same_as<T, std::string>,
        "FundamentalConverter requires T to be a fundamental JSON value or std::string");
    using Value = T;
    void write(JsonWriter& writer, const T& value) const { writer.writeObject(value); }
    T read(JsonParser& parser) const {
        T out{};
        parser.readTo(out);
        return out;
    }
};

/// @brief 列挙型を基底の整数値として変換する。
template <typename Enum>
struct EnumValueConverter {
    static_assert(std::is_enum_v<Enum>, "EnumValueConverter requires an enum type");
    using Value = Enum;
    using Underlying = std::underlying_type_t<Enum>;

    void write(JsonWriter& writer, const Enum& value) const {
        writer.writeObject(static_cast<Underlying>(value));
    }

    Enum read(JsonParser& parser) const {
        Underlying raw{};
        parser.readTo(raw);
        return static_cast<Enum>(raw);
    }
};

// ******************************************************************************** enum用変換方法（名前）

// EnumTextMapのように、enum <-> 文字列名の双方向マップを提供する型のconcept。
template <typename Map>
concept IsEnumTextMap
    = requires { typename Map::Enum; }
    && std::is_enum_v<typename Map::Enum>
    && requires(const Map& m, std::string_view s, typename Map::Enum v) {
        { m.fromName(s) } -> std::same_as<std::optional<typename Map::Enum>>;
        { m.toName(v) } -> std::same_as<std::optional<std::string_view>>;
    };

/// @brief EnumEntry は enum 値と文字列名の対応を保持します
template <typename EnumType>
struct EnumEntry {
    EnumType value;   ///< Enum値。
    const char* name; ///< 対応する文字列名。
};

/// @brief EnumEntry を利用して enum <-> name の双方向マップを持つ再利用可能な型。
/// @tparam EnumType enum 型
/// @tparam N エントリ数（静的）
template <typename EnumType, std::size_t N>
struct EnumTextMap {
    using Enum = EnumType;

    /// @brief std::span ベースのコンストラクタ（C配列やstd::arrayからの変換を受け取ります）
    explicit EnumTextMap(std::span<const EnumEntry<Enum>> entries) {
        if (entries.size() != N) {
            throw std::invalid_argument("EnumTextMap(span): size must match template parameter N");
        }
        std::pair<std::string_view, Enum> nv[N];
        for (std::size_t i = 0; i < N; ++i) {
            nv[i] = { entries[i].name, entries[i].value };
        }
        nameToValue_ = collection::SortedHashArrayMap<std::string_view, Enum, N>(nv);

        std::pair<Enum, std::string_view> vn[N];
        for (std::size_t i = 0; i < N; ++i) {
            vn[i] = { entries[i].value, entries[i].name };
        }
        valueToName_ = collection::SortedHashArrayMap<Enum, std::string_view, N>(vn);
    }

    /// @brief 文字列から enum を得る。見つからない場合は nullopt。
    std::optional<Enum> fromName(std::string_view name) const {
        if (auto p = nameToValue_.findValue(name)) {
            return *p;
        }
        return std::nullopt;
    }

    /// @brief enum から文字列名を得る。見つからない場合は nullopt。
    std::optional<std::string_view> toName(Enum v) const {
        if (auto p = valueToName_.findValue(v)) {
            return *p;
        }
        return std::nullopt;
    }

private:
    ///! 名前からenum値へのマップ。
    collection::SortedHashArrayMap<std::string_view, Enum, N> nameToValue_{};
    ///! enum値から名前へのマップ。
    collection::SortedHashArrayMap<Enum, std::string_view, N> valueToName_{};
};

/// @brief 列挙型を名前の文字列として変換するコンバータ
/// @tparam MapType EnumTextMap型など
template <typename MapType>
struct EnumConverter {
    static_assert(IsEnumTextMap<MapType>,
        "EnumConverter requires MapType to satisfy IsEnumTextMap");
    using Enum = typename MapType::Enum;
    using Value = Enum;
    explicit EnumConverter(const MapType& map)
        : map_(map) {}

    void write(JsonWriter& writer, const Enum& value) const {
        if (auto name = map_.toName(value)) {
            writer.writeObject(*name);
            return;
        }
        throw std::runtime_error("Failed to convert enum to string: "
            + toDiagnosticString(value));
    }

    Enum read(JsonParser& parser) const {
        std::string jsonValue;
        parser.readTo(jsonValue);
        if (auto v = map_.fromName(jsonValue)) {
            return *v;
        }
        throw std::runtime_error(std::string("Failed to convert string to enum: ") + jsonValue);
    }
private:
    MapType map_;
};

/// @brief C 配列から EnumConverter を構築する。
template <typename Enum, std::size_t N>
auto getEnumConverter(const EnumEntry<Enum> (&entries)[N]) {
    const EnumTextMap<Enum, N> map{ std::span<const EnumEntry<Enum>>(entries, N) };
    return EnumConverter<EnumTextMap<Enum, N>>(map);
}

/// @brief array から EnumConverter を構築する。
template <typename Enum, std::size_t M>
auto getEnumConverter(const std::array<EnumEntry<Enum>, M>& entries) {
    const EnumTextMap<Enum, M> map{ std::span<const EnumEntry<Enum>>(entries.data(), M) };
    return EnumConverter<EnumTextMap<Enum, M>>(map);
}

/// @brief 静的長の span から EnumConverter を構築する。
template <typename Enum, std::size_t N>
    requires (N != std::dynamic_extent)
auto getEnumConverter(std::span<const EnumEntry<Enum>, N> entries) {
    const EnumTextMap<Enum, N> map{ std::span<const EnumEntry<Enum>>(entries) };
    return EnumConverter<EnumTextMap<Enum, N>>(map);
}

// ******************************************************************************** オブジェクト用変換方法

/// @brief serializer()メンバー関数を持つかどうかを判定するconcept。
template <typename T>
concept HasSerializer = requires(const T& t) {
    { t.serializer() } -> std::convertible_to<const ObjectSerializer&>;
};

/// @brief オブジェクトをフィールド単位で書き出す（startObject/endObjectを含む）。
/// @note ポリモーフィック型は実行時の型の serializer() と最派生オブジェクトの先頭アドレスを使う。
template <HasSerializer T>
void writeObjectFields(JsonWriter& writer, const T& obj) {
    const void* address = &obj;
    if constexpr (std::is_polymorphic_v<T>) {
        address = dynamic_cast<const void*>(&obj);
    }
    writer.startObject();
    obj.serializer().writeFields(writer, address);
    writer.endObject();
}

/// @brief serializer を持つ型のコンバータ
template <typename T>
struct ObjectConverter {
    static_assert(HasSerializer<T> && std::default_initializable<T>,
        "ObjectConverter requires T to have serializer() and be default-initializable");
    using Value = T;
    void write(JsonWriter& writer, const T& obj) const {
        writeObjectFields(writer, obj);
    }
    T read(JsonParser& parser) const {
        T obj{};
        parser.startObject();
        obj.serializer().readFields(parser, &obj);
        parser.endObject();
        return obj;
    }
};

// ******************************************************************************** コンテナ用変換方法

/// @brief 文字列系型かどうかを判定するconcept。
template <typename T>
concept LikesString = std::is_same_v<T, std::string> || std::is_same_v<T, std::string_view>;

/// @brief string 系を除くレンジ（配列/コンテナ）を表す concept。
template <typename T>
concept IsContainer = std::ranges::range<T> && !LikesString<T>;

/// @brief コンテナの変換方法。
template <typename Container, typename ElementConverter>
struct ContainerConverter {
    static_assert(IsContainer<Container>,
        "ContainerConverter requires Container to be a container type");
    using Value = Container;
    using Element = std::remove_cvref_t<std::ranges::range_value_t<Container>>;
    using ElementConverterT = std::remove_cvref_t<ElementConverter>;
    static_assert(IsJsonConverter<ElementConverterT, Element>,
        "ElementConverter must satisfy IsJsonConverter for container element type");

    // 既定の要素コンバータを参照する
    ContainerConverter() requires std::same_as<ElementConverterT, ConverterType<Element>>
        : elementConverter_(std::cref(getConverter<Element>())) {}

    explicit ContainerConverter(const ElementConverterT& elemConv)
        : elementConverter_(std::cref(elemConv)) {}

    void write(JsonWriter& writer, const Container& range) const {
        writer.startArray();
        for (const auto& e : range) {
            elementConverter_.get().write(writer, e);
        }
        writer.endArray();
    }

    Container read(JsonParser& parser) const {
        Container out{};
        parser.startArray();
        while (!parser.nextIsEndArray()) {
            auto elem = elementConverter_.get().read(parser);
            if constexpr (requires(Container& c) { c.push_back(std::move(elem)); }) {
                out.push_back(std::move(elem));
            }
            else if constexpr (requires(Container& c) { c.insert(std::move(elem)); }) {
                out.insert(std::move(elem));
            }
            else {
                static_assert(AlwaysFalse<Container>,
                    "ContainerConverter: container must support push_back or insert");
            }
        }
        parser.endArray();
        return out;
    }

private:
    std::reference_wrapper<const ElementConverterT> elementConverter_;
};

/// @brief 明示的な要素コンバータから `ContainerConverter` を作成する。
/// @note 要素コンバータは返り値より長く生存すること。
template <typename Container, typename ElementConverter>
auto getContainerConverter(const ElementConverter& elemConv) {
    return ContainerConverter<Container, ElementConverter>(elemConv);
}

// ******************************************************************************** ポインタ用変換方法

/// @brief std::unique_ptr を判定する concept（element_type / deleter_type を確認し正確に判定）。
template <typename T>
concept IsUniquePtr = requires {
    typename T::element_type;
    typename T::deleter_type;
} && std::is_same_v<T, std::unique_ptr<typename T::element_type, typename T::deleter_type>>;

/// @brief std::shared_ptr を判定する concept（element_type を確認し正確に判定）。
template <typename T>
concept IsSharedPtr = requires {
    typename T::element_type;
} && std::is_same_v<T, std::shared_ptr<typename T::element_type>>;

/// @brief ポインタ型から要素型を抽出するメタ関数。
template <typename T>
struct PointerElementType;

template <typename T>
struct PointerElementType<std::unique_ptr<T>> {
    using type = T;
};

template <typename T>
struct PointerElementType<std::shared_ptr<T>> {
    using type = T;
};

/// @brief unique_ptr のコンバータ
template <typename T, typename TargetConverter = ConverterType<typename T::element_type>>
struct UniquePtrConverter {
    using Value = T;
    using Element = typename T::element_type;
    using ElemConvT = std::remove_cvref_t<TargetConverter>;
    static_assert(IsUniquePtr<T>, "UniquePtrConverter requires T to be a unique_ptr type");
    static_assert(IsJsonConverter<ElemConvT, Element>,
        "UniquePtrConverter requires ElementConverter to be a JsonConverter for element type");

    UniquePtrConverter() requires std::same_as<ElemConvT, ConverterType<Element>>
        : targetConverter_(std::cref(getConverter<Element>())) {}

    explicit UniquePtrConverter(const ElemConvT& conv)
        : targetConverter_(std::cref(conv)) {}

    void write(JsonWriter& writer, const T& ptr) const {
        if (!ptr) {
            writer.null();
            return;
        }
        targetConverter_.get().write(writer, *ptr);
    }

    T read(JsonParser& parser) const {
        if (parser.nextIsNull()) {
            parser.skipValue();
            return nullptr;
        }
        return std::make_unique<Element>(targetConverter_.get().read(parser));
    }

private:
    std::reference_wrapper<const ElemConvT> targetConverter_;
};

/// @brief shared_ptr のコンバータ
template <typename T, typename TargetConverter = ConverterType<typename T::element_type>>
struct SharedPtrConverter {
    using Value = T;
    using Element = typename T::element_type;
    using ElemConvT = std::remove_cvref_t<TargetConverter>;
    static_assert(IsSharedPtr<T>, "SharedPtrConverter requires T to be a shared_ptr type");
    static_assert(IsJsonConverter<ElemConvT, Element>,
        "SharedPtrConverter requires ElementConverter to be a JsonConverter for element type");

    SharedPtrConverter() requires std::same_as<ElemConvT, ConverterType<Element>>
        : targetConverter_(std::cref(getConverter<Element>())) {}

    explicit SharedPtrConverter(const ElemConvT& conv)
        : targetConverter_(std::cref(conv)) {}

    void write(JsonWriter& writer, const T& ptr) const {
        if (!ptr) {
            writer.null();
            return;
        }
        targetConverter_.get().write(writer, *ptr);
    }

    T read(JsonParser& parser) const {
        if (parser.nextIsNull()) {
            parser.skipValue();
            return nullptr;
        }
        return std::make_shared<Element>(targetConverter_.get().read(parser));
    }

private:
    std::reference_wrapper<const ElemConvT> targetConverter_;
};

// ******************************************************************************** optional用変換方法

/// @brief std::optional を判定する concept。
template <typename T>
concept IsStdOptional = requires {
    typename T::value_type;
} && std::is_same_v<T, std::optional<typename T::value_type>>;

/// @brief optional のコンバータ（null <-> nullopt）
template <typename T, typename ValueConverter = ConverterType<typename T::value_type>>
struct OptionalConverter {
    using Value = T;
    using Inner = typename T::value_type;
    using InnerConvT = std::remove_cvref_t<ValueConverter>;
    static_assert(IsStdOptional<T>, "OptionalConverter requires T to be a std::optional type");
    static_assert(IsJsonConverter<InnerConvT, Inner>,
        "OptionalConverter requires ValueConverter to be a JsonConverter for value type");

    OptionalConverter() requires std::same_as<InnerConvT, ConverterType<Inner>>
        : innerConverter_(std::cref(getConverter<Inner>())) {}

    explicit OptionalConverter(const InnerConvT& conv)
        : innerConverter_(std::cref(conv)) {}

    void write(JsonWriter& writer, const T& value) const {
        if (!value) {
            writer.null();
            return;
        }
        innerConverter_.get().write(writer, *value);
    }

    T read(JsonParser& parser) const {
        if (parser.nextIsNull()) {
            parser.skipValue();
            return std::nullopt;
        }
        return T(innerConverter_.get().read(parser));
    }

private:
    std::reference_wrapper<const InnerConvT> innerConverter_;
};

/// @brief 値が null として書き出されるか（nullptr / nullopt）
template <typename T>
bool isNullValue(const T& value) {
    if constexpr (IsUniquePtr<T> || IsSharedPtr<T> || std::is_pointer_v<T>) {
        return value == nullptr;
    }
    else if constexpr (IsStdOptional<T>) {
        return !value.has_value();
    }
    else {
        return false;
    }
}

// ******************************************************************************** 基底型への登録コンバータ

/// @brief 要素型が `static const Converter& jsonConverter()` を持つポインタ型か。
/// @note 派生クラスは基底クラスの jsonConverter() を継承するため、派生型のポインタも対象になる。
template <typename T>
concept HasRegisteredConverter = (IsUniquePtr<T> || IsSharedPtr<T>)
    && requires { T::element_type::jsonConverter(); };

/// @brief 基底型に登録されたコンバータへ委譲するコンバータ
/// @note 同じ基底型の振り分け中で、かつ同じ深さの値を読む場合はフィールド単位で読み込む。
template <typename Ptr>
struct RegisteredConverter {
    static_assert(HasRegisteredConverter<Ptr>, "RegisteredConverter requires a registered pointer type");
    using Value = Ptr;
    using Element = typename Ptr::element_type;
    using Registered = std::remove_cvref_t<decltype(Element::jsonConverter())>;
    using Target = typename Registered::Target;
    using RegisteredValue = typename Registered::Value;
    static_assert(std::is_base_of_v<Target, Element>,
        "RegisteredConverter: element type must derive from the registered target type");
    static_assert(IsUniquePtr<RegisteredValue> || IsSharedPtr<RegisteredValue>,
        "RegisteredConverter: registered converter must produce a smart pointer");

    Ptr read(JsonParser& parser) const {
        if (parser.dispatchSuppression().contains(std::type_index(typeid(Target)), parser.depth())) {
            return readMemberwise(parser);
        }
        return downcast(Element::jsonConverter().read(parser));
    }

    void write(JsonWriter& writer, const Ptr& value) const {
        if (!value) {
            writer.null();
            return;
        }
        const Registered& registered = Element::jsonConverter();
        if (registered.canWrite()) {
            registered.writeObject(writer, *value);
        } else {
            writeObjectFields(writer, *value);
        }
    }

private:
    static Ptr readMemberwise(JsonParser& parser) {
        if constexpr (std::is_abstract_v<Element> || !std::default_initializable<Element>) {
            throw SerializationError(SerializationErrorKind::IncompatibleCase,
                "Cannot deserialize " + getTypeName<Element>()
                    + " field by field: the type is abstract or not default-constructible.");
        } else {
            return getMemberwiseConverter<Ptr>().read(parser);
        }
    }

    static Ptr downcast(RegisteredValue value) {
        if (!value) {
            return nullptr;
        }
        if constexpr (IsUniquePtr<Ptr>) {
            static_assert(IsUniquePtr<RegisteredValue>,
                "RegisteredConverter: unique_ptr cannot be produced from a shared_ptr converter");
            if constexpr (std::is_same_v<RegisteredValue, Ptr>) {
                return value;
            } else {
                auto* derived = dynamic_cast<Element*>(value.get());
                if (derived == nullptr) {
                    throw incompatible();
                }
                value.release();
                return Ptr(derived);
            }
        } else {
            std::shared_ptr<typename RegisteredValue::element_type> shared = std::move(value);
            auto derived = std::dynamic_pointer_cast<Element>(shared);
            if (!derived) {
                throw incompatible();
            }
            return derived;
        }
    }

    static SerializationError incompatible() {
        return SerializationError(SerializationErrorKind::IncompatibleCase,
            "The decoded " + getTypeName<Target>() + " is not a " + getTypeName<Element>() + ".");
    }
};

// ******************************************************************************** 既定コンバータの選択

template <typename T>
constexpr auto selectMemberwiseConverter() {
    if constexpr (IsFundamentalValue<T> || std::same_as<T, std::string>) {
        return std::type_identity<FundamentalConverter<T>>{};
    }
    else if constexpr (std::is_enum_v<T>) {
        return std::type_identity<EnumValueConverter<T>>{};
    }
    else if constexpr (HasSerializer<T>) {
        return std::type_identity<ObjectConverter<T>>{};
    }
    else if constexpr (IsUniquePtr<T>) {
        return std::type_identity<UniquePtrConverter<T>>{};
    }
    else if constexpr (IsSharedPtr<T>) {
        return std::type_identity<SharedPtrConverter<T>>{};
    }
    else if constexpr (IsStdOptional<T>) {
        return std::type_identity<OptionalConverter<T>>{};
    }
    else if constexpr (IsContainer<T>) {
        using Element = std::remove_cvref_t<std::ranges::range_value_t<T>>;
        return std::type_identity<ContainerConverter<T, ConverterType<Element>>>{};
    }
    else {
        static_assert(AlwaysFalse<T>, "getConverter: unsupported type");
    }
}

template <typename T>
constexpr auto selectConverter() {
    if constexpr (HasRegisteredConverter<T>) {
        return std::type_identity<RegisteredConverter<T>>{};
    } else {
        return std::type_identity<MemberwiseConverterType<T>>{};
    }
}

template <typename T>
struct MemberwiseConverterSelector {
    using type = typename decltype(selectMemberwiseConverter<T>())::type;
};

template <typename T>
struct ConverterSelector {
    using type = typename decltype(selectConverter<T>())::type;
};

template <typename T>
const MemberwiseConverterType<T>& getMemberwiseConverter() {
    static const MemberwiseConverterType<T> inst{};
    return inst;
}

/// @brief 型 `T` に応じた既定のコンバータを返す。
/// @note 基底型にコンバータが登録されたポインタ型はそのコンバータへ委譲する。
template <typename T>
const ConverterType<T>& getConverter() {
    static const ConverterType<T> inst{};
    return inst;
}

/// @brief 既定コンバータで値を1つ読み込む
template <typename T>
T readValue(JsonParser& parser) {
    return getConverter<T>().read(parser);
}

/// @brief 既定コンバータで値を1つ書き出す
template <typename T>
void writeValue(JsonWriter& writer, const T& value) {
    getConverter<T>().write(writer, value);
}

}  // namespace kirikae::serialization
