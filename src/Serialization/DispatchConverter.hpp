// @file DispatchConverter.hpp
// @brief 判別子の値で具象型を選んで読み込むコンバータ。

#pragma once

#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>

#include "Serialization/CaseRegistry.hpp"
#include "Serialization/DispatchSuppression.hpp"
#include "Serialization/Json/JsonIO.hpp"
#include "Serialization/Json/JsonParser.hpp"
#include "Serialization/Json/JsonValue.hpp"
#include "Serialization/Json/JsonWriter.hpp"
#include "Serialization/ObjectConverter.hpp"
#include "Serialization/SerializationError.hpp"
#include "Serialization/TypeName.hpp"

namespace kirikae::serialization {

// @brief 書き出し時の動作
enum class DispatchWriteMode {
    PassThrough,  ///< 実行時の型のフィールドをそのまま書き出す
    ReadOnly      ///< 書き出しは非対応（write() は例外、canWrite() は false）
};

// ******************************************************************************** 共用体型の特性

/// @brief 振り分け結果を保持する型ごとの特性。
/// @note unique_ptr<Base> / shared_ptr<Base> / variant / optional<variant> に対応する。
template <typename Union>
struct DispatchUnionTraits {
    static_assert(AlwaysFalse<Union>,
        "DispatchConverter supports unique_ptr, shared_ptr, variant and optional<variant>");
};

template <typename Base>
struct DispatchUnionTraits<std::unique_ptr<Base>> {
    using Target = Base;
    static constexpr bool pointer = true;
    static constexpr bool nullable = true;
    template <typename Concrete>
    using Decoded = std::unique_ptr<Concrete>;
};

template <typename Base>
struct DispatchUnionTraits<std::shared_ptr<Base>> {
    using Target = Base;
    static constexpr bool pointer = true;
    static constexpr bool nullable = true;
    template <typename Concrete>
    using Decoded = std::shared_ptr<Concrete>;
};

template <typename... Cases>
struct DispatchUnionTraits<std::variant<Cases...>> {
    using Target = std::variant<Cases...>;
    static constexpr bool pointer = false;
    static constexpr bool nullable = false;
    template <typename Concrete>
    using Decoded = Concrete;
};

template <typename... Cases>
struct DispatchUnionTraits<std::optional<std::variant<Cases...>>> {
    using Target = std::optional<std::variant<Cases...>>;
    static constexpr bool pointer = false;
    static constexpr bool nullable = true;
    template <typename Concrete>
    using Decoded = Concrete;
};

// ******************************************************************************** 判別子の抽出

/// @brief 名前付きフィールドから判別子を読む抽出関数を作る。
/// @param name 判別子のフィールド名（空は不可）
/// @param converter 判別子の値のコンバータ
/// @note ReadOptions::propertyNameCaseInsensitive が有効なら大文字小文字を区別せずに探す。
template <typename Case, typename CaseConverter = ConverterType<Case>>
std::function<Case(const JsonValue&, const ReadOptions&)> makeFieldExtractor(
    std::string name, CaseConverter converter = getConverter<Case>()) {
    if (name.empty()) {
        throw std::invalid_argument("DispatchConverter: discriminator name must not be empty");
    }
    return [name = std::move(name), converter = std::move(converter)](
               const JsonValue& root, const ReadOptions& options) -> Case {
        const JsonValue* field = root.find(name, options.propertyNameCaseInsensitive);
        if (field == nullptr) {
            throw SerializationError(SerializationErrorKind::MissingDiscriminator,
                "Property '" + name + "' is not defined.");
        }
        try {
            return readFromValue(*field, converter, options);
        } catch (const SerializationError&) {
            throw;
        } catch (const std::runtime_error& e) {
            throw SerializationError(SerializationErrorKind::MalformedDiscriminator,
                "Property '" + name + "' could not be read as a discriminator: " + e.what());
        } catch (const std::logic_error& e) {
            // 範囲外の数値など、コンバータが引数の誤りとして報告したもの
            throw SerializationError(SerializationErrorKind::MalformedDiscriminator,
                "Property '" + name + "' could not be read as a discriminator: " + e.what());
        }
    };
}

// ******************************************************************************** DispatchConverter

/// @brief 判別子の値で具象型を選び、その型のフィールド単位の読み込みへ委譲するコンバータ。
/// @tparam Union 読み込み結果の型（unique_ptr<Base> など）
/// @tparam Case 判別子の型
/// @note 構築後は不変で、複数スレッドから共有できる。振り分け中の状態は JsonParser が持つ。
template <typename Union, typename Case>
class DispatchConverter {
    using Traits = DispatchUnionTraits<Union>;

public:
    using Value = Union;
    using Target = typename Traits::Target;
    using Decoder = std::function<Union(JsonParser&)>;
    using Extractor = std::function<Case(const JsonValue&, const ReadOptions&)>;
    using Resolver = std::function<std::optional<Decoder>(const Case&)>;
    using CaseEntry = std::pair<Case, Decoder>;
    using Registry = CaseRegistry<Case, Decoder>;

    // ******************************************************************************** 構築
public:
    // @brief 名前付きフィールドの判別子と、判別子の値ごとのデコーダで構築する
    DispatchConverter(std::string name, std::initializer_list<CaseEntry> cases,
        DispatchWriteMode mode = DispatchWriteMode::PassThrough)
        : DispatchConverter(makeFieldExtractor<Case>(std::move(name)), std::vector<CaseEntry>(cases), mode) {}

    DispatchConverter(Extractor extractor, std::initializer_list<CaseEntry> cases,
        DispatchWriteMode mode = DispatchWriteMode::PassThrough)
        : DispatchConverter(std::move(extractor), std::vector<CaseEntry>(cases), mode) {}

    DispatchConverter(Extractor extractor, std::vector<CaseEntry> cases,
        DispatchWriteMode mode = DispatchWriteMode::PassThrough)
        : DispatchConverter(std::move(extractor), makeRegistryResolver(std::move(cases)), mode) {}

    // @brief 判別子の値からデコーダを求める関数で構築する
    DispatchConverter(Extractor extractor, Resolver resolver,
        DispatchWriteMode mode = DispatchWriteMode::PassThrough)
        : extractor_(std::move(extractor)), resolver_(std::move(resolver)), mode_(mode) {
        if (!extractor_) {
            throw std::invalid_argument("DispatchConverter: extractor must not be empty");
        }
        if (!resolver_) {
            throw std::invalid_argument("DispatchConverter: resolver must not be empty");
        }
    }

    // @brief 判別子の値と具象型の組を作る
    template <typename Concrete>
    static CaseEntry when(Case value) {
        return CaseEntry{ std::move(value), decodeAs<Concrete>() };
    }

    // @brief 具象型をフィールド単位で読み込むデコーダ
    template <typename Concrete>
    static Decoder decodeAs() {
        if constexpr (Traits::pointer) {
            static_assert(std::is_base_of_v<Target, Concrete>,
                "DispatchConverter: case type must derive from the target type");
        }
        return [](JsonParser& parser) -> Union {
            return Union(readValue<typename Traits::template Decoded<Concrete>>(parser));
        };
    }

    // ******************************************************************************** 読み込み
public:
    Union read(JsonParser& parser) const {
        const JsonTokenType tokenType = parser.nextTokenType();
        if constexpr (Traits::nullable) {
            if (tokenType == JsonTokenType::Null) {
                parser.skipValue();
                return Union{};
            }
        }
        if (tokenType != JsonTokenType::StartObject) {
            throw SerializationError(SerializationErrorKind::NotAnObject,
                "Cannot deserialize " + getTypeName<Target>() + " from any other value (\""
                    + std::string(tokenTypeName(tokenType)) + "\") than a JSON object.");
        }

        const std::size_t depth = parser.depth();
        std::vector<JsonToken> tokens = parser.captureValue();
        const JsonValue root = JsonValue::fromTokens(tokens, parser.options());

        const Case value = extractor_(root, parser.options());
        const std::optional<Decoder> decoder = resolver_(value);
        if (!decoder || !*decoder) {
            throw UnhandledCaseError(getTypeName<Target>(), toDiagnosticString(value));
        }

        // 同じ値を具象型のデコーダに読ませる。この深さでは同じ基底型への振り分けを抑止する。
        parser.replay(std::move(tokens));
        DispatchSuppressionScope scope(parser.dispatchSuppression(), std::type_index(typeid(Target)), depth);
        return (*decoder)(parser);
    }

    // ******************************************************************************** 書き出し
public:
    bool canWrite() const { return mode_ == DispatchWriteMode::PassThrough; }

    DispatchWriteMode writeMode() const { return mode_; }

    std::type_index targetType() const { return std::type_index(typeid(Target)); }

    void write(JsonWriter& writer, const Union& value) const {
        if (!canWrite()) {
            throw SerializationError(SerializationErrorKind::EncodeUnsupported,
                "Writing " + getTypeName<Target>() + " is not supported by this converter.");
        }
        if constexpr (Traits::pointer) {
            if (!value) {
                writer.null();
                return;
            }
            writeObject(writer, *value);
        } else {
            writeObject(writer, value);
        }
    }

    // @brief 実行時の型のフィールドをそのまま書き出す（判別子の付加は行わない）
    void writeObject(JsonWriter& writer, const Target& value) const {
        if constexpr (Traits::pointer) {
            writeObjectFields(writer, value);
        } else if constexpr (IsStdOptional<Target>) {
            if (!value) {
                writer.null();
                return;
            }
            writeAlternative(writer, *value);
        } else {
            writeAlternative(writer, value);
        }
    }

private:
    template <typename Variant>
    static void writeAlternative(JsonWriter& writer, const Variant& value) {
        std::visit([&](const auto& alternative) {
            writeValue(writer, alternative);
        }, value);
    }

    static Resolver makeRegistryResolver(std::vector<CaseEntry> cases) {
        for (const CaseEntry& entry : cases) {
            if (!entry.second) {
                throw std::invalid_argument("DispatchConverter: case decoder must not be empty");
            }
        }
        auto registry = std::make_shared<const Registry>(std::move(cases));
        return [registry](const Case& value) -> std::optional<Decoder> {
            if (const Decoder* decoder = registry->find(value)) {
                return *decoder;
            }
            return std::nullopt;
        };
    }

    // ******************************************************************************** メンバー変数
private:
    Extractor extractor_;    ///< 判別子の抽出関数
    Resolver resolver_;      ///< 判別子の値 -> デコーダ
    DispatchWriteMode mode_; ///< 書き出し時の動作
};

}  // namespace kirikae::serialization
