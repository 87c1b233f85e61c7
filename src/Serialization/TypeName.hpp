// @file TypeName.hpp
// @brief エラーメッセージ用の型名・値の文字列化。

#pragma once

#include <concepts>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>

namespace kirikae::serialization {

/// @brief jsonTypeName() で表示名を持つ型を判定するconcept。
template <typename T>
concept HasJsonTypeName = requires {
    { T::jsonTypeName() } -> std::convertible_to<std::string_view>;
};

/// @brief 型の表示名。jsonTypeName() が無ければ処理系の型名。
template <typename T>
std::string getTypeName() {
    if constexpr (HasJsonTypeName<T>) {
        return std::string(T::jsonTypeName());
    } else {
        return typeid(T).name();
    }
}

/// @brief 値を診断メッセージ用の文字列にする。
/// @note enum は基底の整数値で表す。
template <typename T>
std::string toDiagnosticString(const T& value) {
    if constexpr (std::is_same_v<T, bool>) {
        return value ? "true" : "false";
    } else if constexpr (std::is_enum_v<T>) {
        return toDiagnosticString(static_cast<std::underlying_type_t<T>>(value));
    } else if constexpr (std::is_same_v<T, char> || std::is_same_v<T, signed char>
                         || std::is_same_v<T, unsigned char>) {
        return std::to_string(static_cast<int>(value));
    } else if constexpr (std::is_integral_v<T>) {
        return std::to_string(value);
    } else if constexpr (std::is_convertible_v<const T&, std::string_view>) {
        return std::string(std::string_view(value));
    } else if constexpr (requires { { value.toString() } -> std::convertible_to<std::string>; }) {
        return std::string(value.toString());
    } else if constexpr (requires(std::ostream& os) { os << value; }) {
        std::ostringstream oss;
        oss << value;
        return oss.str();
    } else {
        return "<" + getTypeName<T>() + ">";
    }
}

}  // namespace kirikae::serialization
