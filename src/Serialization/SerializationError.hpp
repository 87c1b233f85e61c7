// @file SerializationError.hpp
// @brief 判別子による振り分け・値ラッパー変換で送出する例外。

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace kirikae::serialization {

// @brief 失敗の分類
enum class SerializationErrorKind {
    NotAnObject,             ///< ルートがJSONオブジェクトでない
    MissingDiscriminator,    ///< 判別子フィールドが存在しない
    MalformedDiscriminator,  ///< 判別子フィールドを判別子の型として読めない
    UnhandledCase,           ///< 判別子の値に対応する型が登録されていない
    IncompatibleCase,        ///< 振り分け結果が要求された型に変換できない
    UnexpectedToken,         ///< 値ラッパーが文字列以外のトークンを受け取った
    EncodeUnsupported        ///< 読み込み専用コンバータへの書き出し
};

// @brief 分類名（診断用）
std::string_view toString(SerializationErrorKind kind);

// @brief 分類付きの実行時エラー
class SerializationError : public std::runtime_error {
public:
    SerializationError(SerializationErrorKind kind, const std::string& message);

    SerializationErrorKind kind() const noexcept { return kind_; }

private:
    SerializationErrorKind kind_;
};

// @brief 未登録の判別子の値。値と対象型名を保持する。
class UnhandledCaseError : public SerializationError {
public:
    UnhandledCaseError(std::string typeName, std::string caseText);

    const std::string& typeName() const noexcept { return typeName_; }
    const std::string& caseText() const noexcept { return caseText_; }

private:
    std::string typeName_;
    std::string caseText_;
};

}  // namespace kirikae::serialization
