// @file JsonWriter.hpp
// @brief JSONライターの定義。構造体からJSON5へのシリアライズを提供する。

#pragma once

#include <charconv>
#include <cmath>
#include <cstdio>
#include <ostream>
#include <string_view>
#include <type_traits>

namespace kirikae::serialization {

// @brief 書き出し時の設定
struct WriteOptions {
    bool quoteAllKeys = false;    ///< 識別子として有効なキーも引用符で囲む（厳格なJSON出力）
    bool skipNullValues = false;  ///< 値がnullのフィールドを出力しない
};

// @brief JSON5出力用の簡易Writer。
// - 識別子として有効なキーは引用符なし、それ以外は引用符付きで出力する
// - 空白・改行は出力しない
class JsonWriter {
    std::ostream& stream_;
    WriteOptions options_;
    bool needsComma_ = false;  // 次の要素の前にカンマが必要かどうか

    // @brief 文字列をエスケープして出力
    void escapeString(std::string_view str) {
        stream_ << '"';
        for (char c : str) {
            switch (c) {
            case '"':  stream_ << "\\\""; break;
            case '\\': stream_ << "\\\\"; break;
            case '\b': stream_ << "\\b"; break;
            case '\f': stream_ << "\\f"; break;
            case '\n': stream_ << "\\n"; break;
            case '\r': stream_ << "\\r"; break;
            case '\t': stream_ << "\\t"; break;
            case '\v': stream_ << "\\v"; break;
            case '\0': stream_ << "\\0"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    stream_ << buf;
                } else {
                    stream_ << c;
                }
                break;
            }
        }
        stream_ << '"';
    }

    // @brief キーが識別子として有効かチェック（ASCIIのみ）
    static bool isValidIdentifier(std::string_view keyName) {
        if (keyName.empty()) {
            return false;
        }
        auto isStart = [](char c) {
            return ('a' <= c && c <= 'z') || ('A' <= c && c <= 'Z') || c == '$' || c == '_';
        };
        if (!isStart(keyName[0])) {
            return false;
        }
        for (char c : keyName.substr(1)) {
            if (!isStart(c) && !('0' <= c && c <= '9')) {
                return false;
            }
        }
        return true;
    }

    void writeCommaIfNeeded() {
        if (needsComma_) {
            stream_ << ',';
        }
        needsComma_ = true;
    }

public:
    // @brief コンストラクタ
    // @param os 出力先ストリーム
    // @param options 書き出し設定
    explicit JsonWriter(std::ostream& os, WriteOptions options = {})
        : stream_(os), options_(options) {}

    const WriteOptions& options() const { return options_; }

    void startObject() {
        writeCommaIfNeeded();
        stream_ << '{';
        needsComma_ = false;
    }

    void endObject() {
        stream_ << '}';
        needsComma_ = true;
    }

    void startArray() {
        writeCommaIfNeeded();
        stream_ << '[';
        needsComma_ = false;
    }

    void endArray() {
        stream_ << ']';
        needsComma_ = true;
    }

    // @brief キーの書き込み
    void key(std::string_view keyName) {
        writeCommaIfNeeded();
        if (!options_.quoteAllKeys && isValidIdentifier(keyName)) {
            stream_ << keyName;
        } else {
            escapeString(keyName);
        }
        stream_ << ':';
        needsComma_ = false;
    }

    void null() {
        writeCommaIfNeeded();
        stream_ << "null";
    }

    // プロパティ名なしでの書き出し（ルート要素やArray要素用）

    void writeObject(bool value) {
        writeCommaIfNeeded();
        stream_ << (value ? "true" : "false");
    }

    // @brief 1文字を文字列として書き込み
    void writeObject(char value) {
        writeCommaIfNeeded();
        escapeString(std::string_view(&value, 1));
    }

    template <typename T>
        requires std::is_integral_v<T> && (!std::is_same_v<T, bool>) && (!std::is_same_v<T, char>)
    void writeObject(T value) {
        writeCommaIfNeeded();
        if constexpr (sizeof(T) == 1) {
            stream_ << static_cast<int>(value);
        } else {
            stream_ << value;
        }
    }

    // @brief 浮動小数点数値の書き込み（往復可能な最短表記）
    template <typename T>
        requires std::is_floating_point_v<T>
    void writeObject(T value) {
        writeCommaIfNeeded();
        if (std::isnan(value)) {
            stream_ << "NaN";
        } else if (std::isinf(value)) {
            stream_ << (value > 0 ? "Infinity" : "-Infinity");
        } else {
            char buf[64];
            const auto result = std::to_chars(buf, buf + sizeof(buf), value);
            stream_.write(buf, result.ptr - buf);
        }
    }

    void writeObject(std::string_view value) {
        writeCommaIfNeeded();
        escapeString(value);
    }

    void writeObject(const char* value) {
        writeObject(std::string_view(value));
    }
};

}  // namespace kirikae::serialization
