// @file AsciiCase.hpp
// @brief ASCII範囲での大文字小文字を無視した文字列比較。

#pragma once

#include <cstddef>
#include <string_view>

namespace kirikae::collection {

// @brief ASCII英字を小文字化する（それ以外はそのまま）
constexpr char toAsciiLower(char c) {
    return ('A' <= c && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

// @brief ASCII英字の大文字小文字を無視して比較する
// @note UTF-8の多バイト文字はバイト単位で完全一致を要求する
constexpr bool equalsIgnoreAsciiCase(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (toAsciiLower(lhs[i]) != toAsciiLower(rhs[i])) {
            return false;
        }
    }
    return true;
}

}  // namespace kirikae::collection
