// @file TextInputSource.hpp
// @brief メモリ上の文字列を読み取るトークナイザー用入力元。

#pragma once

#include <algorithm>
#include <cstddef>
#include <string_view>

namespace kirikae::serialization {

// @brief 文字列を先頭から順に読み取る入力元
// @note 参照する文字列は読み取り完了まで呼び出し側が保持すること。
class TextInputSource {
public:
    explicit TextInputSource(std::string_view text) : text_(text) {}

    TextInputSource(const TextInputSource&) = delete;
    TextInputSource& operator=(const TextInputSource&) = delete;

    // @brief 現在の読み取り位置
    std::size_t position() const { return position_; }

    // @brief 現在位置から offset 先の文字を返す。範囲外なら '\0'
    char peekAhead(std::size_t offset) const {
        const std::size_t index = position_ + offset;
        return index < text_.size() ? text_[index] : '\0';
    }

    // @brief 読み取り位置を進める（終端を越えない）
    void consume(std::size_t count) {
        position_ = std::min(position_ + count, text_.size());
    }

private:
    std::string_view text_;     ///< 入力文字列
    std::size_t position_ = 0;  ///< 読み取り位置
};

}  // namespace kirikae::serialization
