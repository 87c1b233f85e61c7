// @file MessageOutput.hpp
// @brief 警告メッセージの出力先。

#pragma once

#include <iostream>
#include <string>
#include <vector>

namespace kirikae::serialization {

// @brief メッセージ出力用の基底クラス。
class MessageOutput {
public:
    virtual ~MessageOutput() = default;

    /// @brief 警告メッセージを出力する。
    /// @param msg 出力するメッセージ。
    virtual void warning(const std::string& msg) = 0;
};

// @brief 標準出力への警告出力
class StdoutMessageOutput : public MessageOutput {
public:
    /// @brief 警告メッセージを標準出力に出力する。
    /// @param msg 出力するメッセージ。
    void warning(const std::string& msg) override {
        std::cout << "Warning: " << msg << std::endl;
    }
};

// @brief 警告を蓄積するだけの出力先（診断・テスト用）
class CollectingMessageOutput : public MessageOutput {
public:
    void warning(const std::string& msg) override {
        messages_.push_back(msg);
    }

    const std::vector<std::string>& messages() const { return messages_; }

private:
    std::vector<std::string> messages_;
};

}  // namespace kirikae::serialization
