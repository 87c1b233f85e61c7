// @file DispatchSuppression.hpp
// @brief 判別子による振り分けの再入抑止状態。

#pragma once

#include <algorithm>
#include <cstddef>
#include <typeindex>
#include <vector>

namespace kirikae::serialization {

// @brief 振り分けを抑止中の（基底型, ネスト深さ）の組を保持するスタック。
// @note JsonParserが1つずつ所有する。読み込み呼び出しごとに独立しており、スレッド間で共有しない。
class DispatchSuppressionSet {
public:
    // @brief 指定の基底型が指定の深さで抑止中か
    bool contains(std::type_index type, std::size_t depth) const {
        return std::any_of(entries_.begin(), entries_.end(), [&](const Entry& entry) {
            return entry.type == type && entry.depth == depth;
        });
    }

    bool empty() const { return entries_.empty(); }

    std::size_t size() const { return entries_.size(); }

private:
    friend class DispatchSuppressionScope;

    struct Entry {
        std::type_index type;
        std::size_t depth;
    };

    std::vector<Entry> entries_;
};

// @brief 抑止エントリを積み、スコープ終了時（例外による脱出を含む）に取り除くガード。
class DispatchSuppressionScope {
public:
    DispatchSuppressionScope(DispatchSuppressionSet& set, std::type_index type, std::size_t depth)
        : set_(set) {
        set_.entries_.push_back(DispatchSuppressionSet::Entry{type, depth});
    }

    ~DispatchSuppressionScope() {
        set_.entries_.pop_back();
    }

    DispatchSuppressionScope(const DispatchSuppressionScope&) = delete;
    DispatchSuppressionScope& operator=(const DispatchSuppressionScope&) = delete;

private:
    DispatchSuppressionSet& set_;
};

}  // namespace kirikae::serialization
