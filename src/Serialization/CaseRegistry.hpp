// @file CaseRegistry.hpp
// @brief 判別子の値からデコーダへの対応表。

#pragma once

#include <cstddef>
#include <functional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace kirikae::serialization {

// @brief 判別子の値 -> デコーダ の読み取り専用マップ
// @tparam Case 判別子の型（std::hash と == が必要）
// @tparam Decoder デコーダ型
// @note 同じ値が複数回登録された場合は後の登録が優先される。構築後は変更しない。
template <typename Case, typename Decoder>
class CaseRegistry {
public:
    using Entry = std::pair<Case, Decoder>;

    explicit CaseRegistry(std::vector<Entry> entries) {
        decoders_.reserve(entries.size());
        for (Entry& entry : entries) {
            decoders_.insert_or_assign(std::move(entry.first), std::move(entry.second));
        }
    }

    // @brief 判別子の値に対応するデコーダ。未登録ならnullptr
    const Decoder* find(const Case& value) const {
        const auto it = decoders_.find(value);
        return it != decoders_.end() ? &it->second : nullptr;
    }

    std::size_t size() const { return decoders_.size(); }

private:
    std::unordered_map<Case, Decoder> decoders_;
};

}  // namespace kirikae::serialization
