// @file SortedHashArrayMap.hpp
// @brief ハッシュ値でソートした固定長配列による読み取り専用マップ。

#pragma once

#include <algorithm>
#include <array>
#include <concepts>
#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <string_view>
#include <type_traits>

#include "Common/AsciiCase.hpp"

namespace kirikae::collection {

// @brief first/secondを持つキー・値ペアを判定するconcept。
template <typename KeyT, typename ValueT, typename PairT>
concept IsKeyValuePair = requires(const PairT& p) {
    { p.first } -> std::convertible_to<KeyT>;
    { p.second } -> std::convertible_to<ValueT>;
};

// ハッシュ・等価比較・順序比較を差し替える場合は特殊化する
template <typename K>
struct SortedHashArrayMapTraits {
    using Hash = std::hash<K>;
    using KeyEqual = std::equal_to<>;
    using KeyCompare = std::less<>;
};

/// @brief SortedHashArrayMapで保持するエントリ情報。
/// @tparam KeyType キーの型。
/// @tparam ValueType 値の型。
template <typename KeyType, typename ValueType>
struct MapEntry {
    KeyType key;                ///< キー。
    ValueType value;            ///< 値。
    std::size_t hash;           ///< キーから計算したハッシュ値。
    std::size_t originalIndex;  ///< 構築時の定義順序。
};

/// @brief ハッシュベースのソート済みマップ。
/// @tparam KeyType キーの型。
/// @tparam ValueType 値の型。
/// @tparam N エントリ数。
/// @note 構築後は変更しない。探索はハッシュの二分探索で行う。
template <
    typename KeyType,
    typename ValueType,
    std::size_t N,
    typename Traits = SortedHashArrayMapTraits<KeyType>
>
class SortedHashArrayMap {
    using Hash = typename Traits::Hash;
    using KeyEqual = typename Traits::KeyEqual;
    using KeyCompare = typename Traits::KeyCompare;

public:
    using Entry = MapEntry<KeyType, ValueType>;
    using iterator = const Entry*;
    using value_type = Entry;

    constexpr SortedHashArrayMap() = default;

    /// @brief キー・値ペアを列挙して構築する。
    /// @param pairs pair<KeyType, ValueType>互換の要素。
    template <typename... Pairs>
        requires (IsKeyValuePair<KeyType, ValueType, Pairs> && ...)
    constexpr explicit SortedHashArrayMap(const Pairs&... pairs) {
        static_assert(sizeof...(Pairs) == N, "SortedHashArrayMap: number of pairs must equal N");
        std::size_t i = 0;
        ((entries_[i] = makeEntry(pairs, i), ++i), ...);
        sortEntries();
    }

    // std::array から構築（要素数はNと一致すること）
    template <typename PairT>
        requires IsKeyValuePair<KeyType, ValueType, PairT>
    constexpr explicit SortedHashArrayMap(const std::array<PairT, N>& arr) {
        fillFromRange(arr.begin(), arr.end());
        sortEntries();
    }

    // C配列から構築
    template <typename PairT>
        requires IsKeyValuePair<KeyType, ValueType, PairT>
    constexpr explicit SortedHashArrayMap(const PairT (&arr)[N]) {
        fillFromRange(std::begin(arr), std::end(arr));
        sortEntries();
    }

    /// @brief 指定キーのエントリの定義順インデックスを探索する。
    /// @return 見つかった場合は定義順インデックス、未検出時はstd::nullopt。
    template <typename Lookup>
    std::optional<std::size_t> findIndex(const Lookup& key) const {
        if (const Entry* entry = findEntry(key)) {
            return entry->originalIndex;
        }
        return std::nullopt;
    }

    /// @brief 指定キーに対応する値を取得する。見つからなければ nullptr を返す。
    template <typename Lookup>
    const ValueType* findValue(const Lookup& key) const {
        if (const Entry* entry = findEntry(key)) {
            return &entry->value;
        }
        return nullptr;
    }

    /// @brief ASCII英字の大文字小文字を無視してキーを探索する。
    /// @return 一致したエントリのうち定義順が最も早いもののインデックス。
    /// @note ハッシュが使えないため線形探索になる。完全一致の探索に失敗した後でのみ使うこと。
    std::optional<std::size_t> findIndexIgnoreCase(std::string_view key) const
        requires std::convertible_to<const KeyType&, std::string_view> {
        std::optional<std::size_t> found;
        for (const Entry& entry : entries_) {
            if (equalsIgnoreAsciiCase(entry.key, key)
                && (!found || entry.originalIndex < *found)) {
                found = entry.originalIndex;
            }
        }
        return found;
    }

    static constexpr std::size_t size() { return N; }

    iterator begin() const { return entries_.data(); }
    iterator end() const { return entries_.data() + N; }

private:
    template <typename Lookup>
    const Entry* findEntry(const Lookup& key) const {
        const auto hash = Hash{}(key);
        const auto lower = std::lower_bound(entries_.begin(), entries_.end(), hash,
            [](const Entry& entry, std::size_t hashValue) {
                return entry.hash < hashValue;
            });
        for (auto it = lower; it != entries_.end() && it->hash == hash; ++it) {
            if (KeyEqual{}(it->key, key)) {
                return &*it;
            }
        }
        return nullptr;
    }

    template <typename PairT>
    static constexpr Entry makeEntry(const PairT& pair, std::size_t index) {
        return Entry{
            static_cast<KeyType>(pair.first),
            static_cast<ValueType>(pair.second),
            Hash{}(static_cast<KeyType>(pair.first)),
            index
        };
    }

    template <typename Iter>
    constexpr void fillFromRange(Iter begin, Iter end) {
        std::size_t i = 0;
        for (; begin != end; ++begin, ++i) {
            entries_[i] = makeEntry(*begin, i);
        }
    }

    constexpr void sortEntries() {
        std::sort(entries_.begin(), entries_.end(),
            [](const Entry& a, const Entry& b) {
                if (a.hash != b.hash) {
                    return a.hash < b.hash;
                }
                return KeyCompare{}(a.key, b.key);
            });
    }

    std::array<Entry, N> entries_{}; ///< ハッシュ順に整列したエントリ。
};

/// @brief pairの列からSortedHashArrayMapを構築する（キー・値型はpairから推論）。
template <typename First, typename... Pairs>
constexpr auto makeSortedHashArrayMap(First first, Pairs... pairs) {
    using Key = typename First::first_type;
    using Value = typename First::second_type;
    return SortedHashArrayMap<Key, Value, sizeof...(Pairs) + 1>(first, pairs...);
}

}  // namespace kirikae::collection
