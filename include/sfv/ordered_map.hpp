#pragma once

/// @file ordered_map.hpp
/// @brief OrderedMap: associative container that keeps insertion order.
///
/// Implementation:
///   - Contiguous vector of (key, value) pairs, no hash index
///   - Lookup is a linear scan returning the first match
///   - Keyed assignment of an existing key removes the old pair and appends
///     the new one: the entry moves to the most-recently-set position
///   - Index-based access is O(1); any insert or remove invalidates indices
///
/// @code
///   sfv::OrderedMap<std::string, int> m;
///   m.set("a", 1);
///   m.set("b", 2);
///   m.set("a", 3);            // order is now b, a
///   m.set("b", std::nullopt); // removes b
/// @endcode

#include "detail/hash.hpp"

#include <algorithm>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace sfv {

template <typename K, typename V>
class OrderedMap {
public:
    using key_type        = K;
    using mapped_type     = V;
    using value_type      = std::pair<K, V>;
    using storage_type    = std::vector<value_type>;
    using size_type       = size_t;
    using iterator        = typename storage_type::iterator;
    using const_iterator  = typename storage_type::const_iterator;

    /// @brief Position in the map; a thin wrapper over an offset into the
    /// backing storage. Invalidated by any insert or remove.
    class Index {
    public:
        Index() noexcept = default;

        [[nodiscard]] Index advanced_by(std::ptrdiff_t n) const noexcept {
            return Index(static_cast<std::ptrdiff_t>(base_) + n);
        }
        [[nodiscard]] std::ptrdiff_t distance_to(Index other) const noexcept {
            return static_cast<std::ptrdiff_t>(other.base_) -
                   static_cast<std::ptrdiff_t>(base_);
        }
        [[nodiscard]] size_type offset() const noexcept { return base_; }

        bool operator==(Index o) const noexcept { return base_ == o.base_; }
        bool operator!=(Index o) const noexcept { return base_ != o.base_; }
        bool operator<(Index o) const noexcept  { return base_ < o.base_; }
        bool operator<=(Index o) const noexcept { return base_ <= o.base_; }
        bool operator>(Index o) const noexcept  { return base_ > o.base_; }
        bool operator>=(Index o) const noexcept { return base_ >= o.base_; }

    private:
        friend class OrderedMap;
        explicit Index(std::ptrdiff_t base) noexcept
            : base_(static_cast<size_type>(base)) {}

        size_type base_ = 0;
    };

    OrderedMap() = default;

    /// Literal construction: order is preserved and duplicates are kept.
    OrderedMap(std::initializer_list<value_type> init)
        : backing_(init.begin(), init.end()) {}

    // ─── Keyed access ───────────────────────────────────────────────────

    /// Linear scan; returns the first matching entry's value.
    [[nodiscard]] const V* find(const K& key) const noexcept {
        for (const auto& entry : backing_)
            if (entry.first == key) return &entry.second;
        return nullptr;
    }

    [[nodiscard]] V* find(const K& key) noexcept {
        for (auto& entry : backing_)
            if (entry.first == key) return &entry.second;
        return nullptr;
    }

    [[nodiscard]] std::optional<V> get(const K& key) const {
        const V* p = find(key);
        if (p) return *p;
        return std::nullopt;
    }

    [[nodiscard]] bool contains(const K& key) const noexcept {
        return find(key) != nullptr;
    }

    /// Assign or remove. An existing entry is always removed first; a present
    /// value is then appended at the end.
    void set(const K& key, std::optional<V> value) {
        auto existing = std::find_if(backing_.begin(), backing_.end(),
                                     [&](const value_type& e) { return e.first == key; });
        if (existing != backing_.end()) backing_.erase(existing);
        if (value.has_value()) backing_.emplace_back(key, std::move(*value));
    }

    // ─── Positional access ──────────────────────────────────────────────

    [[nodiscard]] Index start_index() const noexcept { return Index(0); }
    [[nodiscard]] Index end_index() const noexcept {
        return Index(static_cast<std::ptrdiff_t>(backing_.size()));
    }
    [[nodiscard]] Index index(Index i, std::ptrdiff_t offset) const noexcept {
        return i.advanced_by(offset);
    }
    [[nodiscard]] Index index_after(Index i) const noexcept { return i.advanced_by(1); }
    [[nodiscard]] Index index_before(Index i) const noexcept { return i.advanced_by(-1); }

    /// Positional element access. Assigning through the reference replaces the
    /// pair in place and does not check the new key for uniqueness.
    value_type& operator[](Index i) { return backing_[i.base_]; }
    const value_type& operator[](Index i) const { return backing_[i.base_]; }

    // ─── Capacity ───────────────────────────────────────────────────────
    [[nodiscard]] size_type size() const noexcept { return backing_.size(); }
    [[nodiscard]] bool empty() const noexcept { return backing_.empty(); }

    // ─── Iterators ──────────────────────────────────────────────────────
    iterator begin() noexcept { return backing_.begin(); }
    iterator end()   noexcept { return backing_.end(); }
    const_iterator begin()  const noexcept { return backing_.begin(); }
    const_iterator end()    const noexcept { return backing_.end(); }
    const_iterator cbegin() const noexcept { return backing_.cbegin(); }
    const_iterator cend()   const noexcept { return backing_.cend(); }

    /// Structural comparison: the full ordered sequence of pairs must match.
    bool operator==(const OrderedMap& other) const { return backing_ == other.backing_; }
    bool operator!=(const OrderedMap& other) const { return !(*this == other); }

    /// Render as "[k1: v1, k2: v2]". K and V must be streamable.
    [[nodiscard]] std::string to_debug_string() const {
        std::ostringstream os;
        os << '[';
        bool first = true;
        for (const auto& [k, v] : backing_) {
            if (!first) os << ", ";
            first = false;
            os << k << ": " << v;
        }
        os << ']';
        return os.str();
    }

    const storage_type& storage() const noexcept { return backing_; }

private:
    storage_type backing_;
};

} // namespace sfv

namespace std {
template <typename K, typename V>
struct hash<sfv::OrderedMap<K, V>> {
    size_t operator()(const sfv::OrderedMap<K, V>& m) const {
        uint64_t h = sfv::detail::hash_init(m.size());
        for (const auto& [k, v] : m) {
            h = sfv::detail::hash_combine(h, std::hash<K>{}(k));
            h = sfv::detail::hash_combine(h, std::hash<V>{}(v));
        }
        return sfv::detail::hash_finish(h);
    }
};
} // namespace std
