/** \file hash_table.hpp
 *  \brief Open-addressing hash table and set with FNV-1a hashing.
 *
 * Collision policy: linear probing over a power-of-two slot array.
 * Resize policy: when live entries plus tombstones would exceed 0.75 of the
 * capacity the table is rehashed; the capacity doubles when live entries alone
 * exceed the threshold, otherwise tombstones are purged in place.
 *
 * Thread-safety: none internally. Concurrent const access is safe once no
 * writer remains, which is how the indexes use it after build.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace homeindex::container {

inline constexpr std::uint64_t fnv_offset_basis = 14695981039346656037ull;
inline constexpr std::uint64_t fnv_prime = 1099511628211ull;

/** \brief FNV-1a over a byte range, optionally continuing a previous state. */
inline auto fnv1a_bytes(const void* data, std::size_t n,
                        std::uint64_t state = fnv_offset_basis) noexcept -> std::uint64_t {
    const auto* p = static_cast<const unsigned char*>(data);
    for (std::size_t i = 0; i < n; ++i) {
        state ^= p[i];
        state *= fnv_prime;
    }
    return state;
}

/** \brief Default hasher. Specialize for composite key types. */
template <typename K, typename Enable = void>
struct fnv1a_hash;

template <typename K>
struct fnv1a_hash<K, std::enable_if_t<std::is_integral_v<K> || std::is_enum_v<K>>> {
    auto operator()(const K& key) const noexcept -> std::uint64_t {
        return fnv1a_bytes(&key, sizeof(K));
    }
};

template <>
struct fnv1a_hash<std::string_view> {
    auto operator()(std::string_view key) const noexcept -> std::uint64_t {
        return fnv1a_bytes(key.data(), key.size());
    }
};

template <>
struct fnv1a_hash<std::string> {
    auto operator()(const std::string& key) const noexcept -> std::uint64_t {
        return fnv1a_bytes(key.data(), key.size());
    }
};

template <typename A, typename B>
struct fnv1a_hash<std::pair<A, B>> {
    auto operator()(const std::pair<A, B>& key) const noexcept -> std::uint64_t {
        const std::uint64_t hb = fnv1a_hash<B>{}(key.second);
        return fnv1a_bytes(&hb, sizeof(hb), fnv1a_hash<A>{}(key.first));
    }
};

/** \brief Associative container mapping K to V.
 *
 * get() returns nullptr for an absent key; no lookup ever throws.
 * Complexity: amortized O(1) expected put/get/contains/erase.
 */
template <typename K, typename V,
          typename Hash = fnv1a_hash<K>,
          typename KeyEqual = std::equal_to<K>>
class HashTable {
public:
    using key_type = K;
    using mapped_type = V;
    using value_type = std::pair<const K, V>;

    static constexpr std::size_t default_capacity = 16;
    static constexpr std::size_t max_load_num = 3;   // max load factor 3/4
    static constexpr std::size_t max_load_den = 4;

private:
    struct Slot {
        std::optional<value_type> entry;
        bool tombstone{false};
    };

    template <bool Const>
    class basic_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = HashTable::value_type;
        using difference_type = std::ptrdiff_t;
        using reference = std::conditional_t<Const, const value_type&, value_type&>;
        using pointer = std::conditional_t<Const, const value_type*, value_type*>;
        using slot_ptr = std::conditional_t<Const, const Slot*, Slot*>;

        basic_iterator() = default;
        basic_iterator(slot_ptr cur, slot_ptr end) : cur_(cur), end_(end) { skip(); }

        // iterator -> const_iterator
        template <bool C = Const, typename = std::enable_if_t<C>>
        basic_iterator(const basic_iterator<false>& other)
            : cur_(other.cur_), end_(other.end_) {}

        auto operator*() const -> reference { return *cur_->entry; }
        auto operator->() const -> pointer { return &*cur_->entry; }
        auto operator++() -> basic_iterator& { ++cur_; skip(); return *this; }
        auto operator++(int) -> basic_iterator { auto tmp = *this; ++*this; return tmp; }
        friend auto operator==(const basic_iterator& a, const basic_iterator& b) -> bool {
            return a.cur_ == b.cur_;
        }
        friend auto operator!=(const basic_iterator& a, const basic_iterator& b) -> bool {
            return a.cur_ != b.cur_;
        }

    private:
        friend class basic_iterator<true>;
        void skip() { while (cur_ != end_ && !cur_->entry) ++cur_; }
        slot_ptr cur_{nullptr};
        slot_ptr end_{nullptr};
    };

public:
    using iterator = basic_iterator<false>;
    using const_iterator = basic_iterator<true>;

    HashTable() : HashTable(default_capacity) {}
    explicit HashTable(std::size_t initial_capacity)
        : slots_(round_up_pow2(initial_capacity)) {}

    /** \brief Insert or overwrite. \return true when the key was not present before. */
    auto put(const K& key, V value) -> bool {
        reserve_one();
        auto [idx, found] = find_slot(key);
        if (found) {
            slots_[idx].entry->second = std::move(value);
            return false;
        }
        occupy(idx, key, std::move(value));
        return true;
    }

    /** \brief Lookup. \return pointer to the value or nullptr when absent. */
    [[nodiscard]] auto get(const K& key) const noexcept -> const V* {
        auto [idx, found] = find_slot(key);
        return found ? &slots_[idx].entry->second : nullptr;
    }

    [[nodiscard]] auto get(const K& key) noexcept -> V* {
        auto [idx, found] = find_slot(key);
        return found ? &slots_[idx].entry->second : nullptr;
    }

    [[nodiscard]] auto contains(const K& key) const noexcept -> bool {
        return find_slot(key).second;
    }

    /** \brief Value for key, default-constructing it when missing. */
    auto get_or_insert(const K& key) -> V& {
        auto [idx, found] = find_slot(key);
        if (found) return slots_[idx].entry->second;
        if (needs_rehash()) {
            reserve_one();
            idx = find_slot(key).first;
        }
        occupy(idx, key, V{});
        return slots_[idx].entry->second;
    }

    /** \brief Remove key, leaving a tombstone. \return true when something was removed. */
    auto erase(const K& key) -> bool {
        auto [idx, found] = find_slot(key);
        if (!found) return false;
        slots_[idx].entry.reset();
        slots_[idx].tombstone = true;
        --size_;
        ++tombstones_;
        return true;
    }

    /** \brief Grow so that n entries fit without a further rehash. */
    void reserve(std::size_t n) {
        std::size_t cap = slots_.size();
        while (n * max_load_den >= cap * max_load_num) cap *= 2;
        if (cap != slots_.size()) rehash(cap);
    }

    void clear() {
        std::vector<Slot>(default_capacity).swap(slots_);
        size_ = 0;
        tombstones_ = 0;
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return size_; }
    [[nodiscard]] auto empty() const noexcept -> bool { return size_ == 0; }
    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return slots_.size(); }
    [[nodiscard]] auto load_factor() const noexcept -> double {
        return static_cast<double>(size_) / static_cast<double>(slots_.size());
    }

    auto begin() -> iterator { return iterator(slots_.data(), slots_.data() + slots_.size()); }
    auto end() -> iterator {
        auto* e = slots_.data() + slots_.size();
        return iterator(e, e);
    }
    auto begin() const -> const_iterator {
        return const_iterator(slots_.data(), slots_.data() + slots_.size());
    }
    auto end() const -> const_iterator {
        const auto* e = slots_.data() + slots_.size();
        return const_iterator(e, e);
    }

private:
    std::vector<Slot> slots_;
    std::size_t size_{0};
    std::size_t tombstones_{0};
    [[no_unique_address]] Hash hash_{};
    [[no_unique_address]] KeyEqual eq_{};

    static auto round_up_pow2(std::size_t n) noexcept -> std::size_t {
        std::size_t cap = 1;
        while (cap < n) cap <<= 1;
        return cap < 2 ? 2 : cap;
    }

    auto needs_rehash() const noexcept -> bool {
        return (size_ + tombstones_ + 1) * max_load_den > slots_.size() * max_load_num;
    }

    void reserve_one() {
        if (!needs_rehash()) return;
        const bool grow = (size_ + 1) * max_load_den > slots_.size() * max_load_num;
        rehash(grow ? slots_.size() * 2 : slots_.size());
    }

    void occupy(std::size_t idx, const K& key, V value) {
        if (slots_[idx].tombstone) {
            slots_[idx].tombstone = false;
            --tombstones_;
        }
        slots_[idx].entry.emplace(key, std::move(value));
        ++size_;
    }

    // Returns (index, found). When not found, index is the first reusable slot
    // on the search path (earliest tombstone, else the terminating empty slot).
    auto find_slot(const K& key) const noexcept -> std::pair<std::size_t, bool> {
        const std::size_t mask = slots_.size() - 1;
        std::size_t idx = static_cast<std::size_t>(hash_(key)) & mask;
        std::optional<std::size_t> first_tombstone;
        for (std::size_t step = 0; step < slots_.size(); ++step) {
            const Slot& s = slots_[idx];
            if (s.entry) {
                if (eq_(s.entry->first, key)) return {idx, true};
            } else if (s.tombstone) {
                if (!first_tombstone) first_tombstone = idx;
            } else {
                return {first_tombstone.value_or(idx), false};
            }
            idx = (idx + 1) & mask;
        }
        // Slot sequence wrapped; the load bound guarantees a tombstone exists here.
        return {first_tombstone.value_or(idx), false};
    }

    void rehash(std::size_t new_capacity) {
        std::vector<Slot> old(round_up_pow2(new_capacity));
        old.swap(slots_);
        size_ = 0;
        tombstones_ = 0;
        for (auto& s : old) {
            if (!s.entry) continue;
            auto idx = find_slot(s.entry->first).first;
            slots_[idx].entry.emplace(std::move(*s.entry));
            ++size_;
        }
    }
};

/** \brief Unordered duplicate-free set backed by HashTable. */
template <typename K,
          typename Hash = fnv1a_hash<K>,
          typename KeyEqual = std::equal_to<K>>
class HashSet {
    struct unit {};
    using table_type = HashTable<K, unit, Hash, KeyEqual>;

public:
    using value_type = K;

    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = K;
        using difference_type = std::ptrdiff_t;
        using reference = const K&;
        using pointer = const K*;

        const_iterator() = default;
        explicit const_iterator(typename table_type::const_iterator it) : it_(it) {}

        auto operator*() const -> reference { return it_->first; }
        auto operator->() const -> pointer { return &it_->first; }
        auto operator++() -> const_iterator& { ++it_; return *this; }
        auto operator++(int) -> const_iterator { auto tmp = *this; ++it_; return tmp; }
        friend auto operator==(const const_iterator& a, const const_iterator& b) -> bool {
            return a.it_ == b.it_;
        }
        friend auto operator!=(const const_iterator& a, const const_iterator& b) -> bool {
            return a.it_ != b.it_;
        }

    private:
        typename table_type::const_iterator it_{};
    };

    HashSet() = default;
    explicit HashSet(std::size_t initial_capacity) : table_(initial_capacity) {}

    auto insert(const K& key) -> bool { return table_.put(key, unit{}); }
    auto erase(const K& key) -> bool { return table_.erase(key); }
    [[nodiscard]] auto contains(const K& key) const noexcept -> bool { return table_.contains(key); }
    void reserve(std::size_t n) { table_.reserve(n); }
    void clear() { table_.clear(); }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return table_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return table_.empty(); }
    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return table_.capacity(); }

    auto begin() const -> const_iterator { return const_iterator(table_.begin()); }
    auto end() const -> const_iterator { return const_iterator(table_.end()); }

private:
    table_type table_;
};

} // namespace homeindex::container
