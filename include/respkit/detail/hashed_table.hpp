#pragma once

#include <respkit/assert.hpp>

#include <cstddef>
#include <unordered_map>
#include <utility>
#include <vector>

namespace respkit::detail {

/// Insertion-ordered hash table with explicit hash and key-equality functors.
///
/// Entries are stored in a vector in insertion order; `index_` maps a key's
/// hash to the positions of the entries with that hash. Keys are unique under
/// `KeyEqual`, and `Hash` must agree with it (equal keys hash equal).
///
/// `K` and `V` may be incomplete where the table is declared as a member;
/// the functors are default-constructed on use, never stored.
///
/// Not thread-safe: one writer, no readers during writes.
template <typename K, typename V, typename Hash, typename KeyEqual>
class hashed_table {
 public:
  using key_type = K;
  using mapped_type = V;
  using value_type = std::pair<K, V>;
  using const_iterator = typename std::vector<value_type>::const_iterator;

  hashed_table() = default;

  [[nodiscard]] auto size() const noexcept -> std::size_t { return entries_.size(); }
  [[nodiscard]] auto empty() const noexcept -> bool { return entries_.empty(); }

  [[nodiscard]] auto begin() const noexcept -> const_iterator { return entries_.begin(); }
  [[nodiscard]] auto end() const noexcept -> const_iterator { return entries_.end(); }

  /// Returns the entry whose key equals `key`, or nullptr.
  [[nodiscard]] auto find(const K& key) const -> const value_type* {
    auto pos = locate(key, hash_of(key));
    return pos == npos ? nullptr : &entries_[pos];
  }

  /// Adds the entry unless an equal key exists.
  ///
  /// Returns the position of the entry with that key and whether it was
  /// inserted. An existing entry is left untouched.
  auto try_emplace(K key, V value) -> std::pair<std::size_t, bool> {
    auto h = hash_of(key);
    if (auto pos = locate(key, h); pos != npos) {
      return {pos, false};
    }
    return {append(h, std::move(key), std::move(value)), true};
  }

  /// Adds the entry, or replaces the value of an existing equal key in place.
  ///
  /// The original key object and its position are kept on replacement.
  auto insert_or_assign(K key, V value) -> std::pair<std::size_t, bool> {
    auto h = hash_of(key);
    if (auto pos = locate(key, h); pos != npos) {
      entries_[pos].second = std::move(value);
      return {pos, false};
    }
    return {append(h, std::move(key), std::move(value)), true};
  }

  void clear() noexcept {
    entries_.clear();
    index_.clear();
  }

 private:
  static constexpr std::size_t npos = static_cast<std::size_t>(-1);

  static auto hash_of(const K& key) -> std::size_t { return static_cast<std::size_t>(Hash{}(key)); }

  auto locate(const K& key, std::size_t h) const -> std::size_t {
    auto [first, last] = index_.equal_range(h);
    for (auto it = first; it != last; ++it) {
      RESPKIT_ASSERT(it->second < entries_.size());
      if (KeyEqual{}(entries_[it->second].first, key)) {
        return it->second;
      }
    }
    return npos;
  }

  auto append(std::size_t h, K key, V value) -> std::size_t {
    auto pos = entries_.size();
    entries_.emplace_back(std::move(key), std::move(value));
    index_.emplace(h, pos);
    return pos;
  }

  std::vector<value_type> entries_;
  std::unordered_multimap<std::size_t, std::size_t> index_;
};

}  // namespace respkit::detail
