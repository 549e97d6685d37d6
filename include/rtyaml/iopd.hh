// `iopd` is an insertion-order-preserving dictionary, the storage behind round-trip mappings and
// sets: keys keep the order they were loaded or inserted in, lookups go through a hash index.
#pragma once

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rtyaml {

template <typename K, typename V, typename Hash = std::hash<K>> class iopd {
public:
  using key_type = K;
  using mapped_type = V;
  using size_type = std::size_t;

  struct entry {
    key_type key;
    mapped_type value;

    entry(key_type k, mapped_type v) : key(std::move(k)), value(std::move(v)) {}
  };

  using storage_type = std::vector<entry>;
  using iterator = typename storage_type::iterator;
  using const_iterator = typename storage_type::const_iterator;

private:
  // key -> position in `storage_`
  std::unordered_map<key_type, size_type, Hash> index_;
  storage_type storage_;

  iterator nth(size_type idx) { return storage_.begin() + static_cast<std::ptrdiff_t>(idx); }
  const_iterator nth(size_type idx) const { return storage_.cbegin() + static_cast<std::ptrdiff_t>(idx); }

  void reindex_from(size_type idx) {
    for (size_type i = idx; i < storage_.size(); ++i) {
      index_[storage_[i].key] = i;
    }
  }

public:
  iopd() = default;

  [[nodiscard]] bool empty() const noexcept { return storage_.empty(); }
  [[nodiscard]] size_type size() const noexcept { return storage_.size(); }

  iterator begin() noexcept { return storage_.begin(); }
  iterator end() noexcept { return storage_.end(); }
  const_iterator begin() const noexcept { return storage_.cbegin(); }
  const_iterator end() const noexcept { return storage_.cend(); }

  bool contains(const key_type &key) const { return index_.find(key) != index_.end(); }

  // Position of `key`, size() when absent
  size_type position(const key_type &key) const {
    auto it = index_.find(key);
    return it == index_.end() ? storage_.size() : it->second;
  }

  iterator find(const key_type &key) {
    auto it = index_.find(key);
    return it == index_.end() ? storage_.end() : nth(it->second);
  }

  const_iterator find(const key_type &key) const {
    auto it = index_.find(key);
    return it == index_.end() ? storage_.cend() : nth(it->second);
  }

  const entry &nth_entry(size_type idx) const { return storage_.at(idx); }

  // Overwrite in place when the key exists (order unchanged), else append.
  // Returns {iterator, true} when a new entry was appended.
  std::pair<iterator, bool> insert_or_assign(key_type key, mapped_type value) {
    auto idx_it = index_.find(key);
    if (idx_it != index_.end()) {
      storage_[idx_it->second].value = std::move(value);
      return {nth(idx_it->second), false};
    }
    const size_type new_index = storage_.size();
    index_.emplace(key, new_index);
    storage_.emplace_back(std::move(key), std::move(value));
    return {storage_.end() - 1, true};
  }

  // Insert at `pos` (clamped to size()), an existing key is moved there with the new value
  void insert(size_type pos, key_type key, mapped_type value) {
    erase(key);
    if (pos > storage_.size()) {
      pos = storage_.size();
    }
    storage_.emplace(nth(pos), std::move(key), std::move(value));
    reindex_from(pos);
  }

  // Removes the entry with given key, preserving order of remaining items.
  // Returns true if an element was erased.
  bool erase(const key_type &key) {
    auto idx_it = index_.find(key);
    if (idx_it == index_.end())
      return false;

    const size_type idx = idx_it->second;
    storage_.erase(nth(idx));
    index_.erase(idx_it);
    reindex_from(idx);
    return true;
  }

  void clear() noexcept {
    index_.clear();
    storage_.clear();
  }
};

} // namespace rtyaml
