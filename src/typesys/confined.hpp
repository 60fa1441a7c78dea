#pragma once

#include <cstddef>
#include <map>
#include <utility>

#include <fmt/format.h>

#include "typesys/error.hpp"

namespace st::typesys {

/// Ordered map holding at most `Max` entries. Reaching the bound is reported
/// as a bounds error, never by silently dropping the entry.
template <typename K, typename V, std::size_t Max>
class ConfinedMap {
 public:
  using Map = std::map<K, V>;
  using const_iterator = typename Map::const_iterator;

  static constexpr std::size_t kMaxLen = Max;

  /// Insert or replace. Returns true when the key was already present.
  auto insert(K key, V value) -> Expected<bool> {
    auto it = map_.find(key);
    if (it != map_.end()) {
      it->second = std::move(value);
      return true;
    }
    if (map_.size() >= Max) {
      return tl::unexpected(make_error(
          ErrorKind::Bounds,
          fmt::format("collection already holds the maximum of {} entries", Max)));
    }
    map_.emplace(std::move(key), std::move(value));
    return false;
  }

  auto find(const K& key) const -> const V* {
    auto it = map_.find(key);
    return it == map_.end() ? nullptr : &it->second;
  }

  auto contains(const K& key) const -> bool { return map_.contains(key); }
  auto size() const -> std::size_t { return map_.size(); }
  auto empty() const -> bool { return map_.empty(); }

  auto begin() const -> const_iterator { return map_.begin(); }
  auto end() const -> const_iterator { return map_.end(); }

  auto operator==(const ConfinedMap&) const -> bool = default;

 private:
  Map map_;
};

}  // namespace st::typesys
