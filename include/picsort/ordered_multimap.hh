#pragma once

#include <cstddef>
#include <map>
#include <utility>
#include <vector>

namespace picsort {

inline namespace detail_v1 {

/**
 * @brief multimap that remembers the order keys were first inserted,
 * and the order of values under each key.
 *
 * @tparam Key ordered key type
 * @tparam Tp value type
 */
template <typename Key, typename Tp>
class ordered_multimap_t {
  std::map<Key, std::size_t> _index;
  std::vector<std::pair<Key, std::vector<Tp>>> _groups;

 public:
  template <typename Up>
  void insert(const Key &key, Up &&value) {
    auto [it, inserted] = _index.try_emplace(key, _groups.size());
    if (inserted) {
      _groups.emplace_back(key, std::vector<Tp>{});
    }
    _groups[it->second].second.emplace_back(std::forward<Up>(value));
  }

  inline std::size_t size() const noexcept { return _groups.size(); }
  inline bool empty() const noexcept { return _groups.empty(); }

  inline std::vector<std::pair<Key, std::vector<Tp>>> release() && {
    _index.clear();
    return std::move(_groups);
  }
};

}  // namespace detail_v1

}  // namespace picsort
