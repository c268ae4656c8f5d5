#pragma once

#include <cstddef>
#include <map>
#include <utility>
#include <vector>

namespace stocknest {

// Group-by accumulator that keeps groups in first-insertion order.
template <typename Key, typename Item>
class OrderedGroups {
 public:
  using Group = std::pair<Key, std::vector<Item>>;

  void Add(const Key& key, Item item) {
    auto it = index_.find(key);
    if (it == index_.end()) {
      it = index_.emplace(key, groups_.size()).first;
      groups_.emplace_back(key, std::vector<Item>());
    }
    groups_[it->second].second.push_back(std::move(item));
  }

  const std::vector<Group>& groups() const { return groups_; }
  std::size_t size() const { return groups_.size(); }
  bool empty() const { return groups_.empty(); }

 private:
  std::vector<Group> groups_;
  std::map<Key, std::size_t> index_;
};

}  // namespace stocknest
