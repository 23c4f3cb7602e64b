#pragma once

#include <pulse/utility.h>

#include <algorithm>
#include <functional>
#include <utility>
#include <vector>

namespace pulse {

// Associative containers that iterate in insertion order.
// Lookups are linear, which is fine for the small fan-out of a
// reactive node (a handful of keys or subscribers).
template <typename Key, typename Value, typename Comparator = std::less<>>
class insertion_order_map {
  std::vector<std::pair<Key, Value>> nodes;

  inline auto find_node(this auto &&self, const auto &key) {
    return std::ranges::find_if(
        FWD(self).nodes,
        [&](const auto &k) {
          auto cmp = Comparator{};
          return not cmp(k, key) and not cmp(key, k);
        },
        &std::pair<Key, Value>::first);
  }

public:
  auto size() const { return nodes.size(); }
  auto empty() const { return nodes.empty(); }
  decltype(auto) begin(this auto &&self) { return FWD(self).nodes.begin(); }
  decltype(auto) end(this auto &&self) { return FWD(self).nodes.end(); }

  inline auto &operator[](const auto &key) {
    auto it = find_node(key);
    if (it != nodes.end()) {
      return it->second;
    }

    return nodes.emplace_back(Key(key), Value{}).second;
  }

  /// Returns a pointer to the mapped value, or nullptr if absent.
  inline auto find(this auto &&self, const auto &key) {
    auto it = self.find_node(key);
    return it != self.nodes.end() ? &it->second : nullptr;
  }

  inline auto contains(const auto &key) const {
    return find_node(key) != nodes.end();
  }

  inline auto erase(const auto &key) {
    auto it = find_node(key);
    if (it == nodes.end())
      return false;

    nodes.erase(it);
    return true;
  }

  inline decltype(auto) extract(const auto &key) {
    struct node_handle {
      bool _empty;
      Key _key;
      Value _mapped;

      auto empty() const { return _empty; }
      auto &key() const { return _key; }
      auto &mapped() { return _mapped; }
    };

    auto it = find_node(key);
    if (it == nodes.end())
      return node_handle{true};

    auto result = std::move(*it);
    nodes.erase(it);

    return node_handle{
        false,
        std::move(result.first),
        std::move(result.second),
    };
  }

  void clear() { nodes.clear(); }
};

template <typename T, typename Comparator = std::less<>>
class insertion_order_set {
  std::vector<T> nodes;

  inline auto find_node(const auto &value) const {
    return std::ranges::find_if(nodes, [&](const auto &k) {
      auto cmp = Comparator{};
      return not cmp(k, value) and not cmp(value, k);
    });
  }

public:
  auto size() const { return nodes.size(); }
  auto empty() const { return nodes.empty(); }
  auto begin() const { return nodes.begin(); }
  auto end() const { return nodes.end(); }

  auto contains(const auto &value) const {
    return find_node(value) != nodes.end();
  }

  auto insert(const T &value) {
    if (contains(value))
      return false;

    nodes.push_back(value);
    return true;
  }

  auto erase(const auto &value) {
    auto it = find_node(value);
    if (it == nodes.end())
      return false;

    nodes.erase(it);
    return true;
  }

  void clear() { nodes.clear(); }
};

} // namespace pulse
