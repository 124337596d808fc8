#pragma once
#include "../core/exceptions.hpp"
#include <algorithm>
#include <cstddef>
#include <fmt/format.h>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace msx::registry {

/**
 * @brief Flat name -> value mapping partitioned into named disjoint groups
 *
 * Every key is unique across the whole mapping, whichever group it belongs
 * to. Each group keeps its own insertion order so it can be iterated on its
 * own; the flat mapping keeps the global insertion order. Values are stored
 * once, groups only index them. References to stored values stay valid until
 * the key is erased.
 */
template <typename T>
class DisjointMapping {
private:
  struct Entry {
    T value;
    std::optional<std::size_t> group;
  };

  struct Group {
    std::string name;
    std::vector<std::string> keys;
  };

  std::unordered_map<std::string, Entry> data_;
  std::vector<std::string> order_;
  std::vector<Group> groups_;

  [[nodiscard]] auto group_index(std::string_view group_name) const -> std::optional<std::size_t> {
    for (std::size_t i = 0; i < groups_.size(); ++i) {
      if (groups_[i].name == group_name) {
        return i;
      }
    }
    return std::nullopt;
  }

  static void erase_key(std::vector<std::string>& keys, std::string_view key) {
    auto it = std::ranges::find(keys, key);
    if (it != keys.end()) {
      keys.erase(it);
    }
  }

public:
  // Iterates over the values named by a list of keys
  template <bool Const>
  class Iterator {
  private:
    using Mapping = std::conditional_t<Const, const DisjointMapping, DisjointMapping>;
    Mapping* mapping_ = nullptr;
    std::vector<std::string>::const_iterator it_;

  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = T;
    using difference_type = std::ptrdiff_t;
    using reference = std::conditional_t<Const, const T&, T&>;
    using pointer = std::conditional_t<Const, const T*, T*>;

    Iterator() = default;
    Iterator(Mapping* mapping, std::vector<std::string>::const_iterator it) : mapping_(mapping), it_(it) {}

    [[nodiscard]] auto operator*() const -> reference { return mapping_->data_.find(*it_)->second.value; }
    [[nodiscard]] auto operator->() const -> pointer { return &**this; }
    [[nodiscard]] auto key() const -> const std::string& { return *it_; }

    auto operator++() -> Iterator& {
      ++it_;
      return *this;
    }
    auto operator++(int) -> Iterator {
      Iterator copy = *this;
      ++it_;
      return copy;
    }

    [[nodiscard]] friend auto operator==(const Iterator& a, const Iterator& b) -> bool { return a.it_ == b.it_; }
  };

  using iterator = Iterator<false>;
  using const_iterator = Iterator<true>;

  /**
   * @brief Lazy view of one group
   *
   * The view does not copy anything: it reads the owning mapping each time it
   * is iterated, so it always reflects the current content of the group.
   */
  template <bool Const>
  class GroupView {
  private:
    using Mapping = std::conditional_t<Const, const DisjointMapping, DisjointMapping>;
    Mapping* mapping_ = nullptr;
    std::size_t index_ = 0;

  public:
    GroupView() = default;
    GroupView(Mapping* mapping, std::size_t index) : mapping_(mapping), index_(index) {}

    [[nodiscard]] auto name() const -> const std::string& { return mapping_->groups_[index_].name; }
    [[nodiscard]] auto keys() const -> const std::vector<std::string>& { return mapping_->groups_[index_].keys; }
    [[nodiscard]] auto size() const -> std::size_t { return keys().size(); }
    [[nodiscard]] auto empty() const -> bool { return keys().empty(); }

    [[nodiscard]] auto contains(std::string_view key) const -> bool {
      auto it = mapping_->data_.find(std::string(key));
      return it != mapping_->data_.end() && it->second.group == index_;
    }

    [[nodiscard]] auto begin() const -> Iterator<Const> { return {mapping_, keys().begin()}; }
    [[nodiscard]] auto end() const -> Iterator<Const> { return {mapping_, keys().end()}; }

    // Adds to the shared key space, filed under this group
    void insert(std::string key, T value) const
      requires(!Const)
    {
      mapping_->add_item_to_group(name(), std::move(key), std::move(value));
    }
  };

  DisjointMapping() = default;

  /**
   * @brief Create a new named group
   * @throws InvalidValueError if the group already exists
   */
  auto add_disjoint_group(std::string group_name) -> GroupView<false> {
    if (group_index(group_name)) {
      throw core::InvalidValueError(fmt::format("group '{}' already exists", group_name));
    }
    groups_.push_back(Group{std::move(group_name), {}});
    return GroupView<false>(this, groups_.size() - 1);
  }

  [[nodiscard]] auto group(std::string_view group_name) -> GroupView<false> {
    auto index = group_index(group_name);
    if (!index) {
      throw core::UnknownReferenceError(fmt::format("no group named '{}'", group_name));
    }
    return GroupView<false>(this, *index);
  }

  [[nodiscard]] auto group(std::string_view group_name) const -> GroupView<true> {
    auto index = group_index(group_name);
    if (!index) {
      throw core::UnknownReferenceError(fmt::format("no group named '{}'", group_name));
    }
    return GroupView<true>(this, *index);
  }

  [[nodiscard]] auto has_group(std::string_view group_name) const -> bool { return group_index(group_name).has_value(); }

  /**
   * @brief Insert a new key, optionally filed under a group
   *
   * @param group_name Group to file the key under, std::nullopt for an ungrouped key
   * @throws KeyExistsError if the key is already present anywhere in the mapping
   * @throws UnknownReferenceError if the group does not exist
   */
  auto add_item_to_group(const std::optional<std::string>& group_name, std::string key, T value) -> T& {
    if (data_.contains(key)) {
      throw core::KeyExistsError(key);
    }
    std::optional<std::size_t> index;
    if (group_name) {
      index = group_index(*group_name);
      if (!index) {
        throw core::UnknownReferenceError(fmt::format("no group named '{}'", *group_name));
      }
    }

    auto [it, inserted] = data_.emplace(key, Entry{std::move(value), index});
    order_.push_back(key);
    if (index) {
      groups_[*index].keys.push_back(std::move(key));
    }
    return it->second.value;
  }

  // Flat assignment: replaces the value of an existing key in place (keeping
  // its group), or adds the key ungrouped.
  auto insert_or_assign(std::string key, T value) -> T& {
    auto it = data_.find(key);
    if (it != data_.end()) {
      it->second.value = std::move(value);
      return it->second.value;
    }
    return add_item_to_group(std::nullopt, std::move(key), std::move(value));
  }

  // Removes the key from the mapping and from its group. Returns false if absent.
  auto erase(std::string_view key) -> bool {
    auto it = data_.find(std::string(key));
    if (it == data_.end()) {
      return false;
    }
    if (it->second.group) {
      erase_key(groups_[*it->second.group].keys, key);
    }
    erase_key(order_, key);
    data_.erase(it);
    return true;
  }

  [[nodiscard]] auto contains(std::string_view key) const -> bool { return data_.contains(std::string(key)); }

  [[nodiscard]] auto find(std::string_view key) -> T* {
    auto it = data_.find(std::string(key));
    return it == data_.end() ? nullptr : &it->second.value;
  }

  [[nodiscard]] auto find(std::string_view key) const -> const T* {
    auto it = data_.find(std::string(key));
    return it == data_.end() ? nullptr : &it->second.value;
  }

  /**
   * @brief Checked lookup
   * @throws UnknownReferenceError if the key is absent
   */
  [[nodiscard]] auto at(std::string_view key) -> T& {
    if (auto* value = find(key)) {
      return *value;
    }
    throw core::UnknownReferenceError(fmt::format("'{}' is not defined", key));
  }

  [[nodiscard]] auto at(std::string_view key) const -> const T& {
    if (const auto* value = find(key)) {
      return *value;
    }
    throw core::UnknownReferenceError(fmt::format("'{}' is not defined", key));
  }

  // Name of the group owning the key, std::nullopt for ungrouped or absent keys
  [[nodiscard]] auto group_of(std::string_view key) const -> std::optional<std::string> {
    auto it = data_.find(std::string(key));
    if (it == data_.end() || !it->second.group) {
      return std::nullopt;
    }
    return groups_[*it->second.group].name;
  }

  [[nodiscard]] auto keys() const noexcept -> const std::vector<std::string>& { return order_; }
  [[nodiscard]] auto size() const noexcept -> std::size_t { return order_.size(); }
  [[nodiscard]] auto empty() const noexcept -> bool { return order_.empty(); }

  [[nodiscard]] auto begin() -> iterator { return {this, order_.cbegin()}; }
  [[nodiscard]] auto end() -> iterator { return {this, order_.cend()}; }
  [[nodiscard]] auto begin() const -> const_iterator { return {this, order_.cbegin()}; }
  [[nodiscard]] auto end() const -> const_iterator { return {this, order_.cend()}; }
};

} // namespace msx::registry
