#pragma once
#include "disjoint_mapping.hpp"
#include <cstddef>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace msx::registry {

/**
 * @brief Read-only range over several key lists of one or more mappings
 *
 * Segments are visited in order. Nothing is copied: the range reads the
 * mappings each time it is iterated, so it can be iterated again after the
 * mappings change. Mutating a mapping while iterating it is not supported.
 */
template <typename T>
class ChainedRange {
public:
  struct Segment {
    const DisjointMapping<T>* mapping;
    const std::vector<std::string>* keys;
  };

private:
  std::vector<Segment> segments_;

public:
  class iterator {
  private:
    const ChainedRange* range_ = nullptr;
    std::size_t segment_ = 0;
    std::size_t position_ = 0;

    void skip_exhausted() {
      while (segment_ < range_->segments_.size() && position_ >= range_->segments_[segment_].keys->size()) {
        ++segment_;
        position_ = 0;
      }
    }

  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = T;
    using difference_type = std::ptrdiff_t;
    using reference = const T&;
    using pointer = const T*;

    iterator() = default;
    iterator(const ChainedRange* range, std::size_t segment) : range_(range), segment_(segment) { skip_exhausted(); }

    [[nodiscard]] auto operator*() const -> reference {
      const auto& segment = range_->segments_[segment_];
      return segment.mapping->at((*segment.keys)[position_]);
    }
    [[nodiscard]] auto operator->() const -> pointer { return &**this; }

    auto operator++() -> iterator& {
      ++position_;
      skip_exhausted();
      return *this;
    }
    auto operator++(int) -> iterator {
      iterator copy = *this;
      ++*this;
      return copy;
    }

    [[nodiscard]] friend auto operator==(const iterator& a, const iterator& b) -> bool {
      return a.segment_ == b.segment_ && a.position_ == b.position_;
    }
  };

  ChainedRange() = default;
  explicit ChainedRange(std::vector<Segment> segments) : segments_(std::move(segments)) {}

  [[nodiscard]] auto begin() const -> iterator { return iterator(this, 0); }
  [[nodiscard]] auto end() const -> iterator { return iterator(this, segments_.size()); }

  [[nodiscard]] auto size() const -> std::size_t {
    std::size_t total = 0;
    for (const auto& segment : segments_) {
      total += segment.keys->size();
    }
    return total;
  }
  [[nodiscard]] auto empty() const -> bool { return size() == 0; }
};

} // namespace msx::registry
