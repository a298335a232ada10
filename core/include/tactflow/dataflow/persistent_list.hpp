// tactflow/dataflow/persistent_list.hpp - Immutable singly linked list with shared tails
#pragma once

#include <cstddef>
#include <iterator>
#include <memory>
#include <utility>
#include <vector>

namespace tactflow
{

/**
 * Immutable cons list.
 *
 * push_front() returns a new list whose tail is this list; nothing is ever
 * mutated in place, so dataflow states can share storage freely. Cells are
 * reference counted and released when the last list using them goes away.
 */
template <typename T>
class PersistentList
{
  struct Cell
  {
    T value;
    std::shared_ptr<const Cell> next;
  };

public:
  class const_iterator
  {
  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = T;
    using difference_type = std::ptrdiff_t;
    using pointer = const T *;
    using reference = const T &;

    const_iterator() = default;
    explicit const_iterator(const Cell * cell) : cell_(cell) {}

    reference operator*() const { return cell_->value; }
    pointer operator->() const { return &cell_->value; }

    const_iterator & operator++()
    {
      cell_ = cell_->next.get();
      return *this;
    }
    const_iterator operator++(int)
    {
      const_iterator old = *this;
      ++*this;
      return old;
    }

    friend bool operator==(const const_iterator & a, const const_iterator & b)
    {
      return a.cell_ == b.cell_;
    }
    friend bool operator!=(const const_iterator & a, const const_iterator & b)
    {
      return a.cell_ != b.cell_;
    }

  private:
    const Cell * cell_ = nullptr;
  };

  PersistentList() = default;

  [[nodiscard]] PersistentList push_front(T value) const
  {
    return PersistentList(
      std::make_shared<Cell>(Cell{std::move(value), head_}), size_ + 1);
  }

  /// List without its first element; empty list for an empty list
  [[nodiscard]] PersistentList tail() const
  {
    return head_ ? PersistentList(head_->next, size_ - 1) : PersistentList();
  }

  [[nodiscard]] const T & front() const { return head_->value; }

  [[nodiscard]] bool empty() const noexcept { return head_ == nullptr; }
  [[nodiscard]] size_t size() const noexcept { return size_; }

  [[nodiscard]] const_iterator begin() const { return const_iterator(head_.get()); }
  [[nodiscard]] const_iterator end() const { return const_iterator(); }

  /// True when both lists are the same cells, not merely equal elements
  [[nodiscard]] bool shares_storage_with(const PersistentList & other) const noexcept
  {
    return head_ == other.head_;
  }

  template <typename Pred>
  [[nodiscard]] bool any_of(Pred && pred) const
  {
    for (const T & v : *this) {
      if (pred(v)) return true;
    }
    return false;
  }

  /// Elements failing `pred`; shares the longest suffix in which every element passes
  template <typename Pred>
  [[nodiscard]] PersistentList remove_if(Pred && pred) const
  {
    std::vector<const T *> kept;
    const Cell * cell = head_.get();
    std::shared_ptr<const Cell> shared_suffix = head_;
    const Cell * suffix_start = head_.get();
    size_t suffix_size = size_;
    size_t index = 0;
    // Find the last removed element; everything after it can be shared.
    for (; cell != nullptr; cell = cell->next.get(), ++index) {
      if (pred(cell->value)) {
        suffix_start = cell->next.get();
        shared_suffix = cell->next;
        suffix_size = size_ - index - 1;
      }
    }
    if (suffix_start == head_.get()) {
      return *this;
    }
    for (cell = head_.get(); cell != suffix_start; cell = cell->next.get()) {
      if (!pred(cell->value)) {
        kept.push_back(&cell->value);
      }
    }
    PersistentList out(std::move(shared_suffix), suffix_size);
    for (auto it = kept.rbegin(); it != kept.rend(); ++it) {
      out = out.push_front(**it);
    }
    return out;
  }

  friend bool operator==(const PersistentList & a, const PersistentList & b)
  {
    if (a.size_ != b.size_) return false;
    auto ia = a.begin();
    auto ib = b.begin();
    for (; ia != a.end(); ++ia, ++ib) {
      if (!(*ia == *ib)) return false;
    }
    return true;
  }
  friend bool operator!=(const PersistentList & a, const PersistentList & b) { return !(a == b); }

private:
  PersistentList(std::shared_ptr<const Cell> head, size_t size)
  : head_(std::move(head)), size_(size)
  {
  }

  std::shared_ptr<const Cell> head_;
  size_t size_ = 0;
};

}  // namespace tactflow
