#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace sme::structures {

// PriorityQueue is a binary max-heap ordered by Compare: top() is the element for
// which no other element compares greater. With std::less this is a max-heap, with
// std::greater a min-heap.
//
// Equal elements come out in unspecified order; callers that need a deterministic
// order must make Compare a total order (e.g. tie-break on id).
template <typename T, typename Compare = std::less<T>>
class PriorityQueue {
 public:
  PriorityQueue() = default;
  explicit PriorityQueue(Compare compare) : compare_(std::move(compare)) {}

  void push(T value) {
    heap_.push_back(std::move(value));
    sift_up(heap_.size() - 1);
  }

  [[nodiscard]] const T& top() const {
    if (heap_.empty()) {
      throw std::out_of_range("PriorityQueue::top on empty queue");
    }
    return heap_.front();
  }

  // Removes and returns the top element; nullopt when empty.
  std::optional<T> pop() {
    if (heap_.empty()) {
      return std::nullopt;
    }
    T result = std::move(heap_.front());
    if (heap_.size() > 1) {
      heap_.front() = std::move(heap_.back());
    }
    heap_.pop_back();
    if (!heap_.empty()) {
      sift_down(0);
    }
    return result;
  }

  [[nodiscard]] std::size_t size() const { return heap_.size(); }
  [[nodiscard]] bool empty() const { return heap_.empty(); }
  void clear() { heap_.clear(); }

  // Drains up to n elements in priority order.
  std::vector<T> take(std::size_t n) {
    std::vector<T> out;
    out.reserve(std::min(n, heap_.size()));
    while (out.size() < n) {
      auto next = pop();
      if (!next.has_value()) {
        break;
      }
      out.push_back(std::move(*next));
    }
    return out;
  }

 private:
  void sift_up(std::size_t index) {
    while (index > 0) {
      const std::size_t parent = (index - 1) / 2;
      if (!compare_(heap_[parent], heap_[index])) {
        break;
      }
      std::swap(heap_[parent], heap_[index]);
      index = parent;
    }
  }

  void sift_down(std::size_t index) {
    const std::size_t n = heap_.size();
    while (true) {
      const std::size_t left = 2 * index + 1;
      const std::size_t right = left + 1;
      std::size_t largest = index;
      if (left < n && compare_(heap_[largest], heap_[left])) {
        largest = left;
      }
      if (right < n && compare_(heap_[largest], heap_[right])) {
        largest = right;
      }
      if (largest == index) {
        return;
      }
      std::swap(heap_[index], heap_[largest]);
      index = largest;
    }
  }

  std::vector<T> heap_;
  Compare compare_{};
};

}  // namespace sme::structures
