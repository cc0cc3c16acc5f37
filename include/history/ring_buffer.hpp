#pragma once

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

namespace crowd_ews::history {

// Fixed-capacity FIFO. Storage is allocated once; push overwrites the oldest
// element when full. T must be default-constructible and move-assignable.
// No internal locking.
template <typename T>
class RingBuffer {
 public:
  explicit RingBuffer(const std::size_t capacity) : storage_(capacity) {
    if (capacity == 0) {
      throw std::invalid_argument("RingBuffer capacity must be greater than zero");
    }
  }

  void push(T value) {
    storage_[head_] = std::move(value);
    head_ = (head_ + 1) % storage_.size();
    if (count_ < storage_.size()) {
      ++count_;
    }
  }

  [[nodiscard]] std::size_t size() const noexcept { return count_; }
  [[nodiscard]] std::size_t capacity() const noexcept { return storage_.size(); }
  [[nodiscard]] bool empty() const noexcept { return count_ == 0; }
  [[nodiscard]] bool full() const noexcept { return count_ == storage_.size(); }

  // index 0 is the oldest retained element.
  [[nodiscard]] const T& at(const std::size_t index) const {
    if (index >= count_) {
      throw std::out_of_range("RingBuffer index out of range");
    }
    return storage_[(tail() + index) % storage_.size()];
  }

  [[nodiscard]] const T& front() const { return at(0); }
  [[nodiscard]] const T& back() const { return at(count_ - 1); }

  // The newest min(k, size()) elements, oldest first.
  [[nodiscard]] std::vector<T> last(const std::size_t k) const {
    const std::size_t n = std::min(k, count_);
    std::vector<T> out;
    out.reserve(n);
    for (std::size_t i = count_ - n; i < count_; ++i) {
      out.push_back(storage_[(tail() + i) % storage_.size()]);
    }
    return out;
  }

 private:
  [[nodiscard]] std::size_t tail() const noexcept { return (head_ + storage_.size() - count_) % storage_.size(); }

  std::vector<T> storage_;
  std::size_t head_{0};
  std::size_t count_{0};
};

}  // namespace crowd_ews::history
