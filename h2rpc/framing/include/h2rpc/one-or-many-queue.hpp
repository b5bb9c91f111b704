#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <stdexcept>
#include <utility>
#include <variant>

namespace h2rpc {

// FIFO queue optimized for the common case of holding at most one element: the single element is stored inline,
// a deque is only allocated when a second element is pushed. Once allocated, the deque is kept (even when emptied)
// to avoid allocation churn on streams that write many messages.
template <class T>
class OneOrManyQueue {
 public:
  void push(T element) {
    if (std::holds_alternative<std::monostate>(_storage)) {
      _storage.template emplace<T>(std::move(element));
    } else if (T* one = std::get_if<T>(&_storage)) {
      std::deque<T> many;
      many.push_back(std::move(*one));
      many.push_back(std::move(element));
      _storage.template emplace<std::deque<T>>(std::move(many));
    } else {
      std::get<std::deque<T>>(_storage).push_back(std::move(element));
    }
  }

  // Removes and returns the front element, or std::nullopt if empty.
  std::optional<T> pop() {
    if (T* one = std::get_if<T>(&_storage)) {
      std::optional<T> ret(std::move(*one));
      _storage.template emplace<std::monostate>();
      return ret;
    }
    if (auto* many = std::get_if<std::deque<T>>(&_storage); many != nullptr && !many->empty()) {
      std::optional<T> ret(std::move(many->front()));
      many->pop_front();
      return ret;
    }
    return std::nullopt;
  }

  // Element at position 'pos' from the front. Throws std::out_of_range if pos >= size().
  [[nodiscard]] const T& operator[](std::size_t pos) const {
    if (pos < size()) {
      if (const T* one = std::get_if<T>(&_storage)) {
        return *one;
      }
      return std::get<std::deque<T>>(_storage)[pos];
    }
    throw std::out_of_range("OneOrManyQueue index out of range");
  }

  [[nodiscard]] std::size_t size() const noexcept {
    switch (_storage.index()) {
      case 0:
        return 0;
      case 1:
        return 1;
      default:
        return std::get_if<std::deque<T>>(&_storage)->size();
    }
  }

  [[nodiscard]] bool empty() const noexcept { return size() == 0; }

  // Tells whether the queue switched to its deque storage.
  [[nodiscard]] bool isMany() const noexcept { return _storage.index() == 2; }

 private:
  std::variant<std::monostate, T, std::deque<T>> _storage;
};

}  // namespace h2rpc
