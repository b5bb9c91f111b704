#pragma once

#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include "h2rpc/message-error.hpp"

namespace h2rpc {

// Completion handle of a message write, fulfilled once the message has been handed to the transport
// (or failed). Copies share the same state. A default constructed promise is null: completing it is a no-op,
// which is how callers not interested in the outcome of a write express it.
//
// Not thread safe: promises are completed from the serial context owning the stream.
class WritePromise {
 public:
  // Invoked with an error whose code is None on success.
  using Callback = std::function<void(const MessageError&)>;

  WritePromise() noexcept = default;

  static WritePromise Make() { return WritePromise(std::make_shared<State>()); }

  void succeed() const { complete(MessageError{}); }

  void fail(MessageError error) const { complete(error); }

  // Registers 'callback', called in registration order on completion, or immediately if already completed.
  void whenComplete(Callback callback) const;

  // Completes 'other' with the outcome of this promise.
  void cascadeTo(WritePromise other) const;

  [[nodiscard]] bool isCompleted() const noexcept { return _state && _state->completed; }

  // Outcome, meaningful only once completed.
  [[nodiscard]] MessageError result() const noexcept { return _state ? _state->result : MessageError{}; }

  explicit operator bool() const noexcept { return static_cast<bool>(_state); }

  bool operator==(const WritePromise&) const noexcept = default;

 private:
  struct State {
    std::vector<Callback> callbacks;
    MessageError result;
    bool completed{false};
  };

  explicit WritePromise(std::shared_ptr<State> state) noexcept : _state(std::move(state)) {}

  // Completing an already completed promise is ignored.
  void complete(MessageError error) const;

  std::shared_ptr<State> _state;
};

}  // namespace h2rpc
