#include "h2rpc/write-promise.hpp"

#include <utility>
#include <vector>

#include "h2rpc/log.hpp"
#include "h2rpc/message-error.hpp"

namespace h2rpc {

void WritePromise::whenComplete(Callback callback) const {
  if (!_state) {
    return;
  }
  if (_state->completed) {
    callback(_state->result);
  } else {
    _state->callbacks.push_back(std::move(callback));
  }
}

void WritePromise::cascadeTo(WritePromise other) const {
  if (!other || other == *this) {
    return;
  }
  whenComplete([other = std::move(other)](const MessageError& error) { other.complete(error); });
}

void WritePromise::complete(MessageError error) const {
  if (!_state) {
    return;
  }
  if (_state->completed) {
    log::debug("Write promise already completed, ignoring {}", error.toString());
    return;
  }
  _state->completed = true;
  _state->result = error;
  // Callbacks may register new callbacks on this promise, which then run immediately.
  std::vector<Callback> callbacks = std::exchange(_state->callbacks, {});
  for (auto& callback : callbacks) {
    callback(error);
  }
}

}  // namespace h2rpc
