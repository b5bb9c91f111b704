#pragma once

#include <dlfcn.h>

#include <deque>
#include <initializer_list>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

namespace h2rpc::test {

// Address of the libc definition of 'name', for a test translation unit overriding that function.
template <typename Fn>
Fn NextSymbol(const char* name) {
  void* sym = ::dlsym(RTLD_NEXT, name);
  if (sym == nullptr) {
    throw std::runtime_error(std::string("Unable to resolve next symbol ") + name);
  }
  return reinterpret_cast<Fn>(sym);
}

// errno values to be returned, one per call, by an overridden syscall before it falls back to the real one.
// Thread safe, overridden syscalls may be reached from executor threads.
class InjectedErrors {
 public:
  void arm(std::initializer_list<int> errnos) {
    std::scoped_lock lock(_mutex);
    _errnos.assign(errnos.begin(), errnos.end());
  }

  // Next error to inject, if any.
  std::optional<int> take() {
    std::scoped_lock lock(_mutex);
    if (_errnos.empty()) {
      return std::nullopt;
    }
    const int err = _errnos.front();
    _errnos.pop_front();
    return err;
  }

  void disarm() {
    std::scoped_lock lock(_mutex);
    _errnos.clear();
  }

 private:
  std::mutex _mutex;
  std::deque<int> _errnos;
};

// Disarms 'errors' when leaving scope, so that a failing test does not leak injected errors into the next one.
class InjectedErrorsGuard {
 public:
  explicit InjectedErrorsGuard(InjectedErrors& errors) noexcept : _errors(errors) {}

  InjectedErrorsGuard(const InjectedErrorsGuard&) = delete;
  InjectedErrorsGuard& operator=(const InjectedErrorsGuard&) = delete;

  ~InjectedErrorsGuard() { _errors.disarm(); }

 private:
  InjectedErrors& _errors;
};

}  // namespace h2rpc::test
