#pragma once

namespace h2rpc {

// Owner of a Linux file descriptor, closed on destruction.
class BaseFd {
 public:
  static constexpr int kClosedFd = -1;

  BaseFd() noexcept = default;

  explicit BaseFd(int fd) noexcept : _fd(fd) {}

  BaseFd(const BaseFd&) = delete;
  BaseFd(BaseFd&& other) noexcept : _fd(other.release()) {}
  BaseFd& operator=(const BaseFd&) = delete;
  BaseFd& operator=(BaseFd&& other) noexcept {
    reset(other.release());
    return *this;
  }

  ~BaseFd() { reset(); }

  [[nodiscard]] int fd() const noexcept { return _fd; }

  explicit operator bool() const noexcept { return _fd != kClosedFd; }

  // Gives up ownership of the descriptor, which is returned and left open.
  [[nodiscard]] int release() noexcept;

  // Closes the owned descriptor (if any) and takes ownership of 'fd'.
  void reset(int fd = kClosedFd) noexcept;

  void close() noexcept { reset(); }

 private:
  int _fd{kClosedFd};
};

}  // namespace h2rpc
