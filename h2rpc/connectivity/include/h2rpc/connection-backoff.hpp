#pragma once

#include <cstdint>
#include <optional>
#include <random>

#include "h2rpc/timedef.hpp"

namespace h2rpc {

class ConnectionBackoffIterator;

// Exponential backoff parameters of reconnection attempts.
// Defaults follow the gRPC connection backoff document.
struct ConnectionBackoff {
  // Number of connection attempts allowed by a backoff sequence.
  class Retries {
   public:
    static constexpr Retries Unlimited() noexcept { return Retries(std::nullopt); }

    static constexpr Retries UpTo(uint32_t limit) noexcept { return Retries(limit); }

    [[nodiscard]] constexpr bool isLimited() const noexcept { return _limit.has_value(); }

    // Only meaningful if isLimited().
    [[nodiscard]] constexpr uint32_t limit() const noexcept { return _limit.value_or(0); }

    constexpr bool operator==(const Retries&) const noexcept = default;

   private:
    constexpr explicit Retries(std::optional<uint32_t> limit) noexcept : _limit(limit) {}

    std::optional<uint32_t> _limit;
  };

  ConnectionBackoff& withInitialBackoff(FloatingSeconds value) {
    initialBackoff = value;
    return *this;
  }

  ConnectionBackoff& withMaximumBackoff(FloatingSeconds value) {
    maximumBackoff = value;
    return *this;
  }

  ConnectionBackoff& withMultiplier(double value) {
    multiplier = value;
    return *this;
  }

  ConnectionBackoff& withJitter(double value) {
    jitter = value;
    return *this;
  }

  ConnectionBackoff& withMinimumConnectionTimeout(FloatingSeconds value) {
    minimumConnectionTimeout = value;
    return *this;
  }

  ConnectionBackoff& withRetries(Retries value) {
    retries = value;
    return *this;
  }

  // Throws invalid_argument for negative durations, a multiplier lower than 1 or a jitter outside of [0, 1].
  void validate() const;

  // New sequence of backoffs, jittered from a random seed.
  [[nodiscard]] ConnectionBackoffIterator makeIterator() const;

  // New sequence of backoffs, jittered deterministically from 'seed'.
  [[nodiscard]] ConnectionBackoffIterator makeIterator(uint64_t seed) const;

  bool operator==(const ConnectionBackoff&) const noexcept = default;

  FloatingSeconds initialBackoff{1.0};
  // Upper bound of the backoff before jitter: jittered values may exceed it.
  FloatingSeconds maximumBackoff{120.0};
  double multiplier{1.6};
  double jitter{0.2};
  FloatingSeconds minimumConnectionTimeout{20.0};
  Retries retries = Retries::Unlimited();
};

// Produces the (connection timeout, backoff) pairs of successive connection attempts.
class ConnectionBackoffIterator {
 public:
  struct Element {
    // Maximum duration of the connection attempt, never lower than the minimum connection timeout.
    FloatingSeconds timeout;
    // Delay to wait before the next attempt should this one fail.
    FloatingSeconds backoff;
  };

  ConnectionBackoffIterator(const ConnectionBackoff& config, uint64_t seed);

  // Returns std::nullopt once the retry budget is exhausted.
  std::optional<Element> next();

 private:
  [[nodiscard]] Element makeElement(FloatingSeconds backoff) const noexcept;

  ConnectionBackoff _config;
  std::mt19937_64 _rng;
  FloatingSeconds _unjitteredBackoff;
  std::optional<Element> _initialElement;
  uint32_t _remainingRetries;
};

}  // namespace h2rpc
