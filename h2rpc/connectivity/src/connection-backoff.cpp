#include "h2rpc/connection-backoff.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <random>

#include "h2rpc/invalid-argument-exception.hpp"
#include "h2rpc/timedef.hpp"

namespace h2rpc {

void ConnectionBackoff::validate() const {
  if (initialBackoff.count() < 0 || maximumBackoff.count() < 0 || minimumConnectionTimeout.count() < 0) {
    throw invalid_argument("Backoff durations cannot be negative");
  }
  if (!(multiplier >= 1.0)) {
    throw invalid_argument("Backoff multiplier should be at least 1, got {}", multiplier);
  }
  if (!(jitter >= 0.0 && jitter <= 1.0)) {
    throw invalid_argument("Backoff jitter should be in [0, 1], got {}", jitter);
  }
}

ConnectionBackoffIterator ConnectionBackoff::makeIterator() const {
  std::random_device randomDevice;
  return {*this, (static_cast<uint64_t>(randomDevice()) << 32U) | randomDevice()};
}

ConnectionBackoffIterator ConnectionBackoff::makeIterator(uint64_t seed) const { return {*this, seed}; }

ConnectionBackoffIterator::ConnectionBackoffIterator(const ConnectionBackoff& config, uint64_t seed)
    : _config(config),
      _rng(seed),
      _unjitteredBackoff(config.initialBackoff),
      _remainingRetries(config.retries.limit()) {
  // The first backoff is the initial one, without jitter.
  _initialElement = makeElement(std::min(_config.initialBackoff, _config.maximumBackoff));
}

std::optional<ConnectionBackoffIterator::Element> ConnectionBackoffIterator::next() {
  if (_config.retries.isLimited()) {
    if (_remainingRetries == 0) {
      return std::nullopt;
    }
    --_remainingRetries;
  }

  if (_initialElement) {
    const Element ret = *_initialElement;
    _initialElement.reset();
    return ret;
  }

  _unjitteredBackoff = std::min(_unjitteredBackoff * _config.multiplier, _config.maximumBackoff);

  FloatingSeconds backoff = _unjitteredBackoff;
  if (_config.jitter > 0.0) {
    const double amplitude = _config.jitter * _unjitteredBackoff.count();
    std::uniform_real_distribution<double> distribution(-amplitude, amplitude);
    backoff += FloatingSeconds(distribution(_rng));
  }
  return makeElement(backoff);
}

ConnectionBackoffIterator::Element ConnectionBackoffIterator::makeElement(FloatingSeconds backoff) const noexcept {
  return {std::max(backoff, _config.minimumConnectionTimeout), backoff};
}

}  // namespace h2rpc
