#include "h2rpc/connection-keepalive.hpp"

#include "h2rpc/invalid-argument-exception.hpp"

namespace h2rpc {

void ConnectionKeepalive::validate() const {
  if (interval.count() < 0) {
    throw invalid_argument("Keepalive interval should not be negative");
  }
  if (minSentPingIntervalWithoutData.count() < 0) {
    throw invalid_argument("Keepalive minimum ping interval without data should not be negative");
  }
  if (!enabled()) {
    return;
  }
  if (timeout.count() <= 0) {
    throw invalid_argument("Keepalive timeout should be strictly positive");
  }
  // The acknowledgment of a ping is awaited before the next one is sent.
  if (timeout >= interval) {
    throw invalid_argument("Keepalive timeout {}ms should be smaller than its interval {}ms", timeout.count(),
                           interval.count());
  }
}

}  // namespace h2rpc
