#include "h2rpc/client-connection-config.hpp"

#include "h2rpc/invalid-argument-exception.hpp"

namespace h2rpc {

void ClientConnectionConfig::validate() const {
  if (connectionBackoff) {
    connectionBackoff->validate();
  }
  if (idleTimeout <= SteadyDuration::zero()) {
    throw invalid_argument("Idle timeout should be strictly positive");
  }
  if (maxReceiveMessageLength == 0) {
    throw invalid_argument("Max receive message length should be strictly positive");
  }
  keepalive.validate();
  messageEncoding.validate();
}

}  // namespace h2rpc
