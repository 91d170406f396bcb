#include "MessageRouter.hpp"

namespace sb {
bool MessageRouter::route(shared_ptr<Tenant> tenant,
                          const string &sourceTerminalId,
                          const string &frame) {
  auto target = extractTargetTerminalId(frame);
  if (!target) {
    VLOG(1) << tenant->getPublicKey() << " dropping frame without a target from "
            << sourceTerminalId;
    dropped++;
    return false;
  }
  auto endpoint = tenant->getRoutableEndpoint(*target);
  if (!endpoint) {
    VLOG(2) << tenant->getPublicKey() << " dropping frame from "
            << sourceTerminalId << " to unknown terminal " << *target;
    dropped++;
    return false;
  }
  if (!endpoint->send(frame)) {
    VLOG(1) << tenant->getPublicKey() << " outbound buffer of " << *target
            << " is full, dropping frame from " << sourceTerminalId;
    dropped++;
    return false;
  }
  forwarded++;
  return true;
}
}  // namespace sb
