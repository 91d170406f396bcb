#ifndef __SB_MESSAGE_ROUTER__
#define __SB_MESSAGE_ROUTER__

#include "Headers.hpp"
#include "Tenant.hpp"

namespace sb {
/**
 * @brief Forwards frames between terminals of the same tenant.
 *
 * Only the target_terminal_id of a frame is looked at; the bytes that reach
 * the target are exactly the bytes the source sent.
 */
class MessageRouter {
 public:
  MessageRouter() : forwarded(0), dropped(0) {}

  /**
   * @brief Delivers `frame` to its target inside `tenant`.
   * @return true if the frame was handed to the target endpoint.
   */
  bool route(shared_ptr<Tenant> tenant, const string &sourceTerminalId,
             const string &frame);

  uint64_t getForwardedCount() const { return forwarded; }
  uint64_t getDroppedCount() const { return dropped; }

 protected:
  atomic<uint64_t> forwarded;
  atomic<uint64_t> dropped;
};
}  // namespace sb

#endif  // __SB_MESSAGE_ROUTER__
