#ifndef __SB_TERMINAL_ENDPOINT__
#define __SB_TERMINAL_ENDPOINT__

#include "Headers.hpp"

namespace sb {
/**
 * @brief Something the hub can deliver frames to: a websocket connection or
 * the tenant's host terminal.
 */
class TerminalEndpoint {
 public:
  virtual ~TerminalEndpoint() {}

  virtual const string &getTerminalId() const = 0;

  /**
   * @brief Queues a text frame for delivery. Never blocks on the network.
   * @return false if the frame was dropped.
   */
  virtual bool send(const string &frame) = 0;

  /**
   * @brief Starts a graceful close with the given websocket status code.
   */
  virtual void close(uint16_t code, const string &reason) = 0;

  /**
   * @brief Tears the transport down immediately.
   */
  virtual void terminate() = 0;
};
}  // namespace sb

#endif  // __SB_TERMINAL_ENDPOINT__
