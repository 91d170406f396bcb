#ifndef __SB_AUTH_GATE__
#define __SB_AUTH_GATE__

#include "Headers.hpp"

namespace sb {
/**
 * @brief The query parameters a terminal authenticates with.
 */
struct ConnectionParams {
  string publicKey;
  string terminalId;
  string signature;
};

/**
 * @brief Validates connection parameters before a websocket is accepted.
 */
class AuthGate {
 public:
  /** @brief Picks public_key, terminal_id and signature out of a query. */
  static ConnectionParams extractParams(const map<string, string> &query);

  /**
   * @brief Checks that all parameters are present, that the terminal id is
   * not reserved and that the signature of the challenge verifies against
   * the public key.
   * @throws std::runtime_error describing the first failed check.
   */
  static void validate(const ConnectionParams &params);
};
}  // namespace sb

#endif  // __SB_AUTH_GATE__
