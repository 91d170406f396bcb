#ifndef __SB_HUB_CONFIG__
#define __SB_HUB_CONFIG__

#include "Headers.hpp"

namespace sb {
/**
 * @brief Timing of the per-tenant liveness sweeps.
 */
struct ProbeSettings {
  std::chrono::milliseconds interval =
      std::chrono::milliseconds(DEFAULT_PROBE_INTERVAL_MS);
  std::chrono::milliseconds timeout =
      std::chrono::milliseconds(DEFAULT_PROBE_TIMEOUT_MS);
  int attempts = DEFAULT_PROBE_ATTEMPTS;
  std::chrono::milliseconds retryDelay =
      std::chrono::milliseconds(DEFAULT_SWEEP_RETRY_DELAY_MS);
};

/**
 * @brief Process-wide hub settings, read-only once the server starts.
 */
struct HubConfig {
  int port = DEFAULT_HUB_PORT;
  string bindIp;
  /** @brief Tenant whose host terminal exposes ListHost. Empty for none. */
  string adminPublicKey;
  ProbeSettings probe;
  size_t outboundBufferBytes = 256 * 1024;
  int handshakeThreads = 8;
  int verbose = 0;
  bool silent = false;
  string maxLogSize = "20971520";
};

/**
 * @brief Reads the [Networking], [Hub] and [Debug] sections of an INI file
 * on top of `defaults`.
 * @throws std::runtime_error if the file cannot be loaded or a value is not
 * a valid number.
 */
HubConfig parseHubConfigFile(const string &path, const HubConfig &defaults);
}  // namespace sb

#endif  // __SB_HUB_CONFIG__
