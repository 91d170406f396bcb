#ifndef __SB_TENANT__
#define __SB_TENANT__

#include "Headers.hpp"
#include "TerminalEndpoint.hpp"
#include "TerminalMessage.hpp"

namespace sb {
/**
 * @brief Registry of the terminals sharing one public key.
 *
 * Holds the connection map (terminal id -> endpoint) and the metadata map
 * (terminal id -> TerminalInfo). All mutations happen under the tenant mutex;
 * endpoints are only ever asked to queue work while it is held.
 */
class Tenant {
 public:
  typedef function<void(const TerminalInfo &)> InfoListener;

  explicit Tenant(const string &_publicKey);

  const string &getPublicKey() const { return publicKey; }

  /**
   * @brief Stores an endpoint under its terminal id. A previously registered
   * endpoint for the same id is closed before the new one is stored.
   */
  void registerEndpoint(shared_ptr<TerminalEndpoint> endpoint);

  /**
   * @brief Removes the connection and the metadata of a terminal.
   * @return true if anything was removed. Calling it again is a no-op.
   */
  bool unregister(const string &terminalId);

  /**
   * @brief Like unregister, but only when `endpoint` is still the registered
   * connection for the id.
   */
  bool unregisterIfCurrent(const string &terminalId,
                           shared_ptr<TerminalEndpoint> endpoint);

  /**
   * @brief Drops the metadata of a terminal that failed its liveness pings
   * and terminates its connection.
   *
   * Nothing happens when the registered endpoint is no longer `probed`
   * (null for a terminal that had none), since the terminal reconnected.
   * @return true when the terminal was evicted.
   */
  bool evictIfCurrent(const string &terminalId,
                      shared_ptr<TerminalEndpoint> probed);

  /**
   * @brief Upserts a terminal's metadata and notifies the info listeners.
   * @return false, without storing anything, for the host terminal's id.
   */
  bool updateInfo(const TerminalInfo &info);

  /** @brief Registers a callback invoked after every updateInfo. */
  void addInfoListener(InfoListener listener);

  /** @brief All known TerminalInfo, ordered by terminal id. */
  vector<TerminalInfo> snapshot();

  bool hasInfo(const string &terminalId);
  vector<string> getKnownTerminalIds();

  shared_ptr<TerminalEndpoint> getEndpoint(const string &terminalId);

  /**
   * @brief Returns where a frame addressed to `terminalId` should go, or null
   * if the id is not a known terminal of this tenant. The host terminal is
   * always routable.
   */
  shared_ptr<TerminalEndpoint> getRoutableEndpoint(const string &terminalId);

  /** @brief Registered connections, excluding the host terminal. */
  vector<shared_ptr<TerminalEndpoint>> getEndpoints();
  int getConnectionCount();

  void setHost(shared_ptr<TerminalEndpoint> _host);
  shared_ptr<TerminalEndpoint> getHost();

 protected:
  string publicKey;
  recursive_mutex tenantMutex;
  unordered_map<string, shared_ptr<TerminalEndpoint>> endpoints;
  map<string, TerminalInfo> infos;
  shared_ptr<TerminalEndpoint> host;
  vector<InfoListener> infoListeners;
};
}  // namespace sb

#endif  // __SB_TENANT__
