#ifndef __SB_HOST_TERMINAL__
#define __SB_HOST_TERMINAL__

#include "Headers.hpp"
#include "HubRegistry.hpp"
#include "MessageRouter.hpp"
#include "Tenant.hpp"
#include "TerminalEndpoint.hpp"

namespace sb {
/** @brief Channel carrying every UpdateTerminalInfo value of a tenant. */
const string TERMINAL_INFO_CHANNEL = "TerminalInfo";

/**
 * @brief A request issued by the host terminal, settled by the first
 * response carrying its trace id.
 */
class PendingRequest {
 public:
  explicit PendingRequest(const string &_traceId)
      : traceId(_traceId), cancelled(false) {}

  const string &getTraceId() const { return traceId; }

  /** @brief Stores the first response and wakes up waiters. */
  void resolve(const json &response);
  /** @brief Wakes up waiters without a response. */
  void cancel();

  /**
   * @brief Blocks until a response arrives, the request is cancelled or the
   * deadline passes.
   * @return true only if a response arrived.
   */
  bool waitUntil(std::chrono::steady_clock::time_point deadline);

  optional<json> getResponse();

 protected:
  string traceId;
  mutex requestMutex;
  std::condition_variable settled;
  optional<json> response;
  bool cancelled;
};

/**
 * @brief The per-tenant "@host" terminal.
 *
 * It is an endpoint like any connection, so frames reach it through the
 * MessageRouter, and it answers through the router as well. It serves
 * discovery (ListTerminals, UpdateTerminalInfo, the TerminalInfo channel),
 * Ping, Terminate (always refused) and, for the admin tenant, ListHost.
 */
class HostTerminal : public TerminalEndpoint {
 public:
  /** @brief Produces the response envelope for a request. */
  typedef function<json(const json &request)> ServiceHandler;

  HostTerminal(shared_ptr<Tenant> tenant, shared_ptr<MessageRouter> _router,
               shared_ptr<HubRegistry> _registry, bool _admin);
  virtual ~HostTerminal() {}

  virtual const string &getTerminalId() const { return terminalId; }

  /**
   * @brief Handles a frame addressed to the host: settles pending requests
   * with responses and dispatches requests to services.
   */
  virtual bool send(const string &frame);

  /** @brief The host terminal has no transport; closing is a no-op. */
  virtual void close(uint16_t code, const string &reason) {}
  virtual void terminate() {}

  bool isAdmin() const { return admin; }
  bool hasService(const string &method) const;

  /**
   * @brief Sends a request to another terminal of the tenant.
   * @return A handle the caller waits on. The caller must call
   * cancelRequest when it stops waiting.
   * @throws std::runtime_error from the target's send. Nothing stays pending.
   */
  shared_ptr<PendingRequest> request(const string &method,
                                     const string &target, const json &req);

  void cancelRequest(const string &traceId);
  /** @brief Cancels every request still waiting for a response. */
  void cancelAllRequests();

  /**
   * @brief Pushes an info value to the TerminalInfo subscribers, dropping the
   * subscriptions of terminals that left the tenant.
   */
  void publishTerminalInfo(const TerminalInfo &info);

  int getSubscriptionCount();

 protected:
  string terminalId;
  weak_ptr<Tenant> tenant;
  shared_ptr<MessageRouter> router;
  weak_ptr<HubRegistry> registry;
  bool admin;

  map<string, ServiceHandler> services;

  mutex hostMutex;
  unordered_map<string, shared_ptr<PendingRequest>> pendingRequests;
  /** @brief (subscriber terminal id, subscription trace id) pairs. */
  set<pair<string, string>> infoSubscriptions;

  void handleRequest(const json &request);
  void reply(const json &response);

  json listTerminals(const json &request);
  json updateTerminalInfo(const json &request);
  json subscribeChannel(const json &request);
  json unsubscribeChannel(const json &request);
  json listHost(const json &request);
};
}  // namespace sb

#endif  // __SB_HOST_TERMINAL__
