#ifndef __SB_HUB_SERVER__
#define __SB_HUB_SERVER__

#include "Headers.hpp"
#include "HostTerminal.hpp"
#include "HubConfig.hpp"
#include "HubRegistry.hpp"
#include "LivenessMonitor.hpp"
#include "MessageRouter.hpp"
#include "SocketHandler.hpp"
#include "TerminalConnection.hpp"

namespace sb {
/**
 * @brief Accepts websocket upgrades and wires authenticated terminals into
 * their tenant.
 *
 * The accept loop runs on the thread calling run(). Upgrades and
 * authentication happen on a small thread pool, and every accepted terminal
 * gets its own reader thread (plus the writer thread of its connection).
 */
class HubServer {
 public:
  /** @brief Starts listening on `_serverEndpoint`. */
  HubServer(shared_ptr<SocketHandler> _socketHandler,
            const SocketEndpoint &_serverEndpoint, const HubConfig &_config);
  virtual ~HubServer();

  /**
   * @brief Accepts connections until requestShutdown() is called, then
   * shuts down gracefully and returns.
   */
  void run();

  /** @brief Asks run() to stop. Safe to call from a signal handler. */
  void requestShutdown() { halt = true; }

  shared_ptr<HubRegistry> getRegistry() { return registry; }
  shared_ptr<MessageRouter> getRouter() { return router; }
  /** @brief Connections whose threads have not been reaped yet. */
  int getConnectionCount();

 protected:
  struct ConnectionThread {
    shared_ptr<TerminalConnection> connection;
    shared_ptr<thread> readerThread;
  };

  shared_ptr<SocketHandler> socketHandler;
  SocketEndpoint serverEndpoint;
  HubConfig config;
  shared_ptr<HubRegistry> registry;
  shared_ptr<MessageRouter> router;
  std::unique_ptr<ThreadPool> clientHandlerThreadPool;

  /** @brief Guards the connection threads, monitors and pending handshakes. */
  recursive_mutex serverMutex;
  set<int> pendingHandshakeFds;
  vector<ConnectionThread> connectionThreads;
  vector<shared_ptr<LivenessMonitor>> monitors;
  atomic<bool> halt;
  bool shutDown;

  bool acceptNewConnection(int fd);
  /** @brief Upgrade, authentication and registration of one socket. */
  void clientHandler(int clientSocketFd);
  /**
   * @brief Runs the handshake on a socket.
   * @return true once a TerminalConnection owns the socket.
   */
  bool upgradeConnection(int clientSocketFd);
  /** @brief Reader thread of an accepted terminal. */
  void runConnection(shared_ptr<Tenant> tenant,
                     shared_ptr<TerminalConnection> connection);
  /** @brief Stands up the host terminal and liveness monitor of a tenant. */
  void initializeTenant(shared_ptr<Tenant> tenant);
  void rejectConnection(int fd, int status, const string &statusText);
  void reapFinishedConnections();
  /**
   * @brief Closes every connection, stops the monitors and the listener and
   * joins all threads.
   */
  void shutdown();
};
}  // namespace sb

#endif  // __SB_HUB_SERVER__
