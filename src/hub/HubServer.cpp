#include "HubServer.hpp"

#include "AuthGate.hpp"
#include "WebSocketHandshake.hpp"

namespace sb {
HubServer::HubServer(shared_ptr<SocketHandler> _socketHandler,
                     const SocketEndpoint &_serverEndpoint,
                     const HubConfig &_config)
    : socketHandler(_socketHandler),
      serverEndpoint(_serverEndpoint),
      config(_config),
      registry(new HubRegistry()),
      router(new MessageRouter()),
      clientHandlerThreadPool(new ThreadPool(_config.handshakeThreads)),
      halt(false),
      shutDown(false) {
  socketHandler->listen(serverEndpoint);
}

HubServer::~HubServer() {
  halt = true;
  shutdown();
}

void HubServer::run() {
  LOG(INFO) << "Hub server started on " << serverEndpoint;
  set<int> serverPortFds = socketHandler->getEndpointFds(serverEndpoint);

  while (!halt) {
    fd_set rfds;
    FD_ZERO(&rfds);
    int maxFd = 0;
    for (int fd : serverPortFds) {
      FD_SET(fd, &rfds);
      maxFd = max(maxFd, fd);
    }
    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 100000;
    int numFdsSet = select(maxFd + 1, &rfds, NULL, NULL, &tv);
    if (numFdsSet < 0 && GetErrno() == EINTR) {
      continue;
    }
    FATAL_FAIL(numFdsSet);

    reapFinishedConnections();
    if (numFdsSet == 0) {
      continue;
    }
    for (int fd : serverPortFds) {
      if (FD_ISSET(fd, &rfds)) {
        acceptNewConnection(fd);
      }
    }
  }

  LOG(INFO) << "terminate signal received, gracefully shutting down";
  shutdown();
  LOG(INFO) << "GracefullyShutdown Done clean up";
}

int HubServer::getConnectionCount() {
  lock_guard<recursive_mutex> guard(serverMutex);
  return int(connectionThreads.size());
}

bool HubServer::acceptNewConnection(int fd) {
  VLOG(1) << "Accepting connection";
  int clientSocketFd = socketHandler->accept(fd);
  if (clientSocketFd < 0) {
    return false;
  }
  VLOG(1) << "Socket accepted: " << clientSocketFd;
  clientHandlerThreadPool->enqueue(
      [this, clientSocketFd]() { this->clientHandler(clientSocketFd); });
  return true;
}

void HubServer::rejectConnection(int fd, int status,
                                 const string &statusText) {
  try {
    socketHandler->writeAllOrThrow(
        fd, WebSocketHandshake::buildRejection(status, statusText), true);
  } catch (const std::runtime_error &e) {
    VLOG(1) << "Could not send " << status << " response: " << e.what();
  }
}

void HubServer::clientHandler(int clientSocketFd) {
  el::Helpers::setThreadName("server-clientHandler");

  {
    lock_guard<recursive_mutex> guard(serverMutex);
    if (shutDown) {
      VLOG(1) << "Dropping socket " << clientSocketFd << " during shutdown";
      socketHandler->close(clientSocketFd);
      return;
    }
    pendingHandshakeFds.insert(clientSocketFd);
  }

  bool handedOff = false;
  try {
    handedOff = upgradeConnection(clientSocketFd);
  } catch (const std::runtime_error &e) {
    LOG(INFO) << "Handshake failed on socket " << clientSocketFd << ": "
              << e.what();
  }

  {
    // shutdown() may call shutdownSocket on fds in this set, so the fd must
    // leave it before it can be closed and reused
    lock_guard<recursive_mutex> guard(serverMutex);
    pendingHandshakeFds.erase(clientSocketFd);
  }
  if (!handedOff) {
    socketHandler->close(clientSocketFd);
  }
}

bool HubServer::upgradeConnection(int clientSocketFd) {
  string head =
      WebSocketHandshake::readHead(socketHandler.get(), clientSocketFd);
  HttpRequestHead request;
  string reason;
  try {
    request = WebSocketHandshake::parseRequestHead(head);
  } catch (const std::runtime_error &e) {
    LOG(INFO) << "Bad request on socket " << clientSocketFd << " reason "
              << e.what();
    rejectConnection(clientSocketFd, 400, "Bad Request");
    return false;
  }
  if (!WebSocketHandshake::isUpgradeRequest(request, &reason)) {
    LOG(INFO) << "Bad upgrade request " << request.target << " reason "
              << reason;
    rejectConnection(clientSocketFd, 400, "Bad Request");
    return false;
  }

  ConnectionParams params = AuthGate::extractParams(request.query);
  try {
    AuthGate::validate(params);
  } catch (const std::runtime_error &e) {
    LOG(INFO) << "Auth Failed " << request.target << " reason " << e.what();
    rejectConnection(clientSocketFd, 401, "Unauthorized");
    return false;
  }
  registry->recordSignature(params.publicKey, params.signature);

  auto tenant = registry->getOrCreateTenant(
      params.publicKey,
      [this](shared_ptr<Tenant> newTenant) { initializeTenant(newTenant); });

  socketHandler->writeAllOrThrow(
      clientSocketFd,
      WebSocketHandshake::buildSwitchingProtocolsResponse(
          request.headers["sec-websocket-key"]),
      true);

  shared_ptr<TerminalConnection> connection(new TerminalConnection(
      socketHandler, clientSocketFd, params.publicKey, params.terminalId,
      config.outboundBufferBytes));
  connection->start();
  LOG(INFO) << params.publicKey << " terminal connected " << params.terminalId;
  tenant->registerEndpoint(connection);

  lock_guard<recursive_mutex> guard(serverMutex);
  if (shutDown) {
    connection->close(WS_CLOSE_GOING_AWAY, "hub shutting down");
  }
  ConnectionThread connectionThread;
  connectionThread.connection = connection;
  connectionThread.readerThread.reset(
      new thread(&HubServer::runConnection, this, tenant, connection));
  connectionThreads.push_back(connectionThread);
  return true;
}

void HubServer::runConnection(shared_ptr<Tenant> tenant,
                              shared_ptr<TerminalConnection> connection) {
  string terminalId = connection->getTerminalId();
  connection->run([this, tenant, terminalId](const string &message) {
    router->route(tenant, terminalId, message);
  });
  tenant->unregisterIfCurrent(terminalId, connection);
  LOG(INFO) << tenant->getPublicKey() << " terminal disconnected "
            << terminalId;
}

void HubServer::initializeTenant(shared_ptr<Tenant> tenant) {
  bool admin = !config.adminPublicKey.empty() &&
               tenant->getPublicKey() == config.adminPublicKey;
  shared_ptr<HostTerminal> host(
      new HostTerminal(tenant, router, registry, admin));
  tenant->setHost(host);
  weak_ptr<HostTerminal> weakHost(host);
  tenant->addInfoListener([weakHost](const TerminalInfo &info) {
    auto h = weakHost.lock();
    if (h) {
      h->publishTerminalInfo(info);
    }
  });

  shared_ptr<LivenessMonitor> monitor(
      new LivenessMonitor(tenant, host, config.probe));
  {
    lock_guard<recursive_mutex> guard(serverMutex);
    monitors.push_back(monitor);
    monitor->start();
  }
  LOG(INFO) << tenant->getPublicKey() << " host terminal started"
            << (admin ? " (admin)" : "");
}

void HubServer::reapFinishedConnections() {
  lock_guard<recursive_mutex> guard(serverMutex);
  for (auto it = connectionThreads.begin(); it != connectionThreads.end();) {
    if (it->connection->isFinished()) {
      it->readerThread->join();
      it = connectionThreads.erase(it);
    } else {
      ++it;
    }
  }
}

void HubServer::shutdown() {
  vector<ConnectionThread> threads;
  {
    lock_guard<recursive_mutex> guard(serverMutex);
    if (shutDown) {
      return;
    }
    shutDown = true;
    threads = connectionThreads;
  }

  LOG(INFO) << "Closing " << threads.size() << " connections";
  for (auto &it : threads) {
    it.connection->close(WS_CLOSE_GOING_AWAY, "hub shutting down");
  }

  {
    lock_guard<recursive_mutex> guard(serverMutex);
    for (int fd : pendingHandshakeFds) {
      VLOG(1) << "Aborting handshake on socket " << fd;
      socketHandler->shutdownSocket(fd);
    }
  }
  // Waits for in-flight handshakes, so no connection is added after this
  clientHandlerThreadPool.reset();

  vector<shared_ptr<LivenessMonitor>> monitorsToStop;
  {
    lock_guard<recursive_mutex> guard(serverMutex);
    threads = connectionThreads;
    monitorsToStop = monitors;
  }
  for (auto &it : threads) {
    it.connection->close(WS_CLOSE_GOING_AWAY, "hub shutting down");
  }
  for (auto &monitor : monitorsToStop) {
    monitor->stop();
  }
  socketHandler->stopListening(serverEndpoint);
  for (auto &it : threads) {
    it.readerThread->join();
  }

  lock_guard<recursive_mutex> guard(serverMutex);
  connectionThreads.clear();
  monitors.clear();
}
}  // namespace sb
