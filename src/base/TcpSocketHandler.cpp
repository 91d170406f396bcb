#include "TcpSocketHandler.hpp"

#include <netinet/tcp.h>

namespace sb {
TcpSocketHandler::TcpSocketHandler() {}

int TcpSocketHandler::connect(const SocketEndpoint &endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  int sockFd = -1;
  addrinfo *results = NULL;
  addrinfo *p = NULL;
  addrinfo hints;
  memset(&hints, 0, sizeof(addrinfo));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = (AI_CANONNAME | AI_V4MAPPED | AI_ADDRCONFIG | AI_ALL);
  std::string portname = std::to_string(endpoint.port());
  std::string hostname = endpoint.name();

  int rc = getaddrinfo(hostname.c_str(), portname.c_str(), &hints, &results);
  if (rc != 0) {
    LOG(ERROR) << "Error getting address info for " << endpoint << ": " << rc
               << " (" << gai_strerror(rc) << ")";
    if (results) {
      freeaddrinfo(results);
    }
    return -1;
  }

  // loop through all the results and connect to the first we can
  for (p = results; p != NULL; p = p->ai_next) {
    if ((sockFd = socket(p->ai_family, p->ai_socktype, p->ai_protocol)) == -1) {
      LOG(INFO) << "Error creating socket: " << errno << " " << strerror(errno);
      continue;
    }
    if (::connect(sockFd, p->ai_addr, p->ai_addrlen) == -1) {
      LOG(INFO) << "Error connecting to " << endpoint << ": " << errno << " "
                << strerror(errno);
      ::close(sockFd);
      sockFd = -1;
      continue;
    }
    VLOG(1) << "Connected to " << endpoint << " using fd " << sockFd;
    break;
  }
  freeaddrinfo(results);

  if (sockFd == -1) {
    LOG(ERROR) << "Could not connect to " << endpoint;
    return -1;
  }
  addToActiveSockets(sockFd);
  initSocket(sockFd);
  return sockFd;
}

set<int> TcpSocketHandler::listen(const SocketEndpoint &endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  int port = endpoint.port();
  if (portServerSockets.find(port) != portServerSockets.end()) {
    throw runtime_error("Tried to listen twice on the same port");
  }

  addrinfo hints, *servinfo, *p;
  int rc;

  memset(&hints, 0, sizeof hints);
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE;

  std::string portname = std::to_string(port);
  const char *bindAddress =
      endpoint.has_name() && !endpoint.name().empty() ? endpoint.name().c_str()
                                                      : NULL;

  if ((rc = getaddrinfo(bindAddress, portname.c_str(), &hints, &servinfo)) !=
      0) {
    stringstream oss;
    oss << "Error getting address info for " << endpoint << ": " << rc << " ("
        << gai_strerror(rc) << ")";
    throw runtime_error(oss.str());
  }

  set<int> serverSockets;
  for (p = servinfo; p != NULL; p = p->ai_next) {
    int sockFd;
    if ((sockFd = socket(p->ai_family, p->ai_socktype, p->ai_protocol)) == -1) {
      LOG(INFO) << "Error creating socket " << p->ai_family << "/"
                << p->ai_socktype << "/" << p->ai_protocol << ": " << errno
                << " " << strerror(errno);
      continue;
    }
    initServerSocket(sockFd);

    if (p->ai_family == AF_INET6) {
      // IPv6 sockets only listen on IPv6 interfaces. The IPv4 address gets
      // its own socket.
      int flag = 1;
      FATAL_FAIL(setsockopt(sockFd, IPPROTO_IPV6, IPV6_V6ONLY, (char *)&flag,
                            sizeof(int)));
    }

    if (::bind(sockFd, p->ai_addr, p->ai_addrlen) == -1) {
      // This most often happens because the port is in use.
      auto localErrno = errno;
      stringstream oss;
      oss << "Error binding " << endpoint << ": " << localErrno << " "
          << strerror(localErrno);
      LOG(ERROR) << oss.str();
      ::close(sockFd);
      for (int fd : serverSockets) {
        ::close(fd);
      }
      freeaddrinfo(servinfo);
      throw runtime_error(oss.str());
    }

    FATAL_FAIL(::listen(sockFd, 32));
    LOG(INFO) << "Listening on " << endpoint << "/" << p->ai_family << "/"
              << p->ai_socktype << "/" << p->ai_protocol;
    serverSockets.insert(sockFd);
  }
  freeaddrinfo(servinfo);

  if (serverSockets.empty()) {
    throw runtime_error("Could not bind to any interface!");
  }

  portServerSockets[port] = serverSockets;
  return serverSockets;
}

set<int> TcpSocketHandler::getEndpointFds(const SocketEndpoint &endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  int port = endpoint.port();
  if (portServerSockets.find(port) == portServerSockets.end()) {
    STFATAL
        << "Tried to getEndpointFds on a port without calling listen() first";
  }
  return portServerSockets[port];
}

void TcpSocketHandler::stopListening(const SocketEndpoint &endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  int port = endpoint.port();
  auto it = portServerSockets.find(port);
  if (it == portServerSockets.end()) {
    STFATAL << "Tried to stop listening to a port that we weren't listening on";
  }
  for (int sockFd : it->second) {
    FATAL_FAIL(::close(sockFd));
  }
  portServerSockets.erase(it);
}

void TcpSocketHandler::initSocket(int fd) {
  UnixSocketHandler::initSocket(fd);
  int flag = 1;
  FATAL_FAIL_UNLESS_EINVAL(
      setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, (char *)&flag, sizeof(int)));
}
}  // namespace sb
