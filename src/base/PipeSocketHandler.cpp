#include "PipeSocketHandler.hpp"

namespace sb {
PipeSocketHandler::PipeSocketHandler() {}

int PipeSocketHandler::connect(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> mutexGuard(globalMutex);

  string pipePath = endpoint.name();
  sockaddr_un remote;
  memset(&remote, 0, sizeof(sockaddr_un));

  int sockFd = ::socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(sockFd);
  remote.sun_family = AF_UNIX;
  strncpy(remote.sun_path, pipePath.c_str(), sizeof(remote.sun_path) - 1);

  VLOG(3) << "Connecting to " << endpoint << " with fd " << sockFd;
  int result =
      ::connect(sockFd, (struct sockaddr*)&remote, sizeof(sockaddr_un));
  if (result < 0) {
    auto localErrno = GetErrno();
    LOG(INFO) << "Error connecting to " << endpoint << ": " << localErrno
              << " " << strerror(localErrno);
    FATAL_FAIL(::close(sockFd));
    SetErrno(localErrno);
    return -1;
  }

  VLOG(1) << "Connected to endpoint " << endpoint << " using fd " << sockFd;
  addToActiveSockets(sockFd);
  initSocket(sockFd);
  return sockFd;
}

set<int> PipeSocketHandler::listen(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  string pipePath = endpoint.name();
  if (pipeServerSockets.find(pipePath) != pipeServerSockets.end()) {
    throw runtime_error("Tried to listen twice on the same path");
  }

  sockaddr_un local;
  memset(&local, 0, sizeof(sockaddr_un));

  int fd = socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(fd);
  initServerSocket(fd);
  local.sun_family = AF_UNIX;
  strncpy(local.sun_path, pipePath.c_str(), sizeof(local.sun_path) - 1);
  unlink(local.sun_path);

  if (::bind(fd, (struct sockaddr*)&local, sizeof(sockaddr_un)) == -1) {
    auto localErrno = GetErrno();
    ::close(fd);
    throw runtime_error(string("Error binding ") + pipePath + ": " +
                        strerror(localErrno));
  }
  FATAL_FAIL(::listen(fd, 32));
  FATAL_FAIL(::chmod(local.sun_path, S_IRUSR | S_IWUSR | S_IXUSR));
  LOG(INFO) << "Listening on " << pipePath;

  pipeServerSockets[pipePath] = set<int>({fd});
  return pipeServerSockets[pipePath];
}

set<int> PipeSocketHandler::getEndpointFds(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  string pipePath = endpoint.name();
  if (pipeServerSockets.find(pipePath) == pipeServerSockets.end()) {
    STFATAL << "Tried to getEndpointFds on a pipe without calling listen() "
               "first: "
            << pipePath;
  }
  return pipeServerSockets[pipePath];
}

void PipeSocketHandler::stopListening(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  string pipePath = endpoint.name();
  auto it = pipeServerSockets.find(pipePath);
  if (it == pipeServerSockets.end()) {
    STFATAL << "Tried to stop listening to a pipe that we weren't listening on:"
            << pipePath;
  }
  for (int sockFd : it->second) {
    FATAL_FAIL(::close(sockFd));
  }
  pipeServerSockets.erase(it);
  unlink(pipePath.c_str());
}
}  // namespace sb
