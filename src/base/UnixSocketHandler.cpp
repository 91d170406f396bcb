#include "UnixSocketHandler.hpp"

namespace sb {
UnixSocketHandler::UnixSocketHandler() {}

bool UnixSocketHandler::waitForData(int fd, int64_t sec, int64_t usec) {
  fd_set input;
  FD_ZERO(&input);
  FD_SET(fd, &input);
  struct timeval timeout;
  timeout.tv_sec = sec;
  timeout.tv_usec = usec;
  int n = select(fd + 1, &input, NULL, NULL, &timeout);
  if (n == -1) {
    VLOG(4) << "socket select failed: " << strerror(errno);
    return false;
  } else if (n == 0) {
    return false;
  }
  if (!FD_ISSET(fd, &input)) {
    STFATAL << "FD_ISSET is false but we should have data by now.";
  }
  VLOG(4) << "socket " << fd << " has data";
  return true;
}

shared_ptr<recursive_mutex> UnixSocketHandler::getSocketMutex(int fd) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  auto it = activeSocketMutexes.find(fd);
  if (it == activeSocketMutexes.end()) {
    return nullptr;
  }
  return it->second;
}

ssize_t UnixSocketHandler::read(int fd, void *buf, size_t count) {
  if (fd <= 0) {
    STFATAL << "Tried to read from an invalid socket: " << fd;
  }
  auto socketMutex = getSocketMutex(fd);
  if (!socketMutex) {
    VLOG(1) << "Tried to read from a socket that has been closed: " << fd;
    errno = EPIPE;
    return -1;
  }
  waitForData(fd, 5, 0);
  lock_guard<recursive_mutex> guard(*socketMutex);
  VLOG(4) << "Unixsocket handler read from fd: " << fd;
  ssize_t readBytes = ::read(fd, buf, count);
  auto localErrno = errno;
  if (readBytes < 0 && localErrno != EAGAIN && localErrno != EWOULDBLOCK) {
    LOG(WARNING) << "Error reading: " << localErrno << " "
                 << strerror(localErrno);
  }
  errno = localErrno;
  return readBytes;
}

ssize_t UnixSocketHandler::write(int fd, const void *buf, size_t count) {
  VLOG(4) << "Unixsocket handler write to fd: " << fd;
  if (fd <= 0) {
    STFATAL << "Tried to write to an invalid socket: " << fd;
  }
  auto socketMutex = getSocketMutex(fd);
  if (!socketMutex) {
    VLOG(1) << "Tried to write to a socket that has been closed: " << fd;
    errno = EPIPE;
    return -1;
  }
  // Try to write for around 5 seconds before giving up
  time_t startTime = time(NULL);
  size_t bytesWritten = 0;
  while (bytesWritten < count) {
    lock_guard<recursive_mutex> guard(*socketMutex);
    ssize_t w;
#ifdef MSG_NOSIGNAL
    w = ::send(fd, ((const char *)buf) + bytesWritten, count - bytesWritten,
               MSG_NOSIGNAL);
#else
    w = ::write(fd, ((const char *)buf) + bytesWritten, count - bytesWritten);
#endif
    if (w < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        if (time(NULL) > startTime + 5) {
          return -1;
        }
      } else {
        return -1;
      }
    } else {
      bytesWritten += w;
    }
  }
  return count;
}

void UnixSocketHandler::addToActiveSockets(int fd) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  if (activeSocketMutexes.find(fd) != activeSocketMutexes.end()) {
    STFATAL << "Tried to insert an fd that already exists: " << fd;
  }
  activeSocketMutexes.insert(
      make_pair(fd, shared_ptr<recursive_mutex>(new recursive_mutex())));
}

int UnixSocketHandler::accept(int sockFd) {
  sockaddr_storage client;
  socklen_t c = sizeof(client);
  int client_sock = ::accept(sockFd, (sockaddr *)&client, &c);
  auto acceptErrno = errno;

  lock_guard<std::recursive_mutex> guard(globalMutex);
  VLOG(3) << "Socket " << sockFd
          << " accepted, returned client_sock: " << client_sock;
  if (client_sock >= 0) {
    addToActiveSockets(client_sock);
    initSocket(client_sock);
    return client_sock;
  } else if (acceptErrno != EAGAIN && acceptErrno != EWOULDBLOCK &&
             acceptErrno != ECONNABORTED && acceptErrno != EINTR) {
    FATAL_FAIL(-1);  // STFATAL with the error
  }

  errno = acceptErrno;
  return -1;
}

void UnixSocketHandler::shutdownSocket(int fd) {
  auto socketMutex = getSocketMutex(fd);
  if (!socketMutex) {
    VLOG(1) << "Tried to shut down a socket that is already closed: " << fd;
    return;
  }
  // Deliberately not taking the socket mutex: a reader may be blocked on it.
  if (::shutdown(fd, SHUT_RDWR) == -1 && errno != ENOTCONN) {
    LOG(WARNING) << "Error shutting down socket " << fd << ": "
                 << strerror(errno);
  }
}

void UnixSocketHandler::close(int fd) {
  lock_guard<std::recursive_mutex> globalGuard(globalMutex);
  if (fd == -1) {
    return;
  }
  auto it = activeSocketMutexes.find(fd);
  if (it == activeSocketMutexes.end()) {
    STERROR << "Tried to close a connection that doesn't exist: " << fd;
    return;
  }
  auto m = it->second;
  lock_guard<std::recursive_mutex> guard(*m);
  VLOG(1) << "Closing connection: " << fd;
  FATAL_FAIL(::close(fd));
  activeSocketMutexes.erase(it);
}

void UnixSocketHandler::initSocket(int fd) {
#if !defined(MSG_NOSIGNAL)
  {
    // If we don't have MSG_NOSIGNAL, use SO_NOSIGPIPE
    int val = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, (void *)&val, sizeof(val)) ==
        -1) {
      ::signal(SIGPIPE, SIG_IGN);
    }
  }
#endif
  int opts;
  opts = fcntl(fd, F_GETFL);
  FATAL_FAIL_UNLESS_EINVAL(opts);
  opts |= O_NONBLOCK;
  FATAL_FAIL_UNLESS_EINVAL(fcntl(fd, F_SETFL, opts));
}

void UnixSocketHandler::initServerSocket(int fd) {
  initSocket(fd);
  int flag = 1;
  FATAL_FAIL(
      setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, (char *)&flag, sizeof(int)));
}
}  // namespace sb
