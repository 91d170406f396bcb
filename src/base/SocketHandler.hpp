#ifndef __SB_SOCKET_HANDLER__
#define __SB_SOCKET_HANDLER__

#include "Headers.hpp"

namespace sb {
/**
 * @brief Provides an abstract API for socket reads/writes and lifecycle
 * management.
 */
class SocketHandler {
 public:
  virtual ~SocketHandler() {}

  /**
   * @brief Blocks until the fd becomes readable or the timeout passes.
   */
  virtual bool waitForData(int fd, int64_t sec, int64_t usec) = 0;
  /**
   * @brief Reads up to count bytes from fd.
   */
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  /**
   * @brief Writes up to count bytes to fd.
   */
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Reads exactly `count` bytes, retrying on EAGAIN until the buffer
   * fills.
   * @param timeout Whether to enforce the transfer timeout while waiting.
   * @throws std::runtime_error when the peer closes or the read fails.
   */
  void readAll(int fd, void* buf, size_t count, bool timeout);
  /**
   * @brief Attempts to write all bytes, throwing if the operation times out or
   * fails.
   */
  void writeAllOrThrow(int fd, const void* buf, size_t count, bool timeout);

  /** @brief Convenience wrapper that writes a whole string. */
  inline void writeAllOrThrow(int fd, const string& s, bool timeout) {
    writeAllOrThrow(fd, s.data(), s.length(), timeout);
  }

  /**
   * @brief Opens a connection to the specified endpoint.
   * @return File descriptor representing the socket (or -1 on failure).
   */
  virtual int connect(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Starts listening on the endpoint and returns the active listen fds.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Returns the listening fds associated with the endpoint.
   */
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Accepts a pending connection on the given listening fd.
   */
  virtual int accept(int fd) = 0;
  /**
   * @brief Stops accepting new connections on the given endpoint.
   */
  virtual void stopListening(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Shuts down both directions of a socket without releasing the fd,
   * waking up any thread blocked on it.
   */
  virtual void shutdownSocket(int fd) = 0;
  /** @brief Closes the supplied socket descriptor. */
  virtual void close(int fd) = 0;
};
}  // namespace sb

#endif  // __SB_SOCKET_HANDLER__
