#ifndef __SB_UNIX_SOCKET_HANDLER__
#define __SB_UNIX_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace sb {
/**
 * @brief Default SocketHandler implementation using POSIX sockets with a
 * mutex per active descriptor.
 */
class UnixSocketHandler : public SocketHandler {
 public:
  UnixSocketHandler();
  virtual ~UnixSocketHandler() {}

  virtual bool waitForData(int fd, int64_t sec, int64_t usec);
  /** @brief Reads up to `count` bytes while holding the per-socket mutex. */
  virtual ssize_t read(int fd, void* buf, size_t count);
  /** @brief Writes `count` bytes by retrying for a few seconds. */
  virtual ssize_t write(int fd, const void* buf, size_t count);
  virtual int accept(int fd);
  virtual void shutdownSocket(int fd);
  /** @brief Closes the descriptor and removes it from the tracked set. */
  virtual void close(int fd);

 protected:
  /**
   * @brief Ensures that a descriptor is tracked and has its own mutex.
   */
  void addToActiveSockets(int fd);
  /** @brief Returns the mutex of a tracked socket, or null if it is closed. */
  shared_ptr<recursive_mutex> getSocketMutex(int fd);
  /**
   * @brief Performs per-socket initialization (non-blocking, no SIGPIPE).
   */
  virtual void initSocket(int fd);
  /**
   * @brief Adds reusable flags for listening sockets.
   */
  virtual void initServerSocket(int fd);

  /** @brief Mutex per active socket to ensure serial read/write. */
  map<int, shared_ptr<recursive_mutex>> activeSocketMutexes;
  /** @brief Guards access to the active socket map. */
  recursive_mutex globalMutex;
};
}  // namespace sb

#endif  // __SB_UNIX_SOCKET_HANDLER__
