#ifndef __SB_SOCKET_PAIR_HANDLER__
#define __SB_SOCKET_PAIR_HANDLER__

#include "UnixSocketHandler.hpp"

namespace sb {
/**
 * @brief UnixSocketHandler over anonymous socket pairs, for tests that need
 * two connected descriptors without a listener.
 */
class SocketPairHandler : public UnixSocketHandler {
 public:
  /** @brief Creates a connected pair of tracked, non-blocking sockets. */
  pair<int, int> createPair() {
    lock_guard<std::recursive_mutex> guard(globalMutex);
    int fds[2];
    FATAL_FAIL(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds));
    for (int fd : fds) {
      addToActiveSockets(fd);
      initSocket(fd);
    }
    return make_pair(fds[0], fds[1]);
  }

  virtual int connect(const SocketEndpoint &endpoint) {
    STFATAL << "SocketPairHandler cannot connect";
    return -1;
  }
  virtual set<int> listen(const SocketEndpoint &endpoint) {
    STFATAL << "SocketPairHandler cannot listen";
    return set<int>();
  }
  virtual set<int> getEndpointFds(const SocketEndpoint &endpoint) {
    STFATAL << "SocketPairHandler cannot listen";
    return set<int>();
  }
  virtual void stopListening(const SocketEndpoint &endpoint) {
    STFATAL << "SocketPairHandler cannot listen";
  }
};
}  // namespace sb

#endif  // __SB_SOCKET_PAIR_HANDLER__
