#ifndef __SB_PIPE_SOCKET_HANDLER__
#define __SB_PIPE_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace sb {
/**
 * @brief Handles UNIX domain socket connections addressed by a filesystem
 * path stored in the endpoint name.
 */
class PipeSocketHandler : public UnixSocketHandler {
 public:
  PipeSocketHandler();
  virtual ~PipeSocketHandler() {}

  virtual int connect(const SocketEndpoint& endpoint);
  /**
   * @brief Creates a listening UNIX socket, replacing any stale socket file.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint);
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint);
  /**
   * @brief Closes the listening fd and removes the socket file.
   */
  virtual void stopListening(const SocketEndpoint& endpoint);

 protected:
  /** @brief Tracks path -> listening socket descriptors for each pipe. */
  map<string, set<int>> pipeServerSockets;
};
}  // namespace sb

#endif  // __SB_PIPE_SOCKET_HANDLER__
