#ifndef __SB_TCP_SOCKET_HANDLER__
#define __SB_TCP_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace sb {
/**
 * @brief Implements IPv4/IPv6 socket operations built on top of
 * UnixSocketHandler.
 */
class TcpSocketHandler : public UnixSocketHandler {
 public:
  TcpSocketHandler();
  virtual ~TcpSocketHandler() {}

  /**
   * @brief Resolves the hostname/port and connects to the server.
   */
  virtual int connect(const SocketEndpoint& endpoint);
  /**
   * @brief Binds and listens on the given port. When the endpoint carries a
   * name it is used as the bind address, otherwise every interface is used.
   * @throws std::runtime_error when the address cannot be bound.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint);
  /**
   * @brief Returns the listening socket fds associated with a port.
   */
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint);
  /**
   * @brief Stops listening on the requested port and closes all related fds.
   */
  virtual void stopListening(const SocketEndpoint& endpoint);

 protected:
  /** @brief Tracks all listening sockets created per TCP port. */
  map<int, set<int>> portServerSockets;

  /**
   * @brief Performs additional TCP-specific socket configuration (NODELAY).
   */
  virtual void initSocket(int fd);
};
}  // namespace sb

#endif  // __SB_TCP_SOCKET_HANDLER__
