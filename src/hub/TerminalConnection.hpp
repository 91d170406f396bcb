#ifndef __SB_TERMINAL_CONNECTION__
#define __SB_TERMINAL_CONNECTION__

#include "Headers.hpp"
#include "SocketHandler.hpp"
#include "TerminalEndpoint.hpp"
#include "WebSocketFrame.hpp"
#include "WriteBuffer.hpp"

namespace sb {
/**
 * @brief An upgraded websocket of one terminal.
 *
 * Frames for the terminal are queued on a bounded buffer drained by a
 * dedicated writer thread, so forwarding into a slow terminal never blocks
 * the sender. run() is the reader loop and owns the descriptor: it closes it
 * once both directions are done.
 */
class TerminalConnection : public TerminalEndpoint {
 public:
  typedef function<void(const string &message)> MessageHandler;

  TerminalConnection(shared_ptr<SocketHandler> _socketHandler, int _socketFd,
                     const string &_publicKey, const string &_terminalId,
                     size_t maxOutboundBytes);
  virtual ~TerminalConnection();

  virtual const string &getTerminalId() const { return terminalId; }
  const string &getPublicKey() const { return publicKey; }

  /** @brief Starts the writer thread. */
  void start();

  /**
   * @brief Queues `frame` as a text message.
   * @return false if the connection is closing or the buffer is full.
   */
  virtual bool send(const string &frame);

  /**
   * @brief Queues a close frame. Nothing else is sent afterwards, and the
   * socket is shut down once the close frame is written.
   */
  virtual void close(uint16_t code, const string &reason);

  /** @brief Shuts the socket down immediately, dropping queued frames. */
  virtual void terminate();

  /**
   * @brief Reads messages until the socket closes, handing every complete
   * text message to `onMessage`. Blocks the calling thread.
   */
  void run(MessageHandler onMessage);

  bool isFinished();
  bool isClosing();

 protected:
  shared_ptr<SocketHandler> socketHandler;
  int socketFd;
  string publicKey;
  string terminalId;

  mutex connectionMutex;
  std::condition_variable writerWakeup;
  WriteBuffer outbound;
  shared_ptr<thread> writerThread;
  /** @brief A close frame is queued; no data frames are accepted. */
  bool closing;
  /** @brief The socket was shut down; pending frames are discarded. */
  bool terminated;
  bool readerDone;
  bool fdClosed;
  bool finished;

  void writerLoop();
  /** @brief Shuts the socket down. connectionMutex must be held. */
  void shutdownSocketLocked();
  /** @brief Queues a control frame past the buffer limit. */
  void sendControl(const string &encoded);
};
}  // namespace sb

#endif  // __SB_TERMINAL_CONNECTION__
