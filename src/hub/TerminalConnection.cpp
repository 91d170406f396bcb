#include "TerminalConnection.hpp"

namespace sb {
TerminalConnection::TerminalConnection(
    shared_ptr<SocketHandler> _socketHandler, int _socketFd,
    const string &_publicKey, const string &_terminalId,
    size_t maxOutboundBytes)
    : socketHandler(_socketHandler),
      socketFd(_socketFd),
      publicKey(_publicKey),
      terminalId(_terminalId),
      outbound(maxOutboundBytes),
      closing(false),
      terminated(false),
      readerDone(false),
      fdClosed(false),
      finished(false) {}

TerminalConnection::~TerminalConnection() {
  if (writerThread && writerThread->joinable()) {
    {
      lock_guard<mutex> guard(connectionMutex);
      terminated = true;
    }
    writerWakeup.notify_all();
    writerThread->join();
  }
}

void TerminalConnection::start() {
  lock_guard<mutex> guard(connectionMutex);
  if (writerThread) {
    STFATAL << "Connection for " << terminalId << " started twice";
  }
  writerThread.reset(new thread(&TerminalConnection::writerLoop, this));
}

bool TerminalConnection::send(const string &frame) {
  string encoded = WebSocketCodec::encodeFrame(WS_TEXT, frame);
  {
    lock_guard<mutex> guard(connectionMutex);
    if (closing || terminated) {
      return false;
    }
    if (!outbound.enqueue(encoded)) {
      return false;
    }
  }
  writerWakeup.notify_one();
  return true;
}

void TerminalConnection::close(uint16_t code, const string &reason) {
  {
    lock_guard<mutex> guard(connectionMutex);
    if (closing || terminated) {
      return;
    }
    VLOG(1) << publicKey << " closing " << terminalId << " (" << code << " "
            << reason << ")";
    closing = true;
    outbound.forceEnqueue(WebSocketCodec::encodeClose(code, reason));
  }
  writerWakeup.notify_one();
}

void TerminalConnection::terminate() {
  {
    lock_guard<mutex> guard(connectionMutex);
    if (terminated) {
      return;
    }
    VLOG(1) << publicKey << " terminating " << terminalId;
    terminated = true;
    outbound.clear();
    shutdownSocketLocked();
  }
  writerWakeup.notify_one();
}

void TerminalConnection::sendControl(const string &encoded) {
  {
    lock_guard<mutex> guard(connectionMutex);
    if (closing || terminated) {
      return;
    }
    outbound.forceEnqueue(encoded);
  }
  writerWakeup.notify_one();
}

void TerminalConnection::shutdownSocketLocked() {
  if (!fdClosed) {
    socketHandler->shutdownSocket(socketFd);
  }
}

bool TerminalConnection::isFinished() {
  lock_guard<mutex> guard(connectionMutex);
  return finished;
}

bool TerminalConnection::isClosing() {
  lock_guard<mutex> guard(connectionMutex);
  return closing || terminated;
}

void TerminalConnection::writerLoop() {
  el::Helpers::setThreadName(terminalId + "-writer");
  while (true) {
    string frame;
    bool lastFrame = false;
    {
      unique_lock<mutex> lock(connectionMutex);
      writerWakeup.wait(lock, [this] {
        return terminated || readerDone || outbound.hasPendingData();
      });
      if (terminated || !outbound.hasPendingData()) {
        break;
      }
      outbound.dequeue(&frame);
      lastFrame = closing && !outbound.hasPendingData();
    }
    try {
      socketHandler->writeAllOrThrow(socketFd, frame, true);
    } catch (const std::runtime_error &e) {
      VLOG(1) << publicKey << " write to " << terminalId
              << " failed: " << e.what();
      break;
    }
    if (lastFrame) {
      break;
    }
  }

  lock_guard<mutex> guard(connectionMutex);
  terminated = true;
  outbound.clear();
  // Wakes up the reader if it is still waiting for data
  shutdownSocketLocked();
}

void TerminalConnection::run(MessageHandler onMessage) {
  el::Helpers::setThreadName(terminalId);
  string message;
  bool inMessage = false;
  uint8_t messageOpcode = WS_TEXT;
  try {
    while (true) {
      {
        lock_guard<mutex> guard(connectionMutex);
        if (terminated) {
          break;
        }
      }
      WebSocketFrame frame =
          WebSocketCodec::readFrame(socketHandler.get(), socketFd, true);
      switch (frame.opcode) {
        case WS_PING:
          sendControl(WebSocketCodec::encodeFrame(WS_PONG, frame.payload));
          break;
        case WS_PONG:
          break;
        case WS_CLOSE: {
          uint16_t code = WebSocketCodec::parseCloseCode(frame.payload);
          VLOG(1) << publicKey << " " << terminalId << " sent close " << code;
          if (isClosing()) {
            // This answers our own close
            throw runtime_error("Close handshake complete");
          }
          close(code == WS_CLOSE_NO_STATUS ? WS_CLOSE_NORMAL : code, "");
          break;
        }
        case WS_TEXT:
        case WS_BINARY:
          if (inMessage) {
            close(WS_CLOSE_PROTOCOL_ERROR, "expected continuation frame");
            throw runtime_error("Data frame inside a fragmented message");
          }
          messageOpcode = frame.opcode;
          message = std::move(frame.payload);
          inMessage = !frame.fin;
          break;
        case WS_CONTINUATION:
          if (!inMessage) {
            close(WS_CLOSE_PROTOCOL_ERROR, "unexpected continuation frame");
            throw runtime_error("Continuation frame outside a message");
          }
          if (message.size() + frame.payload.size() >
              MAX_WEBSOCKET_MESSAGE_SIZE) {
            close(WS_CLOSE_TOO_BIG, "message too big");
            throw runtime_error("Websocket message too big");
          }
          message += frame.payload;
          inMessage = !frame.fin;
          break;
        default:
          close(WS_CLOSE_PROTOCOL_ERROR, "unknown opcode");
          throw runtime_error("Unknown websocket opcode " +
                              to_string(int(frame.opcode)));
      }

      if (!WebSocketCodec::isControl(frame.opcode) && !inMessage) {
        if (messageOpcode == WS_TEXT) {
          if (!isClosing()) {
            onMessage(message);
          }
        } else {
          VLOG(2) << publicKey << " dropping binary message from "
                  << terminalId;
        }
        message.clear();
      }
    }
  } catch (const std::exception &e) {
    VLOG(1) << publicKey << " connection of " << terminalId
            << " ended: " << e.what();
  }

  {
    lock_guard<mutex> guard(connectionMutex);
    readerDone = true;
  }
  writerWakeup.notify_all();
  if (writerThread && writerThread->joinable()) {
    writerThread->join();
  }

  lock_guard<mutex> guard(connectionMutex);
  if (!fdClosed) {
    fdClosed = true;
    socketHandler->close(socketFd);
  }
  finished = true;
}
}  // namespace sb
