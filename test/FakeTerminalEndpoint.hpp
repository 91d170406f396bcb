#ifndef __SB_FAKE_TERMINAL_ENDPOINT__
#define __SB_FAKE_TERMINAL_ENDPOINT__

#include "TerminalEndpoint.hpp"
#include "TerminalMessage.hpp"

namespace sb {
/**
 * @brief In-memory endpoint that records what the hub sends to it.
 */
class FakeTerminalEndpoint : public TerminalEndpoint {
 public:
  typedef function<void(const string &frame)> Responder;

  explicit FakeTerminalEndpoint(const string &_terminalId)
      : terminalId(_terminalId),
        closeCode(0),
        terminated(false),
        acceptFrames(true) {}

  virtual const string &getTerminalId() const { return terminalId; }

  virtual bool send(const string &frame) {
    Responder r;
    {
      lock_guard<mutex> guard(fakeMutex);
      if (!acceptFrames || closeCode || terminated) {
        return false;
      }
      frames.push_back(frame);
      r = responder;
    }
    if (r) {
      r(frame);
    }
    return true;
  }

  virtual void close(uint16_t code, const string &reason) {
    lock_guard<mutex> guard(fakeMutex);
    closeCode = code;
  }

  virtual void terminate() {
    lock_guard<mutex> guard(fakeMutex);
    terminated = true;
  }

  /** @brief Called with every accepted frame, outside the fake's lock. */
  void setResponder(Responder _responder) {
    lock_guard<mutex> guard(fakeMutex);
    responder = _responder;
  }

  /** @brief Makes send() behave like a connection with a full buffer. */
  void setAcceptFrames(bool accept) {
    lock_guard<mutex> guard(fakeMutex);
    acceptFrames = accept;
  }

  vector<string> getFrames() {
    lock_guard<mutex> guard(fakeMutex);
    return frames;
  }

  vector<json> getMessages() {
    vector<json> messages;
    for (const auto &frame : getFrames()) {
      messages.push_back(json::parse(frame));
    }
    return messages;
  }

  uint16_t getCloseCode() {
    lock_guard<mutex> guard(fakeMutex);
    return closeCode;
  }

  bool isTerminated() {
    lock_guard<mutex> guard(fakeMutex);
    return terminated;
  }

 protected:
  string terminalId;
  mutex fakeMutex;
  vector<string> frames;
  Responder responder;
  uint16_t closeCode;
  bool terminated;
  bool acceptFrames;
};
}  // namespace sb

#endif  // __SB_FAKE_TERMINAL_ENDPOINT__
