#ifndef __SB_WEBSOCKET_FRAME__
#define __SB_WEBSOCKET_FRAME__

#include "Headers.hpp"
#include "SocketHandler.hpp"

namespace sb {
enum WebSocketOpcode {
  WS_CONTINUATION = 0x0,
  WS_TEXT = 0x1,
  WS_BINARY = 0x2,
  WS_CLOSE = 0x8,
  WS_PING = 0x9,
  WS_PONG = 0xA,
};

// Close status codes
const uint16_t WS_CLOSE_NORMAL = 1000;
const uint16_t WS_CLOSE_GOING_AWAY = 1001;
const uint16_t WS_CLOSE_PROTOCOL_ERROR = 1002;
const uint16_t WS_CLOSE_TOO_BIG = 1009;
const uint16_t WS_CLOSE_NO_STATUS = 1005;

struct WebSocketFrame {
  bool fin;
  uint8_t opcode;
  /** @brief Unmasked payload bytes. */
  string payload;
};

/**
 * @brief Encodes and decodes RFC 6455 frames.
 */
class WebSocketCodec {
 public:
  /**
   * @brief Encodes a single final frame.
   * @param mask Whether to mask the payload with a random key (client role).
   */
  static string encodeFrame(uint8_t opcode, const string& payload,
                            bool mask = false);

  /** @brief Encodes a close frame with a status code and reason. */
  static string encodeClose(uint16_t code, const string& reason,
                            bool mask = false);

  /**
   * @brief Returns the status code of a close payload, or WS_CLOSE_NO_STATUS
   * when the payload is empty.
   */
  static uint16_t parseCloseCode(const string& payload);

  /**
   * @brief Blocks until a complete frame has been read from fd.
   * @param requireMask Whether the peer must mask (server role).
   * @throws std::runtime_error on socket errors and protocol violations.
   */
  static WebSocketFrame readFrame(SocketHandler* socketHandler, int fd,
                                  bool requireMask);

  static bool isControl(uint8_t opcode) { return (opcode & 0x8) != 0; }
};
}  // namespace sb

#endif  // __SB_WEBSOCKET_FRAME__
