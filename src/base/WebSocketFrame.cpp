#include "WebSocketFrame.hpp"

namespace sb {
string WebSocketCodec::encodeFrame(uint8_t opcode, const string& payload,
                                   bool mask) {
  string frame;
  frame.push_back(char(0x80 | (opcode & 0x0F)));
  uint8_t maskBit = mask ? 0x80 : 0;
  uint64_t len = payload.size();
  if (len < 126) {
    frame.push_back(char(maskBit | len));
  } else if (len <= 0xFFFF) {
    frame.push_back(char(maskBit | 126));
    frame.push_back(char((len >> 8) & 0xFF));
    frame.push_back(char(len & 0xFF));
  } else {
    frame.push_back(char(maskBit | 127));
    for (int i = 7; i >= 0; --i) {
      frame.push_back(char((len >> (i * 8)) & 0xFF));
    }
  }
  if (!mask) {
    frame += payload;
    return frame;
  }
  unsigned char maskKey[4];
  randombytes_buf(maskKey, sizeof(maskKey));
  frame.append((const char*)maskKey, 4);
  size_t start = frame.size();
  frame += payload;
  for (size_t i = 0; i < payload.size(); i++) {
    frame[start + i] = char(uint8_t(frame[start + i]) ^ maskKey[i % 4]);
  }
  return frame;
}

string WebSocketCodec::encodeClose(uint16_t code, const string& reason,
                                   bool mask) {
  string payload;
  payload.push_back(char((code >> 8) & 0xFF));
  payload.push_back(char(code & 0xFF));
  // Control frame payloads are limited to 125 bytes
  payload += reason.substr(0, 123);
  return encodeFrame(WS_CLOSE, payload, mask);
}

uint16_t WebSocketCodec::parseCloseCode(const string& payload) {
  if (payload.size() < 2) {
    return WS_CLOSE_NO_STATUS;
  }
  return uint16_t((uint8_t(payload[0]) << 8) | uint8_t(payload[1]));
}

WebSocketFrame WebSocketCodec::readFrame(SocketHandler* socketHandler, int fd,
                                         bool requireMask) {
  unsigned char head[2];
  socketHandler->readAll(fd, head, 2, false);

  WebSocketFrame frame;
  frame.fin = (head[0] & 0x80) != 0;
  frame.opcode = head[0] & 0x0F;
  if (head[0] & 0x70) {
    throw runtime_error("Reserved websocket bits set without an extension");
  }
  bool masked = (head[1] & 0x80) != 0;
  if (requireMask && !masked) {
    throw runtime_error("Client frame is not masked");
  }

  uint64_t len = head[1] & 0x7F;
  if (len == 126) {
    unsigned char ext[2];
    socketHandler->readAll(fd, ext, 2, true);
    len = (uint64_t(ext[0]) << 8) | ext[1];
  } else if (len == 127) {
    unsigned char ext[8];
    socketHandler->readAll(fd, ext, 8, true);
    len = 0;
    for (int i = 0; i < 8; ++i) {
      len = (len << 8) | ext[i];
    }
  }

  if (isControl(frame.opcode) && (len > 125 || !frame.fin)) {
    throw runtime_error("Invalid websocket control frame");
  }
  if (len > MAX_WEBSOCKET_MESSAGE_SIZE) {
    throw runtime_error("Websocket frame too large: " + to_string(len));
  }

  unsigned char maskKey[4] = {0, 0, 0, 0};
  if (masked) {
    socketHandler->readAll(fd, maskKey, 4, true);
  }

  frame.payload.resize(len);
  if (len > 0) {
    socketHandler->readAll(fd, &frame.payload[0], len, true);
  }
  if (masked) {
    for (size_t i = 0; i < len; ++i) {
      frame.payload[i] = char(uint8_t(frame.payload[i]) ^ maskKey[i % 4]);
    }
  }
  return frame;
}
}  // namespace sb
