#ifndef __SB_WEBSOCKET_HANDSHAKE__
#define __SB_WEBSOCKET_HANDSHAKE__

#include "Headers.hpp"
#include "SocketHandler.hpp"

namespace sb {
/**
 * @brief The parts of an HTTP/1.1 request head needed to accept a websocket.
 */
struct HttpRequestHead {
  string method;
  /** @brief Raw request target, e.g. "/?public_key=..&terminal_id=..". */
  string target;
  string path;
  string version;
  /** @brief Header values keyed by lower-cased header name. */
  map<string, string> headers;
  /** @brief Percent-decoded query parameters of the target. */
  map<string, string> query;
};

/**
 * @brief HTTP upgrade handling for the websocket transport (RFC 6455).
 */
class WebSocketHandshake {
 public:
  /** @brief Largest request head we accept before giving up. */
  static const size_t MAX_HEAD_SIZE = 16 * 1024;
  /** @brief Time a peer gets to send its whole request head. */
  static const int HEAD_TIMEOUT_MS = 10 * 1000;

  /**
   * @brief Reads bytes until the blank line ending an HTTP head.
   *
   * The whole head must arrive within `timeoutMs` of the call, no matter how
   * the peer paces its bytes.
   * @throws std::runtime_error on timeout, EOF or when the head is too large.
   */
  static string readHead(SocketHandler* socketHandler, int fd,
                         int timeoutMs = HEAD_TIMEOUT_MS);

  /**
   * @brief Parses a request head.
   * @throws std::runtime_error when the request line is malformed.
   */
  static HttpRequestHead parseRequestHead(const string& head);

  static map<string, string> parseQueryString(const string& query);

  /**
   * @brief Decodes %XX escapes and '+' as space. Invalid escapes are kept
   * verbatim.
   */
  static string percentDecode(const string& s);

  static string percentEncode(const string& s);

  /**
   * @brief Checks the method, Upgrade, Sec-WebSocket-Key and
   * Sec-WebSocket-Version of a request.
   * @param reason Receives a description of the first failed check.
   */
  static bool isUpgradeRequest(const HttpRequestHead& head, string* reason);

  /**
   * @brief base64(SHA-1(key + GUID)), the Sec-WebSocket-Accept value.
   */
  static string computeAcceptKey(const string& clientKey);

  static string buildSwitchingProtocolsResponse(const string& clientKey);

  /**
   * @brief An HTTP response with the given status and no body, e.g.
   * "HTTP/1.1 401 Unauthorized\r\n\r\n".
   */
  static string buildRejection(int status, const string& statusText);

  /** @brief Builds a client upgrade request, used by tooling and tests. */
  static string buildClientRequest(const string& target, const string& host,
                                   const string& clientKey);

  /**
   * @brief Returns the status code from the first line of a response head.
   * @throws std::runtime_error if the status line cannot be parsed.
   */
  static int parseResponseStatus(const string& head);
};
}  // namespace sb

#endif  // __SB_WEBSOCKET_HANDSHAKE__
