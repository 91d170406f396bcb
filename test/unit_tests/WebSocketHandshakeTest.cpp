#include "SocketPairHandler.hpp"
#include "TestHeaders.hpp"
#include "WebSocketHandshake.hpp"

using namespace sb;

namespace {
const string UPGRADE_REQUEST =
    "GET /?public_key=abc%2Bdef&terminal_id=t1&signature=s+ig HTTP/1.1\r\n"
    "Host: localhost:8888\r\n"
    "Upgrade: websocket\r\n"
    "Connection: keep-alive, Upgrade\r\n"
    "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n"
    "Sec-WebSocket-Version: 13\r\n"
    "\r\n";
}

TEST_CASE("Accept key matches the RFC 6455 example", "[WebSocketHandshake]") {
  REQUIRE(WebSocketHandshake::computeAcceptKey("dGhlIHNhbXBsZSBub25jZQ==") ==
          "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
}

TEST_CASE("Parses request line, headers and query", "[WebSocketHandshake]") {
  HttpRequestHead head = WebSocketHandshake::parseRequestHead(UPGRADE_REQUEST);
  REQUIRE(head.method == "GET");
  REQUIRE(head.path == "/");
  REQUIRE(head.version == "HTTP/1.1");
  REQUIRE(head.headers["upgrade"] == "websocket");
  REQUIRE(head.headers["sec-websocket-version"] == "13");
  REQUIRE(head.query["public_key"] == "abc+def");
  REQUIRE(head.query["terminal_id"] == "t1");
  REQUIRE(head.query["signature"] == "s ig");

  string reason;
  REQUIRE(WebSocketHandshake::isUpgradeRequest(head, &reason));
}

TEST_CASE("Rejects requests that are not websocket upgrades",
          "[WebSocketHandshake]") {
  string reason;
  HttpRequestHead plain = WebSocketHandshake::parseRequestHead(
      "GET /status HTTP/1.1\r\nHost: localhost\r\n\r\n");
  REQUIRE_FALSE(WebSocketHandshake::isUpgradeRequest(plain, &reason));
  REQUIRE(reason == "missing Upgrade: websocket");

  HttpRequestHead post = WebSocketHandshake::parseRequestHead(UPGRADE_REQUEST);
  post.method = "POST";
  REQUIRE_FALSE(WebSocketHandshake::isUpgradeRequest(post, &reason));

  HttpRequestHead oldVersion =
      WebSocketHandshake::parseRequestHead(UPGRADE_REQUEST);
  oldVersion.headers["sec-websocket-version"] = "8";
  REQUIRE_FALSE(WebSocketHandshake::isUpgradeRequest(oldVersion, &reason));
  REQUIRE(reason == "unsupported Sec-WebSocket-Version");

  REQUIRE_THROWS(WebSocketHandshake::parseRequestHead("garbage\r\n\r\n"));
}

TEST_CASE("Percent decoding", "[WebSocketHandshake]") {
  REQUIRE(WebSocketHandshake::percentDecode("a%20b+c") == "a b c");
  REQUIRE(WebSocketHandshake::percentDecode("100%") == "100%");
  REQUIRE(WebSocketHandshake::percentDecode("%zz") == "%zz");
  REQUIRE(WebSocketHandshake::percentEncode("a b/c") == "a%20b%2Fc");

  auto query = WebSocketHandshake::parseQueryString("a=1&&b=&c");
  REQUIRE(query.size() == 3);
  REQUIRE(query["a"] == "1");
  REQUIRE(query["b"] == "");
  REQUIRE(query["c"] == "");
}

TEST_CASE("Rejection responses carry no body", "[WebSocketHandshake]") {
  REQUIRE(WebSocketHandshake::buildRejection(401, "Unauthorized") ==
          "HTTP/1.1 401 Unauthorized\r\n\r\n");
  REQUIRE(WebSocketHandshake::parseResponseStatus(
              WebSocketHandshake::buildRejection(400, "Bad Request")) == 400);

  string response =
      WebSocketHandshake::buildSwitchingProtocolsResponse(
          "dGhlIHNhbXBsZSBub25jZQ==");
  REQUIRE(WebSocketHandshake::parseResponseStatus(response) == 101);
  REQUIRE(response.find("Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=") !=
          string::npos);
}

TEST_CASE("Reads a request head from a socket", "[WebSocketHandshake]") {
  shared_ptr<SocketPairHandler> socketHandler(new SocketPairHandler());
  auto fds = socketHandler->createPair();

  socketHandler->writeAllOrThrow(fds.first, UPGRADE_REQUEST + "trailing",
                                 true);
  REQUIRE(WebSocketHandshake::readHead(socketHandler.get(), fds.second) ==
          UPGRADE_REQUEST);

  // Bytes after the head stay in the socket
  string drained(8, '\0');
  socketHandler->readAll(fds.second, &drained[0], drained.size(), true);
  REQUIRE(drained == "trailing");

  // Oversized heads are refused
  string huge = "GET / HTTP/1.1\r\nX-Padding: " + string(20 * 1024, 'a');
  socketHandler->writeAllOrThrow(fds.first, huge, true);
  REQUIRE_THROWS(WebSocketHandshake::readHead(socketHandler.get(), fds.second));

  socketHandler->close(fds.first);
  socketHandler->close(fds.second);
}

TEST_CASE("A trickling request head still times out",
          "[WebSocketHandshake]") {
  shared_ptr<SocketPairHandler> socketHandler(new SocketPairHandler());
  auto fds = socketHandler->createPair();

  atomic<bool> done(false);
  thread trickle([&] {
    while (!done) {
      socketHandler->writeAllOrThrow(fds.first, "G", 1, true);
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
  });

  auto start = std::chrono::steady_clock::now();
  REQUIRE_THROWS_WITH(
      WebSocketHandshake::readHead(socketHandler.get(), fds.second, 1000),
      "Timed out reading HTTP request head");
  auto elapsed = std::chrono::steady_clock::now() - start;
  REQUIRE(elapsed < std::chrono::seconds(3));

  done = true;
  trickle.join();
  socketHandler->close(fds.first);
  socketHandler->close(fds.second);
}

TEST_CASE("A peer hanging up mid head is reported", "[WebSocketHandshake]") {
  shared_ptr<SocketPairHandler> socketHandler(new SocketPairHandler());
  auto fds = socketHandler->createPair();

  socketHandler->writeAllOrThrow(fds.first, "GET / HTTP/1.1\r\n", true);
  socketHandler->close(fds.first);
  REQUIRE_THROWS(WebSocketHandshake::readHead(socketHandler.get(), fds.second));
  socketHandler->close(fds.second);
}
