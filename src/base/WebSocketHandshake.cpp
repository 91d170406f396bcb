#include "WebSocketHandshake.hpp"

#include <openssl/evp.h>

namespace sb {
namespace {
const char* WEBSOCKET_GUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool headerContainsToken(const HttpRequestHead& head, const string& name,
                         const string& token) {
  auto it = head.headers.find(name);
  if (it == head.headers.end()) {
    return false;
  }
  for (const auto& part : split(it->second, ',')) {
    if (toLower(trim(part)) == token) {
      return true;
    }
  }
  return false;
}
}  // namespace

string WebSocketHandshake::readHead(SocketHandler* socketHandler, int fd,
                                    int timeoutMs) {
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(timeoutMs);
  string head;
  char c;
  while (true) {
    auto remaining = std::chrono::duration_cast<std::chrono::microseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      throw runtime_error("Timed out reading HTTP request head");
    }
    // Wake up regularly so a silent peer cannot outlive the deadline
    int64_t waitUsec = min<int64_t>(remaining.count(), 100 * 1000);
    if (!socketHandler->waitForData(fd, 0, waitUsec)) {
      continue;
    }
    ssize_t bytesRead = socketHandler->read(fd, &c, 1);
    if (bytesRead == 0) {
      throw runtime_error("Connection closed while reading HTTP request head");
    }
    if (bytesRead < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        continue;
      }
      throw runtime_error(string("Failed reading HTTP request head: ") +
                          strerror(errno));
    }
    head.push_back(c);
    if (head.size() >= 4 && head.compare(head.size() - 4, 4, "\r\n\r\n") == 0) {
      return head;
    }
    if (head.size() > MAX_HEAD_SIZE) {
      throw runtime_error("HTTP request head is too large");
    }
  }
}

HttpRequestHead WebSocketHandshake::parseRequestHead(const string& head) {
  HttpRequestHead request;
  auto lineEnd = head.find("\r\n");
  if (lineEnd == string::npos) {
    throw runtime_error("Missing request line");
  }
  auto tokens = split(head.substr(0, lineEnd), ' ');
  if (tokens.size() != 3) {
    throw runtime_error("Malformed request line: " + head.substr(0, lineEnd));
  }
  request.method = tokens[0];
  request.target = tokens[1];
  request.version = tokens[2];
  if (request.version.find("HTTP/") != 0) {
    throw runtime_error("Unsupported protocol: " + request.version);
  }

  auto queryStart = request.target.find('?');
  if (queryStart == string::npos) {
    request.path = request.target;
  } else {
    request.path = request.target.substr(0, queryStart);
    request.query = parseQueryString(request.target.substr(queryStart + 1));
  }

  size_t pos = lineEnd + 2;
  while (pos < head.size()) {
    auto next = head.find("\r\n", pos);
    if (next == string::npos) {
      next = head.size();
    }
    string line = head.substr(pos, next - pos);
    pos = next + 2;
    if (line.empty()) {
      break;
    }
    auto colon = line.find(':');
    if (colon == string::npos) {
      throw runtime_error("Malformed header line: " + line);
    }
    request.headers[toLower(trim(line.substr(0, colon)))] =
        trim(line.substr(colon + 1));
  }
  return request;
}

map<string, string> WebSocketHandshake::parseQueryString(const string& query) {
  map<string, string> params;
  for (const auto& pair : split(query, '&')) {
    if (pair.empty()) {
      continue;
    }
    auto eq = pair.find('=');
    if (eq == string::npos) {
      params[percentDecode(pair)] = "";
    } else {
      params[percentDecode(pair.substr(0, eq))] =
          percentDecode(pair.substr(eq + 1));
    }
  }
  return params;
}

string WebSocketHandshake::percentDecode(const string& s) {
  string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); i++) {
    if (s[i] == '+') {
      out.push_back(' ');
    } else if (s[i] == '%' && i + 2 < s.size() && hexValue(s[i + 1]) >= 0 &&
               hexValue(s[i + 2]) >= 0) {
      out.push_back(char(hexValue(s[i + 1]) * 16 + hexValue(s[i + 2])));
      i += 2;
    } else {
      out.push_back(s[i]);
    }
  }
  return out;
}

string WebSocketHandshake::percentEncode(const string& s) {
  static const char* hex = "0123456789ABCDEF";
  string out;
  for (unsigned char c : s) {
    if (isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(char(c));
    } else {
      out.push_back('%');
      out.push_back(hex[c >> 4]);
      out.push_back(hex[c & 0xF]);
    }
  }
  return out;
}

bool WebSocketHandshake::isUpgradeRequest(const HttpRequestHead& head,
                                          string* reason) {
  if (head.method != "GET") {
    *reason = "method must be GET, got " + head.method;
    return false;
  }
  if (!headerContainsToken(head, "upgrade", "websocket")) {
    *reason = "missing Upgrade: websocket";
    return false;
  }
  auto key = head.headers.find("sec-websocket-key");
  if (key == head.headers.end() || key->second.empty()) {
    *reason = "missing Sec-WebSocket-Key";
    return false;
  }
  auto version = head.headers.find("sec-websocket-version");
  if (version == head.headers.end() || version->second != "13") {
    *reason = "unsupported Sec-WebSocket-Version";
    return false;
  }
  return true;
}

string WebSocketHandshake::computeAcceptKey(const string& clientKey) {
  string seed = clientKey + WEBSOCKET_GUID;
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digestLength = 0;
  if (EVP_Digest(seed.data(), seed.size(), digest, &digestLength, EVP_sha1(),
                 NULL) != 1) {
    STFATAL << "SHA-1 digest failed";
  }
  string encoded(
      sodium_base64_ENCODED_LEN(digestLength, sodium_base64_VARIANT_ORIGINAL),
      '\0');
  sodium_bin2base64(&encoded[0], encoded.size(), digest, digestLength,
                    sodium_base64_VARIANT_ORIGINAL);
  // Drop the trailing NUL written by libsodium
  encoded.resize(strlen(encoded.c_str()));
  return encoded;
}

string WebSocketHandshake::buildSwitchingProtocolsResponse(
    const string& clientKey) {
  std::ostringstream response;
  response << "HTTP/1.1 101 Switching Protocols\r\n";
  response << "Upgrade: websocket\r\n";
  response << "Connection: Upgrade\r\n";
  response << "Sec-WebSocket-Accept: " << computeAcceptKey(clientKey)
           << "\r\n\r\n";
  return response.str();
}

string WebSocketHandshake::buildRejection(int status,
                                          const string& statusText) {
  return "HTTP/1.1 " + to_string(status) + " " + statusText + "\r\n\r\n";
}

string WebSocketHandshake::buildClientRequest(const string& target,
                                              const string& host,
                                              const string& clientKey) {
  std::ostringstream request;
  request << "GET " << target << " HTTP/1.1\r\n";
  request << "Host: " << host << "\r\n";
  request << "Upgrade: websocket\r\n";
  request << "Connection: Upgrade\r\n";
  request << "Sec-WebSocket-Key: " << clientKey << "\r\n";
  request << "Sec-WebSocket-Version: 13\r\n\r\n";
  return request.str();
}

int WebSocketHandshake::parseResponseStatus(const string& head) {
  auto lineEnd = head.find("\r\n");
  auto tokens = split(head.substr(0, lineEnd), ' ');
  if (tokens.size() < 2 || tokens[0].find("HTTP/") != 0) {
    throw runtime_error("Malformed status line");
  }
  try {
    return stoi(tokens[1]);
  } catch (const std::logic_error& e) {
    throw runtime_error("Malformed status code: " + tokens[1]);
  }
}
}  // namespace sb
