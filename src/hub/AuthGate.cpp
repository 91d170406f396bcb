#include "AuthGate.hpp"

#include "SignatureHandler.hpp"

namespace sb {
ConnectionParams AuthGate::extractParams(const map<string, string> &query) {
  ConnectionParams params;
  auto it = query.find("public_key");
  if (it != query.end()) {
    params.publicKey = it->second;
  }
  it = query.find("terminal_id");
  if (it != query.end()) {
    params.terminalId = it->second;
  }
  it = query.find("signature");
  if (it != query.end()) {
    params.signature = it->second;
  }
  return params;
}

void AuthGate::validate(const ConnectionParams &params) {
  if (params.publicKey.empty()) {
    throw runtime_error("public_key is required");
  }
  if (params.terminalId.empty()) {
    throw runtime_error("terminal_id is required");
  }
  if (params.signature.empty()) {
    throw runtime_error("signature is required");
  }
  if (params.terminalId == HOST_TERMINAL_ID) {
    throw runtime_error("terminal_id is reserved");
  }
  if (!SignatureHandler::verify(AUTH_CHALLENGE, params.signature,
                                params.publicKey)) {
    throw runtime_error("signature is invalid");
  }
}
}  // namespace sb
