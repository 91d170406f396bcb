#include "AuthGate.hpp"
#include "SignatureHandler.hpp"
#include "TestHeaders.hpp"

using namespace sb;

namespace {
string failureReason(const ConnectionParams &params) {
  try {
    AuthGate::validate(params);
  } catch (const std::runtime_error &e) {
    return e.what();
  }
  return "";
}
}  // namespace

TEST_CASE("Extracts connection parameters from the query", "[AuthGate]") {
  map<string, string> query = {{"public_key", "pk"},
                               {"terminal_id", "t1"},
                               {"signature", "sig"},
                               {"other", "ignored"}};
  ConnectionParams params = AuthGate::extractParams(query);
  REQUIRE(params.publicKey == "pk");
  REQUIRE(params.terminalId == "t1");
  REQUIRE(params.signature == "sig");

  ConnectionParams empty = AuthGate::extractParams({});
  REQUIRE(empty.publicKey.empty());
}

TEST_CASE("Every parameter is required", "[AuthGate]") {
  KeyPair keyPair = SignatureHandler::createKeyPair();
  ConnectionParams params;
  params.publicKey = keyPair.publicKey;
  params.terminalId = "t1";
  params.signature = SignatureHandler::sign(AUTH_CHALLENGE, keyPair.privateKey);
  REQUIRE(failureReason(params) == "");

  ConnectionParams missing = params;
  missing.publicKey = "";
  REQUIRE(failureReason(missing) == "public_key is required");

  missing = params;
  missing.terminalId = "";
  REQUIRE(failureReason(missing) == "terminal_id is required");

  missing = params;
  missing.signature = "";
  REQUIRE(failureReason(missing) == "signature is required");
}

TEST_CASE("Signatures must match the public key", "[AuthGate]") {
  KeyPair keyPair = SignatureHandler::createKeyPair();
  KeyPair other = SignatureHandler::createKeyPair();
  ConnectionParams params;
  params.publicKey = keyPair.publicKey;
  params.terminalId = "t1";
  params.signature = SignatureHandler::sign(AUTH_CHALLENGE, other.privateKey);
  REQUIRE(failureReason(params) == "signature is invalid");

  params.signature = SignatureHandler::sign("not the challenge",
                                            keyPair.privateKey);
  REQUIRE(failureReason(params) == "signature is invalid");
}

TEST_CASE("The host terminal id is reserved", "[AuthGate]") {
  KeyPair keyPair = SignatureHandler::createKeyPair();
  ConnectionParams params;
  params.publicKey = keyPair.publicKey;
  params.terminalId = HOST_TERMINAL_ID;
  params.signature = SignatureHandler::sign(AUTH_CHALLENGE, keyPair.privateKey);
  REQUIRE(failureReason(params) == "terminal_id is reserved");
}
