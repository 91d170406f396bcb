#include "SignatureHandler.hpp"

#define SODIUM_FAIL(X) \
  if ((X) != 0) STFATAL << "Sodium call failed: " << #X;

namespace sb {
namespace {
const int BASE64_VARIANT = sodium_base64_VARIANT_URLSAFE_NO_PADDING;
}

void SignatureHandler::init() {
  if (sodium_init() == -1) {
    STFATAL << "libsodium init failed";
  }
}

KeyPair SignatureHandler::createKeyPair() {
  unsigned char pk[crypto_sign_PUBLICKEYBYTES];
  unsigned char sk[crypto_sign_SECRETKEYBYTES];
  SODIUM_FAIL(crypto_sign_keypair(pk, sk));
  KeyPair keyPair;
  keyPair.publicKey = encode(string((const char*)pk, sizeof(pk)));
  keyPair.privateKey = encode(string((const char*)sk, sizeof(sk)));
  sodium_memzero(sk, sizeof(sk));
  return keyPair;
}

KeyPair SignatureHandler::fromPrivateKey(const string& privateKey) {
  auto sk = decode(privateKey);
  if (!sk || sk->size() != crypto_sign_SECRETKEYBYTES) {
    throw runtime_error("Invalid private key");
  }
  unsigned char pk[crypto_sign_PUBLICKEYBYTES];
  SODIUM_FAIL(crypto_sign_ed25519_sk_to_pk(pk, (const unsigned char*)sk->data()));
  KeyPair keyPair;
  keyPair.publicKey = encode(string((const char*)pk, sizeof(pk)));
  keyPair.privateKey = privateKey;
  return keyPair;
}

string SignatureHandler::sign(const string& message,
                              const string& privateKey) {
  auto sk = decode(privateKey);
  if (!sk || sk->size() != crypto_sign_SECRETKEYBYTES) {
    throw runtime_error("Invalid private key");
  }
  unsigned char signature[crypto_sign_BYTES];
  SODIUM_FAIL(crypto_sign_detached(signature, NULL,
                                   (const unsigned char*)message.data(),
                                   message.size(),
                                   (const unsigned char*)sk->data()));
  return encode(string((const char*)signature, sizeof(signature)));
}

bool SignatureHandler::verify(const string& message, const string& signature,
                              const string& publicKey) {
  auto sig = decode(signature);
  auto pk = decode(publicKey);
  if (!sig || sig->size() != crypto_sign_BYTES) {
    VLOG(1) << "Signature has the wrong encoding or length";
    return false;
  }
  if (!pk || pk->size() != crypto_sign_PUBLICKEYBYTES) {
    VLOG(1) << "Public key has the wrong encoding or length";
    return false;
  }
  return crypto_sign_verify_detached((const unsigned char*)sig->data(),
                                     (const unsigned char*)message.data(),
                                     message.size(),
                                     (const unsigned char*)pk->data()) == 0;
}

string SignatureHandler::encode(const string& bytes) {
  string encoded(sodium_base64_ENCODED_LEN(bytes.size(), BASE64_VARIANT), '\0');
  sodium_bin2base64(&encoded[0], encoded.size(),
                    (const unsigned char*)bytes.data(), bytes.size(),
                    BASE64_VARIANT);
  encoded.resize(strlen(encoded.c_str()));
  return encoded;
}

optional<string> SignatureHandler::decode(const string& encoded) {
  string decoded(encoded.size(), '\0');
  size_t decodedLength = 0;
  // A NULL end pointer makes libsodium reject trailing garbage
  if (sodium_base642bin((unsigned char*)&decoded[0], decoded.size(),
                        encoded.data(), encoded.size(), NULL, &decodedLength,
                        NULL, BASE64_VARIANT) != 0) {
    return nullopt;
  }
  decoded.resize(decodedLength);
  return decoded;
}
}  // namespace sb
