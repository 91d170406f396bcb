#ifndef __SB_SIGNATURE_HANDLER__
#define __SB_SIGNATURE_HANDLER__

#include "Headers.hpp"

namespace sb {
/**
 * @brief Ed25519 key pair, both halves encoded as URL-safe base64 without
 * padding.
 */
struct KeyPair {
  string publicKey;
  string privateKey;
};

/**
 * @brief libsodium Ed25519 signing used to authenticate terminals.
 */
class SignatureHandler {
 public:
  /**
   * @brief Initializes libsodium. Must be called before any other method.
   */
  static void init();

  static KeyPair createKeyPair();

  /**
   * @brief Rebuilds a key pair from an encoded 64-byte secret key.
   * @throws std::runtime_error if the key is malformed.
   */
  static KeyPair fromPrivateKey(const string& privateKey);

  /**
   * @brief Signs a message with an encoded secret key.
   * @return The encoded detached signature.
   * @throws std::runtime_error if the key is malformed.
   */
  static string sign(const string& message, const string& privateKey);

  /**
   * @brief Verifies a detached signature. Malformed keys or signatures verify
   * as false.
   */
  static bool verify(const string& message, const string& signature,
                     const string& publicKey);

  static string encode(const string& bytes);
  /**
   * @brief Decodes URL-safe unpadded base64.
   * @return nullopt when the input is not valid base64url.
   */
  static optional<string> decode(const string& encoded);
};
}  // namespace sb

#endif  // __SB_SIGNATURE_HANDLER__
