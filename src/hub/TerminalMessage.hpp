#ifndef __SB_TERMINAL_MESSAGE__
#define __SB_TERMINAL_MESSAGE__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace sb {
/**
 * @brief Metadata a terminal reports about itself.
 *
 * The whole JSON object is kept so that fields the hub does not know about
 * are returned verbatim by ListTerminals.
 */
struct TerminalInfo {
  string terminalId;
  string name;
  json fields;

  /**
   * @brief Builds an info from a JSON object carrying a non-empty string
   * "terminal_id". Returns nullopt for anything else.
   */
  static optional<TerminalInfo> fromJson(const json &j);

  const json &toJson() const { return fields; }
};

/**
 * @brief Returns j[key] if j is an object holding a string there, otherwise
 * the empty string.
 */
string stringField(const json &j, const string &key);

/**
 * @brief Returns the target_terminal_id of a frame, or nullopt if the frame
 * is not a JSON object with a string target.
 */
optional<string> extractTargetTerminalId(const string &frame);

/**
 * @brief A request envelope from `source` to `target`.
 */
json makeRequest(const string &traceId, const string &method,
                 const string &source, const string &target, const json &req);

/**
 * @brief A response to `request` sent by the host terminal.
 */
json makeResponse(const json &request, int code, const string &message,
                  const json &data = json());

/**
 * @brief A channel value pushed to a subscriber.
 */
json makeChannelFrame(const string &traceId, const string &target,
                      const json &value);
}  // namespace sb

#endif  // __SB_TERMINAL_MESSAGE__
