#ifndef __SB_JSON_LIB__
#define __SB_JSON_LIB__

#include <optional>
#include <string>

#include "nlohmann/json.hpp"

using json = nlohmann::json;

namespace sb {
/**
 * @brief Parses a frame payload, returning nullopt instead of throwing when
 * the text is not valid JSON.
 */
inline std::optional<json> tryParseJson(const std::string& text) {
  json parsed = json::parse(text, nullptr, false);
  if (parsed.is_discarded()) {
    return std::nullopt;
  }
  return parsed;
}
}  // namespace sb

#endif  // __SB_JSON_LIB__
