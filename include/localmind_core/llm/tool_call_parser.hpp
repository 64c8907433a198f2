#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "localmind_core/types/tool_call.hpp"

namespace localmind_core {

/**
 * Parsing of tool-call syntax in user queries and model replies.
 *
 * Inline form: @name(key=value, key2="quoted, value", tags=[a, b]) or
 * @name({"key": "value"}). Unquoted integers become numbers and true/false
 * become booleans; everything else is a string.
 *
 * Model replies may also carry a JSON object {"tool": name, "arguments": {}}.
 */
class ToolCallParser {
 public:
  // Every inline call in the text, in order of appearance.
  static std::vector<ToolCallRequest> parse_inline_calls(const std::string& text);

  // The text with inline calls removed and surrounding whitespace trimmed.
  static std::string strip_inline_calls(const std::string& text);

  // A reply is a tool call only when the whole trimmed reply is one call.
  static std::optional<ToolCallRequest> parse_model_reply(const std::string& reply);

  // Throws InvalidArgumentError for malformed argument lists.
  static nlohmann::json parse_arguments(const std::string& args);

 private:
  struct Match {
    size_t begin = 0;
    size_t end = 0;
    ToolCallRequest request;
  };

  static std::vector<Match> find_calls(const std::string& text);
};

}  // namespace localmind_core
