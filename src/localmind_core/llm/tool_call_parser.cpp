#include "localmind_core/llm/tool_call_parser.hpp"

#include <cctype>

#include "localmind_core/errors.hpp"

namespace localmind_core {

namespace {

bool is_ident_start(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string trim(const std::string& s) {
  size_t begin = 0;
  while (begin < s.size() && std::isspace(static_cast<unsigned char>(s[begin]))) {
    ++begin;
  }
  size_t end = s.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
    --end;
  }
  return s.substr(begin, end - begin);
}

// Position of the ')' closing the '(' at open, or npos.
size_t find_closing(const std::string& text, size_t open) {
  int depth = 0;
  char quote = 0;
  for (size_t i = open; i < text.size(); ++i) {
    const char c = text[i];
    if (quote) {
      if (c == '\\') {
        ++i;
      } else if (c == quote) {
        quote = 0;
      }
      continue;
    }
    if (c == '"' || c == '\'') {
      quote = c;
    } else if (c == '(' || c == '[' || c == '{') {
      ++depth;
    } else if (c == ')' || c == ']' || c == '}') {
      if (--depth == 0) {
        return c == ')' ? i : std::string::npos;
      }
    }
  }
  return std::string::npos;
}

// Splits on commas outside quotes and brackets.
std::vector<std::string> split_top_level(const std::string& text) {
  std::vector<std::string> parts;
  std::string current;
  int depth = 0;
  char quote = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (quote) {
      current.push_back(c);
      if (c == '\\' && i + 1 < text.size()) {
        current.push_back(text[++i]);
      } else if (c == quote) {
        quote = 0;
      }
      continue;
    }
    if (c == '"' || c == '\'') {
      quote = c;
    } else if (c == '[' || c == '{' || c == '(') {
      ++depth;
    } else if (c == ']' || c == '}' || c == ')') {
      --depth;
    } else if (c == ',' && depth == 0) {
      parts.push_back(current);
      current.clear();
      continue;
    }
    current.push_back(c);
  }
  if (quote || depth != 0) {
    throw InvalidArgumentError("Unbalanced quotes or brackets in tool arguments: " + text);
  }
  if (!trim(current).empty() || !parts.empty()) {
    parts.push_back(current);
  }
  return parts;
}

nlohmann::json parse_scalar(const std::string& raw) {
  const std::string value = trim(raw);
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    std::string out;
    for (size_t i = 1; i + 1 < value.size(); ++i) {
      if (value[i] == '\\' && i + 2 < value.size()) {
        ++i;
      }
      out.push_back(value[i]);
    }
    return out;
  }
  if (value == "true") {
    return true;
  }
  if (value == "false") {
    return false;
  }

  bool numeric = !value.empty() && value.size() < 19;
  for (size_t i = 0; i < value.size() && numeric; ++i) {
    const bool sign = i == 0 && value[i] == '-' && value.size() > 1;
    numeric = sign || std::isdigit(static_cast<unsigned char>(value[i]));
  }
  if (numeric) {
    return std::stoll(value);
  }
  return value;
}

nlohmann::json parse_value(const std::string& raw) {
  const std::string value = trim(raw);
  if (value.size() >= 2 && value.front() == '[' && value.back() == ']') {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& item : split_top_level(value.substr(1, value.size() - 2))) {
      if (trim(item).empty()) {
        throw InvalidArgumentError("Empty list element in tool arguments: " + value);
      }
      list.push_back(parse_scalar(item));
    }
    return list;
  }
  return parse_scalar(value);
}

}  // namespace

nlohmann::json ToolCallParser::parse_arguments(const std::string& args) {
  const std::string text = trim(args);
  if (text.empty()) {
    return nlohmann::json::object();
  }

  if (text.front() == '{') {
    nlohmann::json parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
      throw InvalidArgumentError("Tool arguments are not a JSON object: " + text);
    }
    return parsed;
  }

  nlohmann::json arguments = nlohmann::json::object();
  for (const auto& part : split_top_level(text)) {
    const size_t eq = part.find_first_of("=:");
    if (eq == std::string::npos) {
      throw InvalidArgumentError("Expected key=value in tool arguments, got: " + trim(part));
    }
    const std::string key = trim(part.substr(0, eq));
    if (key.empty() || !is_ident_start(key.front())) {
      throw InvalidArgumentError("Invalid argument name in tool arguments: " + key);
    }
    for (char c : key) {
      if (!is_ident_char(c)) {
        throw InvalidArgumentError("Invalid argument name in tool arguments: " + key);
      }
    }
    if (arguments.contains(key)) {
      throw InvalidArgumentError("Duplicate argument: " + key);
    }
    arguments[key] = parse_value(part.substr(eq + 1));
  }
  return arguments;
}

std::vector<ToolCallParser::Match> ToolCallParser::find_calls(const std::string& text) {
  std::vector<Match> matches;
  size_t pos = 0;
  while ((pos = text.find('@', pos)) != std::string::npos) {
    const size_t at = pos++;
    if (at > 0 && is_ident_char(text[at - 1])) {
      continue;
    }
    if (pos >= text.size() || !is_ident_start(text[pos])) {
      continue;
    }
    size_t name_end = pos;
    while (name_end < text.size() && is_ident_char(text[name_end])) {
      ++name_end;
    }
    if (name_end >= text.size() || text[name_end] != '(') {
      continue;
    }
    const size_t close = find_closing(text, name_end);
    if (close == std::string::npos) {
      continue;
    }

    Match match;
    match.begin = at;
    match.end = close + 1;
    match.request.name = text.substr(pos, name_end - pos);
    // Raw argument text; parsed by the caller.
    match.request.arguments = text.substr(name_end + 1, close - name_end - 1);
    matches.push_back(std::move(match));
    pos = close + 1;
  }
  return matches;
}

std::vector<ToolCallRequest> ToolCallParser::parse_inline_calls(const std::string& text) {
  std::vector<ToolCallRequest> requests;
  for (auto& match : find_calls(text)) {
    match.request.arguments = parse_arguments(match.request.arguments.get<std::string>());
    requests.push_back(std::move(match.request));
  }
  return requests;
}

std::string ToolCallParser::strip_inline_calls(const std::string& text) {
  std::string out;
  size_t last = 0;
  for (const auto& match : find_calls(text)) {
    out += text.substr(last, match.begin - last);
    last = match.end;
  }
  out += text.substr(last);
  return trim(out);
}

std::optional<ToolCallRequest> ToolCallParser::parse_model_reply(const std::string& reply) {
  const std::string text = trim(reply);
  if (text.empty()) {
    return std::nullopt;
  }

  if (text.front() == '{') {
    nlohmann::json parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
      return std::nullopt;
    }
    const nlohmann::json& call = parsed.contains("tool_call") ? parsed["tool_call"] : parsed;
    if (!call.is_object()) {
      return std::nullopt;
    }
    const std::string name_key = call.contains("tool") ? "tool" : "name";
    if (!call.contains(name_key) || !call[name_key].is_string()) {
      return std::nullopt;
    }
    ToolCallRequest request;
    request.name = call[name_key].get<std::string>();
    if (call.contains("arguments")) {
      if (!call["arguments"].is_object()) {
        return std::nullopt;
      }
      request.arguments = call["arguments"];
    }
    return request;
  }

  const auto matches = find_calls(text);
  if (matches.size() != 1 || matches[0].begin != 0 || matches[0].end != text.size()) {
    return std::nullopt;
  }
  ToolCallRequest request = matches[0].request;
  try {
    request.arguments = parse_arguments(request.arguments.get<std::string>());
  } catch (const InvalidArgumentError&) {
    // A malformed call in a reply is treated as plain answer text.
    return std::nullopt;
  }
  return request;
}

}  // namespace localmind_core
