#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "localmind_core/rag/cancellation.hpp"

namespace localmind_core {

enum class ParameterType { String, Integer, Boolean, StringList };

std::string to_string(ParameterType type);

struct ToolParameter {
  std::string name;
  ParameterType type = ParameterType::String;
  std::string description;
  bool required = false;
  // Null when the parameter has no default.
  nlohmann::json default_value;
};

struct ToolResult {
  bool success = true;
  nlohmann::json data;
  // One-line human readable outcome, stored with the turn.
  std::string summary;
  std::string error;

  static ToolResult ok(nlohmann::json data, std::string summary) {
    return {true, std::move(data), std::move(summary), ""};
  }
  static ToolResult failure(std::string error) {
    return {false, nullptr, "", std::move(error)};
  }
};

struct ToolContext {
  std::string conversation_id;
  CancellationToken cancellation;
};

/**
 * @class Tool
 * @brief A named callable with declared, typed parameters.
 *
 * The registry validates arguments against parameters() before execute()
 * runs, so implementations can read arguments without type checks.
 */
class Tool {
 public:
  virtual ~Tool() = default;

  virtual std::string name() const = 0;
  virtual std::string description() const = 0;
  virtual std::vector<ToolParameter> parameters() const = 0;

  virtual ToolResult execute(const nlohmann::json& arguments, const ToolContext& context) = 0;

  // Returns the arguments with defaults filled in. Throws
  // InvalidArgumentError for unknown, missing or mistyped arguments. A single
  // string is accepted where a string list is declared.
  nlohmann::json validate_arguments(const nlohmann::json& arguments) const;

  // {"name", "description", "parameters": [...]}
  nlohmann::json describe() const;
};

}  // namespace localmind_core
