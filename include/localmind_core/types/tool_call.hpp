#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace localmind_core {

struct ToolCallRequest {
  std::string name;
  nlohmann::json arguments = nlohmann::json::object();
  // A required call that fails fails the whole turn.
  bool required = false;
};

struct ToolCallRecord {
  std::string name;
  nlohmann::json arguments = nlohmann::json::object();
  bool required = false;
  bool success = false;
  nlohmann::json result;
  std::string summary;
  std::string error_kind;
  std::string error;
};

nlohmann::json to_json(const ToolCallRecord& record);
ToolCallRecord tool_call_record_from_json(const nlohmann::json& json);

}  // namespace localmind_core
