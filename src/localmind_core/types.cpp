#include "localmind_core/types.hpp"

namespace localmind_core {

std::string to_string(FileType type) {
  switch (type) {
    case FileType::Text:
      return "Text";
    case FileType::Markdown:
      return "Markdown";
    default:
      return "Unknown";
  }
}

FileType file_type_from_string(const std::string& str) {
  if (str == "Text")
    return FileType::Text;
  if (str == "Markdown")
    return FileType::Markdown;
  return FileType::Unknown;
}

nlohmann::json to_json(const ToolCallRecord& record) {
  nlohmann::json json;
  json["name"] = record.name;
  json["arguments"] = record.arguments;
  json["required"] = record.required;
  json["success"] = record.success;
  json["result"] = record.result;
  json["summary"] = record.summary;
  if (!record.success) {
    json["error_kind"] = record.error_kind;
    json["error"] = record.error;
  }
  return json;
}

ToolCallRecord tool_call_record_from_json(const nlohmann::json& json) {
  ToolCallRecord record;
  record.name = json.value("name", std::string());
  record.arguments = json.value("arguments", nlohmann::json::object());
  record.required = json.value("required", false);
  record.success = json.value("success", false);
  if (json.contains("result")) {
    record.result = json.at("result");
  }
  record.summary = json.value("summary", std::string());
  record.error_kind = json.value("error_kind", std::string());
  record.error = json.value("error", std::string());
  return record;
}

}  // namespace localmind_core
