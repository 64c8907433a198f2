#include "localmind_core/tools/tool.hpp"

#include <algorithm>

#include "localmind_core/errors.hpp"

namespace localmind_core {

std::string to_string(ParameterType type) {
  switch (type) {
    case ParameterType::String: return "string";
    case ParameterType::Integer: return "integer";
    case ParameterType::Boolean: return "boolean";
    case ParameterType::StringList: return "string_list";
  }
  return "string";
}

nlohmann::json Tool::validate_arguments(const nlohmann::json& arguments) const {
  if (!arguments.is_null() && !arguments.is_object()) {
    throw InvalidArgumentError("Arguments for " + name() + " must be an object");
  }
  const nlohmann::json given = arguments.is_null() ? nlohmann::json::object() : arguments;
  const std::vector<ToolParameter> declared = parameters();

  for (const auto& [key, value] : given.items()) {
    bool known = false;
    for (const auto& param : declared) {
      known = known || param.name == key;
    }
    if (!known) {
      throw InvalidArgumentError("Unknown argument '" + key + "' for tool " + name());
    }
  }

  nlohmann::json validated = nlohmann::json::object();
  for (const auto& param : declared) {
    if (!given.contains(param.name) || given[param.name].is_null()) {
      if (param.required) {
        throw InvalidArgumentError("Missing required argument '" + param.name + "' for tool " + name());
      }
      if (!param.default_value.is_null()) {
        validated[param.name] = param.default_value;
      }
      continue;
    }

    const nlohmann::json& value = given[param.name];
    bool valid = false;
    switch (param.type) {
      case ParameterType::String:
        valid = value.is_string();
        break;
      case ParameterType::Integer:
        valid = value.is_number_integer();
        break;
      case ParameterType::Boolean:
        valid = value.is_boolean();
        break;
      case ParameterType::StringList:
        if (value.is_string()) {
          validated[param.name] = nlohmann::json::array({value});
          continue;
        }
        valid = value.is_array() &&
                std::all_of(value.begin(), value.end(), [](const nlohmann::json& v) { return v.is_string(); });
        break;
    }
    if (!valid) {
      throw InvalidArgumentError("Argument '" + param.name + "' for tool " + name() + " must be " +
                                 to_string(param.type) + ", got " + value.type_name());
    }
    validated[param.name] = value;
  }
  return validated;
}

nlohmann::json Tool::describe() const {
  nlohmann::json params = nlohmann::json::array();
  for (const auto& param : parameters()) {
    nlohmann::json entry = {{"name", param.name},
                            {"type", to_string(param.type)},
                            {"description", param.description},
                            {"required", param.required}};
    if (!param.default_value.is_null()) {
      entry["default"] = param.default_value;
    }
    params.push_back(entry);
  }
  return {{"name", name()}, {"description", description()}, {"parameters", params}};
}

}  // namespace localmind_core
