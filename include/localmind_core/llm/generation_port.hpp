#pragma once

#include <optional>
#include <string>

#include "localmind_core/types/tool_call.hpp"

namespace localmind_core {

struct GenerationConstraints {
  int max_tokens = 512;
  float temperature = 0.1f;
  float top_p = 0.9f;
  std::string system_prompt;
  // Rendered style profile, empty outside style-mimicking mode.
  std::string style_guide;
};

struct GenerationResult {
  std::string text;
  // Set when the model asked for a tool instead of answering.
  std::optional<ToolCallRequest> tool_call;
};

// Prompt + constraints -> text. Implementations throw
// GenerationUnavailableError when the backend fails or times out.
class GenerationPort {
 public:
  virtual ~GenerationPort() = default;

  virtual GenerationResult generate(const std::string& prompt, const GenerationConstraints& constraints) = 0;
};

}  // namespace localmind_core
