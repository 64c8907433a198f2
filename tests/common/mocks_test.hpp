#pragma once

#include <gmock/gmock.h>

#include <string>
#include <vector>

#include "localmind_core/db/conversation_store.hpp"
#include "localmind_core/llm/embedding_port.hpp"
#include "localmind_core/llm/generation_port.hpp"
#include "localmind_core/tools/tool.hpp"
#include "localmind_core/types/chunk.hpp"

namespace localmind_tests {

/**
 * Mock embedder. By default every text maps to the same unit-ish vector.
 */
class MockEmbeddingPort : public localmind_core::EmbeddingPort {
 public:
  explicit MockEmbeddingPort(size_t dimension = 64) {
    std::vector<float> default_embedding(dimension, 0.1f);
    default_embedding[0] = 0.5f;
    ON_CALL(*this, get_embedding(testing::_)).WillByDefault(testing::Return(default_embedding));
    ON_CALL(*this, get_embeddings(testing::_))
        .WillByDefault([default_embedding](const std::vector<std::string>& texts) {
          return std::vector<std::vector<float>>(texts.size(), default_embedding);
        });
  }

  MOCK_METHOD(std::vector<float>, get_embedding, (const std::string& text), (override));
  MOCK_METHOD(std::vector<std::vector<float>>, get_embeddings, (const std::vector<std::string>& texts),
              (override));
};

class MockGenerationPort : public localmind_core::GenerationPort {
 public:
  MOCK_METHOD(localmind_core::GenerationResult,
              generate,
              (const std::string& prompt, const localmind_core::GenerationConstraints& constraints),
              (override));
};

class MockConversationStore : public localmind_core::ConversationStore {
 public:
  MOCK_METHOD(long long, append_turn, (const localmind_core::ConversationTurn& turn), (override));
  MOCK_METHOD(std::vector<localmind_core::ConversationTurn>,
              get_recent,
              (const std::string& conversation_id, size_t n),
              (override));
};

/**
 * Mock tool with a fixed name and a single optional string parameter.
 */
class MockTool : public localmind_core::Tool {
 public:
  explicit MockTool(std::string tool_name = "mock_tool") : tool_name_(std::move(tool_name)) {}

  std::string name() const override { return tool_name_; }
  std::string description() const override { return "Test tool"; }
  std::vector<localmind_core::ToolParameter> parameters() const override {
    return {{"text", localmind_core::ParameterType::String, "Input text", false, nullptr}};
  }

  MOCK_METHOD(localmind_core::ToolResult,
              execute,
              (const nlohmann::json& arguments, const localmind_core::ToolContext& context),
              (override));

 private:
  std::string tool_name_;
};

/**
 * Utility functions for creating test data in tests
 */
namespace MockUtilities {

inline localmind_core::GenerationResult answer(const std::string& text) {
  return {text, std::nullopt};
}

inline localmind_core::GenerationResult tool_request(const std::string& tool_name,
                                                     nlohmann::json arguments = nlohmann::json::object()) {
  localmind_core::ToolCallRequest request;
  request.name = tool_name;
  request.arguments = std::move(arguments);
  return {"@" + tool_name + "()", request};
}

}  // namespace MockUtilities

}  // namespace localmind_tests
