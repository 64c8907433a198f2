#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

#include "localmind_core/errors.hpp"
#include "localmind_core/tools/builtin_tools.hpp"
#include "localmind_core/tools/tool_registry.hpp"
#include "../../common/mocks_test.hpp"

namespace localmind_core {

using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

namespace {

// Sleeps longer than any sane registry timeout.
class SlowTool : public Tool {
 public:
  explicit SlowTool(std::chrono::milliseconds delay) : delay_(delay) {}

  std::string name() const override { return "slow_tool"; }
  std::string description() const override { return "Sleeps"; }
  std::vector<ToolParameter> parameters() const override { return {}; }

  ToolResult execute(const nlohmann::json&, const ToolContext&) override {
    std::this_thread::sleep_for(delay_);
    return ToolResult::ok(nullptr, "done");
  }

 private:
  std::chrono::milliseconds delay_;
};

// Sleeps, then records a write unless its call was cancelled meanwhile.
class SlowWriterTool : public Tool {
 public:
  SlowWriterTool(std::chrono::milliseconds delay, std::shared_ptr<std::atomic<int>> writes)
      : delay_(delay), writes_(std::move(writes)) {}

  std::string name() const override { return "slow_writer"; }
  std::string description() const override { return "Writes after a delay"; }
  std::vector<ToolParameter> parameters() const override { return {}; }

  ToolResult execute(const nlohmann::json&, const ToolContext& context) override {
    std::this_thread::sleep_for(delay_);
    context.cancellation.throw_if_cancelled("slow_writer");
    writes_->fetch_add(1);
    return ToolResult::ok(nullptr, "written");
  }

 private:
  std::chrono::milliseconds delay_;
  std::shared_ptr<std::atomic<int>> writes_;
};

}  // namespace

class ToolRegistryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    mock_tool_ = std::make_shared<localmind_tests::MockTool>("echo");
    registry_.register_tool(mock_tool_);
  }

  ToolCallRecord invoke(nlohmann::json arguments, ToolContext context = {}) {
    ToolCallRequest request;
    request.name = "echo";
    request.arguments = std::move(arguments);
    return registry_.invoke(request, context);
  }

  ToolRegistry registry_{std::chrono::milliseconds(2000)};
  std::shared_ptr<localmind_tests::MockTool> mock_tool_;
};

TEST_F(ToolRegistryTest, Invoke_ReturnsToolResult) {
  EXPECT_CALL(*mock_tool_, execute(nlohmann::json({{"text", "hi"}}), _))
      .WillOnce(Return(ToolResult::ok({{"echo", "hi"}}, "echoed")));

  auto record = invoke({{"text", "hi"}});

  EXPECT_TRUE(record.success);
  EXPECT_EQ(record.name, "echo");
  EXPECT_EQ(record.result["echo"], "hi");
  EXPECT_EQ(record.summary, "echoed");
  EXPECT_TRUE(record.error_kind.empty());
}

TEST_F(ToolRegistryTest, Invoke_UnknownToolBecomesFailedRecord) {
  ToolCallRequest request;
  request.name = "does_not_exist";
  request.required = true;

  ToolCallRecord record;
  ASSERT_NO_THROW(record = registry_.invoke(request, {}));

  EXPECT_FALSE(record.success);
  EXPECT_TRUE(record.required);
  EXPECT_EQ(record.name, "does_not_exist");
  EXPECT_EQ(record.error_kind, "UnknownTool");
  EXPECT_EQ(record.error, "Unknown tool: does_not_exist");
}

TEST_F(ToolRegistryTest, Invoke_InvalidArgumentsNeverReachTheTool) {
  EXPECT_CALL(*mock_tool_, execute(_, _)).Times(0);

  auto mistyped = invoke({{"text", 5}});
  EXPECT_FALSE(mistyped.success);
  EXPECT_EQ(mistyped.error_kind, "InvalidArgument");

  auto unknown = invoke({{"other", "x"}});
  EXPECT_FALSE(unknown.success);
  EXPECT_EQ(unknown.error_kind, "InvalidArgument");
}

TEST_F(ToolRegistryTest, Invoke_ToolFailuresBecomeRecords) {
  EXPECT_CALL(*mock_tool_, execute(_, _))
      .WillOnce(Return(ToolResult::failure("nothing to echo")))
      .WillOnce(Throw(std::runtime_error("boom")));

  auto failed = invoke(nlohmann::json::object());
  EXPECT_FALSE(failed.success);
  EXPECT_EQ(failed.error_kind, "ToolFailure");
  EXPECT_EQ(failed.error, "nothing to echo");

  auto thrown = invoke(nlohmann::json::object());
  EXPECT_FALSE(thrown.success);
  EXPECT_EQ(thrown.error_kind, "ToolFailure");
  EXPECT_EQ(thrown.error, "boom");
}

TEST_F(ToolRegistryTest, Invoke_CancelledContextSkipsExecution) {
  EXPECT_CALL(*mock_tool_, execute(_, _)).Times(0);
  ToolContext context;
  context.cancellation.cancel();

  auto record = invoke(nlohmann::json::object(), context);

  EXPECT_FALSE(record.success);
  EXPECT_EQ(record.error_kind, "Cancelled");
}

TEST_F(ToolRegistryTest, Invoke_SlowToolTimesOut) {
  ToolRegistry registry(std::chrono::milliseconds(20));
  registry.register_tool(std::make_shared<SlowTool>(std::chrono::milliseconds(300)));

  ToolCallRequest request;
  request.name = "slow_tool";
  const auto start = std::chrono::steady_clock::now();
  auto record = registry.invoke(request, {});
  const auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_FALSE(record.success);
  EXPECT_EQ(record.error_kind, "ToolTimeout");
  EXPECT_LT(elapsed, std::chrono::milliseconds(250));
}

TEST_F(ToolRegistryTest, Invoke_TimedOutCallIsCancelledBeforeItWrites) {
  auto writes = std::make_shared<std::atomic<int>>(0);
  ToolRegistry registry(std::chrono::milliseconds(20));
  registry.register_tool(std::make_shared<SlowWriterTool>(std::chrono::milliseconds(150), writes));

  ToolCallRequest request;
  request.name = "slow_writer";
  ToolContext context;
  auto record = registry.invoke(request, context);

  EXPECT_FALSE(record.success);
  EXPECT_EQ(record.error_kind, "ToolTimeout");
  EXPECT_FALSE(context.cancellation.is_cancelled());
  EXPECT_EQ(registry.outstanding_calls(), 1u);

  registry.wait_for_outstanding();
  EXPECT_EQ(registry.outstanding_calls(), 0u);
  EXPECT_EQ(writes->load(), 0);
}

TEST_F(ToolRegistryTest, Invoke_CallWithinTimeoutWrites) {
  auto writes = std::make_shared<std::atomic<int>>(0);
  ToolRegistry registry(std::chrono::milliseconds(2000));
  registry.register_tool(std::make_shared<SlowWriterTool>(std::chrono::milliseconds(1), writes));

  ToolCallRequest request;
  request.name = "slow_writer";
  auto record = registry.invoke(request, {});

  EXPECT_TRUE(record.success) << record.error;
  EXPECT_EQ(writes->load(), 1);
  EXPECT_EQ(registry.outstanding_calls(), 0u);
}

TEST(CancellationTokenTest, ChildFollowsParentButNotTheReverse) {
  CancellationToken parent;
  CancellationToken child = parent.child();
  CancellationToken sibling = parent.child();

  child.cancel();
  EXPECT_TRUE(child.is_cancelled());
  EXPECT_FALSE(parent.is_cancelled());
  EXPECT_FALSE(sibling.is_cancelled());

  parent.cancel();
  EXPECT_TRUE(sibling.is_cancelled());
  EXPECT_THROW(sibling.throw_if_cancelled("test"), CancelledError);
}

TEST_F(ToolRegistryTest, RegisterTool_RejectsDuplicatesAndNull) {
  EXPECT_THROW(registry_.register_tool(std::make_shared<localmind_tests::MockTool>("echo")),
               InvalidArgumentError);
  EXPECT_THROW(registry_.register_tool(nullptr), InvalidArgumentError);

  registry_.register_tool(std::make_shared<localmind_tests::MockTool>("another"));
  EXPECT_EQ(registry_.names(), (std::vector<std::string>{"another", "echo"}));
  EXPECT_TRUE(registry_.contains("another"));
  EXPECT_EQ(registry_.describe_all().size(), 2u);
}

TEST(ToolValidationTest, FillsDefaultsAndWrapsSingleString) {
  SearchDocumentsTool tool(nullptr);

  auto args = tool.validate_arguments({{"query", "solar"}, {"categories", "기술"}});

  EXPECT_EQ(args["query"], "solar");
  EXPECT_EQ(args["k"], 5);
  EXPECT_EQ(args["categories"], nlohmann::json::array({"기술"}));
}

TEST(ToolValidationTest, RejectsMissingAndMistypedArguments) {
  SearchDocumentsTool tool(nullptr);

  EXPECT_THROW(tool.validate_arguments(nlohmann::json::object()), InvalidArgumentError);
  EXPECT_THROW(tool.validate_arguments({{"query", "x"}, {"k", "5"}}), InvalidArgumentError);
  EXPECT_THROW(tool.validate_arguments({{"query", "x"}, {"categories", {1, 2}}}), InvalidArgumentError);
  EXPECT_THROW(tool.validate_arguments(nlohmann::json::array()), InvalidArgumentError);
}

TEST(ToolValidationTest, DescribeListsParameters) {
  SearchDocumentsTool tool(nullptr);
  auto description = tool.describe();

  EXPECT_EQ(description["name"], "search_documents");
  ASSERT_EQ(description["parameters"].size(), 3u);
  EXPECT_EQ(description["parameters"][0]["name"], "query");
  EXPECT_EQ(description["parameters"][0]["required"], true);
  EXPECT_EQ(description["parameters"][1]["type"], "integer");
  EXPECT_EQ(description["parameters"][1]["default"], 5);
  EXPECT_FALSE(description["parameters"][2].contains("default"));
}

}  // namespace localmind_core
