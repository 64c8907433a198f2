#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "localmind_core/tools/tool.hpp"
#include "localmind_core/types/tool_call.hpp"

namespace localmind_core {

/**
 * @class ToolRegistry
 * @brief Name -> Tool map with validated, time-bounded invocation.
 *
 * Tools can be registered at any time. invoke() never throws: unknown names,
 * validation errors, tool exceptions and timeouts come back as a failed
 * ToolCallRecord so the caller can decide whether the turn survives.
 *
 * A call that times out has its cancellation token cancelled and keeps its
 * thread until the tool returns. wait_for_outstanding() joins those threads;
 * the destructor does the same.
 */
class ToolRegistry {
 public:
  explicit ToolRegistry(std::chrono::milliseconds timeout = std::chrono::seconds(30));
  ~ToolRegistry();

  // Throws InvalidArgumentError if a tool with the same name exists.
  void register_tool(std::shared_ptr<Tool> tool);

  std::shared_ptr<Tool> find(const std::string& name) const;
  bool contains(const std::string& name) const;
  std::vector<std::string> names() const;
  nlohmann::json describe_all() const;

  ToolCallRecord invoke(const ToolCallRequest& request, const ToolContext& context) const;

  std::chrono::milliseconds timeout() const { return timeout_; }

  // Timed-out calls whose tool has not returned yet.
  size_t outstanding_calls() const;
  void wait_for_outstanding();

 private:
  ToolResult run_with_timeout(std::shared_ptr<Tool> tool,
                              const nlohmann::json& arguments,
                              const ToolContext& context) const;
  void reap_finished_locked() const;

  struct InFlightCall {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> finished;
  };

  std::chrono::milliseconds timeout_;
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<Tool>> tools_;

  mutable std::mutex in_flight_mutex_;
  mutable std::vector<InFlightCall> in_flight_;
};

}  // namespace localmind_core
