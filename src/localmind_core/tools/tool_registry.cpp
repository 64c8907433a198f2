#include "localmind_core/tools/tool_registry.hpp"

#include <atomic>
#include <future>
#include <iostream>
#include <thread>

#include "localmind_core/errors.hpp"

namespace localmind_core {

ToolRegistry::ToolRegistry(std::chrono::milliseconds timeout) : timeout_(timeout) {}

void ToolRegistry::register_tool(std::shared_ptr<Tool> tool) {
  if (!tool) {
    throw InvalidArgumentError("Cannot register a null tool");
  }
  const std::string name = tool->name();
  std::lock_guard<std::mutex> lock(mutex_);
  if (tools_.count(name) > 0) {
    throw InvalidArgumentError("Tool already registered: " + name);
  }
  tools_.emplace(name, std::move(tool));
}

std::shared_ptr<Tool> ToolRegistry::find(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tools_.find(name);
  return it == tools_.end() ? nullptr : it->second;
}

bool ToolRegistry::contains(const std::string& name) const {
  return find(name) != nullptr;
}

std::vector<std::string> ToolRegistry::names() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> out;
  for (const auto& [name, tool] : tools_) {
    out.push_back(name);
  }
  return out;
}

nlohmann::json ToolRegistry::describe_all() const {
  std::lock_guard<std::mutex> lock(mutex_);
  nlohmann::json out = nlohmann::json::array();
  for (const auto& [name, tool] : tools_) {
    out.push_back(tool->describe());
  }
  return out;
}

ToolRegistry::~ToolRegistry() {
  wait_for_outstanding();
}

ToolResult ToolRegistry::run_with_timeout(std::shared_ptr<Tool> tool,
                                          const nlohmann::json& arguments,
                                          const ToolContext& context) const {
  // Each call gets its own token so a timeout can stop this call alone.
  ToolContext call_context = context;
  call_context.cancellation = context.cancellation.child();

  if (timeout_.count() <= 0) {
    return tool->execute(arguments, call_context);
  }

  auto task = std::make_shared<std::packaged_task<ToolResult()>>(
      [tool, arguments, call_context]() { return tool->execute(arguments, call_context); });
  auto finished = std::make_shared<std::atomic<bool>>(false);
  std::future<ToolResult> future = task->get_future();
  std::thread worker([task, finished]() {
    (*task)();
    finished->store(true);
  });

  if (future.wait_for(timeout_) == std::future_status::timeout) {
    call_context.cancellation.cancel();
    {
      std::lock_guard<std::mutex> lock(in_flight_mutex_);
      reap_finished_locked();
      in_flight_.push_back({std::move(worker), std::move(finished)});
    }
    throw ToolTimeoutError("Tool " + tool->name() + " did not finish within " +
                           std::to_string(timeout_.count()) + " ms");
  }
  worker.join();
  return future.get();
}

void ToolRegistry::reap_finished_locked() const {
  auto it = in_flight_.begin();
  while (it != in_flight_.end()) {
    if (it->finished->load()) {
      it->thread.join();
      it = in_flight_.erase(it);
    } else {
      ++it;
    }
  }
}

size_t ToolRegistry::outstanding_calls() const {
  std::lock_guard<std::mutex> lock(in_flight_mutex_);
  reap_finished_locked();
  return in_flight_.size();
}

void ToolRegistry::wait_for_outstanding() {
  std::vector<InFlightCall> calls;
  {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    calls.swap(in_flight_);
  }
  if (calls.empty()) {
    return;
  }
  std::cout << "[ToolRegistry] Waiting for " << calls.size() << " timed-out tool call(s) to stop"
            << std::endl;
  for (auto& call : calls) {
    call.thread.join();
  }
}

ToolCallRecord ToolRegistry::invoke(const ToolCallRequest& request, const ToolContext& context) const {
  ToolCallRecord record;
  record.name = request.name;
  record.arguments = request.arguments;
  record.required = request.required;

  try {
    std::shared_ptr<Tool> tool = find(request.name);
    if (!tool) {
      throw UnknownToolError(request.name);
    }
    context.cancellation.throw_if_cancelled("tool " + request.name);
    const nlohmann::json arguments = tool->validate_arguments(request.arguments);
    record.arguments = arguments;

    ToolResult result = run_with_timeout(tool, arguments, context);
    record.success = result.success;
    record.result = std::move(result.data);
    record.summary = std::move(result.summary);
    if (!result.success) {
      record.error_kind = to_string(ErrorKind::ToolFailure);
      record.error = std::move(result.error);
    }
  } catch (const LocalMindError& e) {
    record.success = false;
    record.error_kind = to_string(e.kind());
    record.error = e.what();
  } catch (const std::exception& e) {
    record.success = false;
    record.error_kind = to_string(ErrorKind::ToolFailure);
    record.error = e.what();
  }

  if (!record.success) {
    std::cerr << "[ToolRegistry] " << request.name << " failed (" << record.error_kind
              << "): " << record.error << std::endl;
  }
  return record;
}

}  // namespace localmind_core
