#pragma once

#include "localmind_core/async/ITask.hpp"

namespace localmind_core {
class TaskFactory {
 public:
  // Throws std::runtime_error for an unknown task type or a missing target.
  static ITaskPtr create_task(const TaskDTO& record);
};
}  // namespace localmind_core
