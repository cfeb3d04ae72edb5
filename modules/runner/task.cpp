#include <proofagg/runner/task.hpp>
#include <proofagg/runner/task_result.hpp>

namespace pagg::runner {
Task::Task(std::string name)
  : m_name(std::move(name)) {}
Task::~Task() {}

void
Task::finish(const TaskResult& result) {
  m_finishedSignal(result);
}

TaskResult::TaskResult(pagg_status status, std::string error)
  : m_status(status)
  , m_error(std::move(error)) {}
TaskResult::~TaskResult() {}

void
TaskResult::setTask(std::unique_ptr<Task> task) {
  m_task = std::move(task);
}
}
