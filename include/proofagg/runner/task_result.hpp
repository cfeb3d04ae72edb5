#ifndef PROOFAGG_TASKRESULT_HPP
#define PROOFAGG_TASKRESULT_HPP

#include <memory>
#include <string>

#include <proofagg/common/status.h>

namespace pagg::runner {
class Task;

/** @brief This class holds the result of a task.
 *
 * The original task is also contained, in case some of its state is needed
 * by whoever waits for the result.
 */
class TaskResult {
  public:
  /** @brief Create a task result with an assigned status. */
  explicit TaskResult(pagg_status status, std::string error = "");
  /** @brief Destructor */
  ~TaskResult();

  /** @brief Get the status of this task. */
  pagg_status getStatus() const { return m_status; }
  /** @brief Error text of a failed task. Empty on success. */
  const std::string& getError() const { return m_error; }

  bool hasTask() const { return m_task != nullptr; }

  /** @brief Return the task that produced this result.
   *
   * The task is deleted with this task result, because the result owns the
   * task after it has finished. */
  Task& getTask() const { return *m_task; }

  /** @brief Return the internal unique pointer to the task that produced this
   * result.
   *
   * Once this has been moved again, no other call can use the internal task!
   */
  std::unique_ptr<Task>& getTaskPtr() { return m_task; }

  private:
  friend class Runner;

  pagg_status m_status;
  std::string m_error;
  std::unique_ptr<Task> m_task;

  void setTask(std::unique_ptr<Task> task);
};

using TaskResultPtr = std::unique_ptr<TaskResult>;
}

#endif
