#ifndef PROOFAGG_TASK_HPP
#define PROOFAGG_TASK_HPP

#include <cstdint>
#include <string>

#include <boost/signals2/signal.hpp>

#include <proofagg/common/types.h>
#include <proofagg/runner/task_result.hpp>

namespace pagg::runner {
class Runner;

/** @brief Unit of blocking work executed on a worker thread of a \ref Runner.
 *
 * This must be sub-classed by actual tasks to be run.
 */
class Task {
  public:
  using FinishedSignal = boost::signals2::signal<void(const TaskResult&)>;

  /** @brief Constructor */
  explicit Task(std::string name = "Task");
  /** @brief Destructor */
  virtual ~Task();

  /** @brief Execute this task.
   *
   * Must be implemented by actual tasks. Exceptions escaping from here are
   * turned into a failed result by the runner.
   * */
  virtual TaskResultPtr execute() = 0;

  const std::string& name() const { return m_name; };

  /** @brief Returns the signal marking finished task.
   *
   * Slots are called on the worker thread. A given slot must not directly save
   * the given reference, as it is only a temporary reference to a result
   * handled by a unique_ptr in \ref Runner.
   */
  inline FinishedSignal& getFinishedSignal() { return m_finishedSignal; }

  protected:
  friend class Runner;

  std::string m_name;

  FinishedSignal m_finishedSignal;
  void finish(const TaskResult& result);
};
}

#endif
