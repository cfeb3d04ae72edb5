#ifndef PROOFAGG_RUNNER_HPP
#define PROOFAGG_RUNNER_HPP

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include <proofagg/common/types.h>
#include <proofagg/runner/task.hpp>

namespace pagg {
class Config;
}

namespace pagg::runner {
/** @brief Bounded pool of worker threads running blocking \ref Task objects
 * off the service's io_context.
 */
class Runner {
  public:
  explicit Runner(uint32_t threadCount);
  explicit Runner(const Config& config);
  ~Runner();

  void start();
  void stop();

  bool isRunning() const { return m_running; }
  uint32_t getThreadCount() const { return m_threadCount; }

  /** @brief Queue a task to be executed by the next free worker.
   *
   * The returned future always receives a result once the task was executed,
   * also if the task threw an exception.
   */
  std::future<TaskResultPtr> push(std::unique_ptr<Task> task);

  private:
  struct QueueEntry {
    explicit QueueEntry(std::unique_ptr<Task> task);
    ~QueueEntry();

    std::unique_ptr<Task> task;
    std::promise<TaskResultPtr> result;
  };

  void worker(pagg_worker workerId);

  uint32_t m_threadCount;
  std::atomic_bool m_running = false;

  std::mutex m_queueMutex;
  std::condition_variable m_newTasks;
  std::queue<std::unique_ptr<QueueEntry>> m_taskQueue;

  std::vector<std::thread> m_pool;
};
}

#endif
