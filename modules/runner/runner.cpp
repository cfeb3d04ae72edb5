#include <proofagg/common/config.hpp>
#include <proofagg/common/log.h>
#include <proofagg/runner/runner.hpp>

#include <algorithm>
#include <string>
#include <system_error>

namespace pagg::runner {
Runner::Runner(uint32_t threadCount)
  : m_threadCount(threadCount == 0 ? 1 : threadCount) {}
Runner::Runner(const Config& config)
  : Runner(config.getUint32(Config::ThreadCount)) {}
Runner::~Runner() {
  stop();
  pagg_log(PAGG_RUNNER, PAGG_TRACE, "Destruct Runner.");
}

void
Runner::start() {
  if(m_running)
    return;

  pagg_log(PAGG_RUNNER,
           PAGG_DEBUG,
           "Starting Runner with {} worker threads.",
           m_threadCount);

  uint32_t i = 0;
  try {
    m_running = true;
    for(i = 0; i < m_threadCount; ++i) {
      m_pool.emplace_back(&Runner::worker, this, i);
    }
  } catch(const std::system_error& e) {
    pagg_log(PAGG_RUNNER,
             PAGG_LOCALERROR,
             "Could only initialize {} of {} requested threads! Error: {}",
             i,
             m_threadCount,
             e.what());
  }
}

void
Runner::stop() {
  pagg_log(PAGG_RUNNER, PAGG_TRACE, "Stopping Runner");

  {
    std::unique_lock lock(m_queueMutex);
    m_running = false;
  }
  m_newTasks.notify_all();
  std::for_each(m_pool.begin(), m_pool.end(), [](auto& t) { t.join(); });
  m_pool.clear();

  std::unique_lock lock(m_queueMutex);
  if(!m_taskQueue.empty()) {
    pagg_log(PAGG_RUNNER,
             PAGG_DEBUG,
             "Dropping {} queued tasks that were never started.",
             m_taskQueue.size());
  }
  while(!m_taskQueue.empty()) {
    m_taskQueue.front()->result.set_value(
      std::make_unique<TaskResult>(PAGG_ABORTED, "runner stopped"));
    m_taskQueue.pop();
  }
}

std::future<TaskResultPtr>
Runner::push(std::unique_ptr<Task> task) {
  auto entry = std::make_unique<QueueEntry>(std::move(task));
  auto future = entry->result.get_future();
  {
    std::unique_lock lock(m_queueMutex);
    m_taskQueue.push(std::move(entry));
  }
  m_newTasks.notify_one();
  return future;
}

void
Runner::worker(pagg_worker workerId) {
  std::string threadName = "Worker " + std::to_string(workerId);
  pagg_log_set_thread_name(threadName.c_str());
  pagg_log(PAGG_RUNNER, PAGG_TRACE, "Worker {} started.", workerId);

  while(true) {
    std::unique_ptr<QueueEntry> entry;
    {
      std::unique_lock lock(m_queueMutex);
      m_newTasks.wait(lock,
                      [this] { return !m_running || !m_taskQueue.empty(); });
      if(!m_running)
        break;
      entry = std::move(m_taskQueue.front());
      m_taskQueue.pop();
    }

    if(!entry->task) {
      pagg_log(PAGG_RUNNER,
               PAGG_LOCALERROR,
               "Worker {} received a task queue item without a valid task!",
               workerId);
      entry->result.set_value(
        std::make_unique<TaskResult>(PAGG_WORKER_ERROR, "no task"));
      continue;
    }

    pagg_log(PAGG_RUNNER,
             PAGG_TRACE,
             "Worker {} has received a new task: {}",
             workerId,
             entry->task->name());

    TaskResultPtr result;
    try {
      result = entry->task->execute();
    } catch(const std::exception& e) {
      pagg_log(PAGG_RUNNER,
               PAGG_LOCALERROR,
               "Exception encountered during execution of task {}! "
               "Exception: {}",
               entry->task->name(),
               e.what());
      result = std::make_unique<TaskResult>(PAGG_WORKER_ERROR, e.what());
    }
    if(!result) {
      result = std::make_unique<TaskResult>(PAGG_WORKER_ERROR,
                                            "task returned no result");
    }

    result->setTask(std::move(entry->task));
    try {
      result->getTask().finish(*result);
    } catch(const std::exception& e) {
      pagg_log(PAGG_RUNNER,
               PAGG_LOCALERROR,
               "Exception in finished handler of task {}! Exception: {}",
               result->getTask().name(),
               e.what());
    }
    entry->result.set_value(std::move(result));
  }
  pagg_log(PAGG_RUNNER, PAGG_TRACE, "Worker {} ended.", workerId);
}

Runner::QueueEntry::QueueEntry(std::unique_ptr<Task> task)
  : task(std::move(task)) {}
Runner::QueueEntry::~QueueEntry() {}
}
