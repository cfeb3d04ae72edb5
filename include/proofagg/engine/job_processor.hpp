#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include <boost/asio/coroutine.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/signals2/signal.hpp>

#include <fmt/format.h>

#include <proofagg/blob/object_store.hpp>
#include <proofagg/common/circuit_key.hpp>
#include <proofagg/common/log.h>
#include <proofagg/engine/metrics.hpp>
#include <proofagg/engine/service.hpp>
#include <proofagg/queue/dependency_resolver.hpp>
#include <proofagg/queue/ledger.hpp>
#include <proofagg/runner/runner.hpp>

namespace pagg::engine {
using Clock = std::chrono::steady_clock;

inline std::chrono::nanoseconds
Since(Clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() -
                                                              tp);
}

struct JobProcessorSettings {
  /// Written to the ledger as the claiming instance.
  std::string name = "proofagg";
  std::chrono::milliseconds pollingInterval{ 1000 };
  /// Stop after this many claimed jobs or once no job is ready. 0 polls
  /// until stopped.
  uint64_t maxJobs = 0;
  /// Picked or in-progress jobs older than this are taken back from the
  /// instance that claimed them. 0 disables the recovery.
  std::chrono::milliseconds processingTimeout{ 0 };
  /// Failed and recovered jobs are retried until attempted this often. 0
  /// never retries.
  uint32_t maxAttempts = 0;
};

/** @brief Polling job processor, generic over the stage it drives.
 *
 * A stage provides the types JobId, Dependency, Job and Artifacts, the
 * constants Round and ServiceName and the members
 *
 *   pagg_status prepare(JobId, std::vector<Dependency>&&, Job&, std::string&);
 *   pagg_status compute(Job&&, Artifacts&, std::string&) const;
 *   CircuitKey artifactKey(JobId) const;
 *   queue::ProverJobRecord onSuccess(JobId, const std::string& url) const;
 *   void onFailure(JobId, pagg_status, const std::string& error) const;
 *
 * The stage never touches the ledger, all job state transitions happen here.
 * All members except stop() must be called from the service's io_context
 * thread. compute() runs on a worker thread of the runner.
 */
template<class Stage>
class JobProcessor {
  public:
  using JobId = typename Stage::JobId;
  using Dependency = typename Stage::Dependency;
  using Job = typename Stage::Job;
  using Artifacts = typename Stage::Artifacts;
  using FinishedSignal = boost::signals2::signal<void()>;

  static_assert(std::is_same_v<JobId, BatchNumber>,
                "jobs are identified by their batch number");

  struct PreparedJob {
    JobId id;
    Clock::time_point started;
    Job job;
  };

  JobProcessor(Stage& stage,
               Service& service,
               runner::Runner& runner,
               queue::JobLedger& ledger,
               queue::DependencyResolver& resolver,
               blob::ObjectStore& store,
               MetricsSink& metrics,
               JobProcessorSettings settings)
    : m_stage(stage)
    , m_service(service)
    , m_runner(runner)
    , m_ledger(ledger)
    , m_resolver(resolver)
    , m_store(store)
    , m_metrics(metrics)
    , m_settings(std::move(settings))
    , m_timer(service.ioContext()) {}

  ~JobProcessor() {
    pagg_log(
      PAGG_ENGINE, PAGG_TRACE, "Destroy {} processor.", Stage::ServiceName);
  }

  /** @brief Begin polling on the service's io_context. */
  void start() {
    pagg_log(PAGG_ENGINE,
             PAGG_INFO,
             "Starting {} as {}, polling every {}ms{}.",
             Stage::ServiceName,
             m_settings.name,
             m_settings.pollingInterval.count(),
             m_settings.maxJobs
               ? fmt::format(", stopping after {} jobs", m_settings.maxJobs)
               : std::string());
    boost::asio::post(m_service.ioContext(),
                      [this]() { loop(boost::system::error_code()); });
  }

  /** @brief Stop claiming new jobs. A job being processed is finished first.
   *
   * May be called from any thread.
   */
  void stop() {
    m_stopRequested = true;
    boost::asio::post(m_service.ioContext(), [this]() { m_timer.cancel(); });
  }

  /** @brief Claim the next ready job and assemble its input.
   *
   * Every failure after a successful claim is recorded with saveFailure() and
   * yields no job.
   */
  std::optional<PreparedJob> getNextJob() {
    std::optional<JobId> id;
    pagg_status s =
      m_ledger.claimNextReadyJob(Stage::Round, m_settings.name, id);
    if(s != PAGG_OK) {
      pagg_log(PAGG_ENGINE,
               PAGG_LOCALWARNING,
               "Could not query queue for the next {} job! Status: {}",
               Stage::Round,
               s);
      return std::nullopt;
    }
    if(!id)
      return std::nullopt;

    ++m_claimed;
    const Clock::time_point started = Clock::now();
    pagg_log(PAGG_ENGINE,
             PAGG_INFO,
             "Claimed {} job of batch {}.",
             Stage::Round,
             *id);

    std::vector<CircuitKey> keys;
    s = m_resolver.resolve(Stage::Round, *id, keys);
    if(s != PAGG_OK) {
      saveFailure(
        *id, started, s, fmt::format("could not resolve batch {}", *id));
      return std::nullopt;
    }

    const Clock::time_point fetchStarted = Clock::now();
    std::vector<Dependency> dependencies;
    dependencies.reserve(keys.size());
    for(const CircuitKey& key : keys) {
      Dependency dependency;
      s = m_store.get(key, dependency);
      if(s != PAGG_OK) {
        saveFailure(
          *id, started, s, fmt::format("could not fetch dependency {}", key));
        return std::nullopt;
      }
      dependencies.push_back(std::move(dependency));
    }
    m_metrics.observe(
      metrics::BlobFetchTime, Stage::Round, Since(fetchStarted));

    const Clock::time_point prepareStarted = Clock::now();
    Job job;
    std::string error;
    s = m_stage.prepare(*id, std::move(dependencies), job, error);
    m_metrics.observe(
      metrics::PrepareJobTime, Stage::Round, Since(prepareStarted));
    if(s != PAGG_OK) {
      saveFailure(*id, started, s, error);
      return std::nullopt;
    }

    return PreparedJob{ *id, started, std::move(job) };
  }

  /** @brief Persist the artifact, then insert the downstream job and mark
   * the job successful in one transaction.
   */
  pagg_status saveResult(JobId id,
                         Clock::time_point started,
                         Artifacts&& artifacts) {
    const CircuitKey key = m_stage.artifactKey(id);

    const Clock::time_point saveStarted = Clock::now();
    std::string url;
    pagg_status s = m_store.put(key, artifacts, url);
    m_metrics.observe(
      metrics::BlobSaveTime, Stage::Round, Since(saveStarted));
    if(s != PAGG_OK) {
      saveFailure(id, started, s, fmt::format("could not save {}", key));
      return s;
    }

    const queue::ProverJobRecord next = m_stage.onSuccess(id, url);
    const auto elapsed =
      std::chrono::duration_cast<std::chrono::milliseconds>(Since(started));

    std::string failedStep;
    {
      queue::LedgerTransaction tx(m_ledger);
      s = tx.begin();
      if(s != PAGG_OK) {
        failedStep = "begin transaction";
      } else {
        ProverJobId nextId = 0;
        s = m_ledger.insertProverJob(next, nextId);
        if(s != PAGG_OK) {
          failedStep = fmt::format("insert prover job {}", next.key);
        } else if((s = m_ledger.markSucceeded(Stage::Round, id, elapsed)) !=
                  PAGG_OK) {
          failedStep = "mark job successful";
        } else if((s = tx.commit()) != PAGG_OK) {
          failedStep = "commit";
        }
      }

      if(s != PAGG_OK && tx.active()) {
        pagg_status r = tx.rollback();
        if(r != PAGG_OK) {
          pagg_log(PAGG_ENGINE,
                   PAGG_LOCALERROR,
                   "Could not roll back result of {} job of batch {}! "
                   "Status: {}",
                   Stage::Round,
                   id,
                   r);
        }
      }
    }

    if(s != PAGG_OK) {
      saveFailure(id,
                  started,
                  s,
                  fmt::format("could not {} after saving {}", failedStep, url));
      return s;
    }

    ++m_succeeded;
    pagg_log(PAGG_ENGINE,
             PAGG_INFO,
             "{} job of batch {} is complete in {}ms, artifact at {}.",
             Stage::Round,
             id,
             elapsed.count(),
             url);
    return PAGG_OK;
  }

  /** @brief Record the failure in the ledger. Artifacts already written are
   * kept, a retry overwrites them.
   */
  pagg_status saveFailure(JobId id,
                          Clock::time_point started,
                          pagg_status status,
                          const std::string& error) {
    ++m_failed;
    m_stage.onFailure(id, status, error);

    const bool retryable = pagg_status_is_retryable(status);
    const std::string message =
      error.empty() ? std::string(pagg_status_to_str(status))
                    : fmt::format("{}: {}", status, error);

    pagg_log(PAGG_ENGINE,
             PAGG_LOCALERROR,
             "{} job of batch {} failed after {}ms ({}): {}",
             Stage::Round,
             id,
             std::chrono::duration_cast<std::chrono::milliseconds>(
               Since(started))
               .count(),
             retryable ? "retryable" : "not retryable",
             message);

    pagg_status s = m_ledger.markFailed(Stage::Round, id, message, retryable);
    if(s != PAGG_OK) {
      pagg_log(PAGG_ENGINE,
               PAGG_LOCALERROR,
               "Could not mark {} job of batch {} as failed! Status: {}",
               Stage::Round,
               id,
               s);
    }
    return s;
  }

  /** @brief Put stuck and retryable failed jobs back into the queue.
   *
   * Returns true if a job became ready again.
   */
  bool recoverJobs() {
    uint64_t requeued = 0;
    if(m_settings.processingTimeout.count() > 0) {
      uint64_t stuck = 0, failed = 0;
      pagg_status s = m_ledger.requeueStuckJobs(Stage::Round,
                                                m_settings.processingTimeout,
                                                m_settings.maxAttempts,
                                                stuck,
                                                failed);
      if(s != PAGG_OK) {
        pagg_log(PAGG_ENGINE,
                 PAGG_LOCALWARNING,
                 "Could not recover stuck {} jobs! Status: {}",
                 Stage::Round,
                 s);
      }
      requeued += stuck;
    }
    if(m_settings.maxAttempts != 0) {
      uint64_t retried = 0;
      pagg_status s = m_ledger.requeueFailedJobs(
        Stage::Round, m_settings.maxAttempts, retried);
      if(s != PAGG_OK) {
        pagg_log(PAGG_ENGINE,
                 PAGG_LOCALWARNING,
                 "Could not requeue failed {} jobs! Status: {}",
                 Stage::Round,
                 s);
      }
      requeued += retried;
    }
    return requeued > 0;
  }

  uint64_t claimedJobs() const { return m_claimed; }
  uint64_t succeededJobs() const { return m_succeeded; }
  uint64_t failedJobs() const { return m_failed; }
  bool finished() const { return m_finished; }

  /** @brief Raised on the io_context thread once the polling loop ended. */
  FinishedSignal& getFinishedSignal() { return m_finishedSignal; }

  const JobProcessorSettings& settings() const { return m_settings; }

  private:
  struct ComputeOutcome {
    pagg_status status = PAGG_PENDING;
    std::string error;
    Artifacts artifacts;
    std::chrono::nanoseconds elapsed{ 0 };
    bool computed = false;
  };

  class ComputeTask : public runner::Task {
    public:
    ComputeTask(const Stage& stage,
                Job&& job,
                std::shared_ptr<ComputeOutcome> outcome)
      : runner::Task(std::string(Stage::ServiceName) + " compute")
      , m_stage(stage)
      , m_job(std::move(job))
      , m_outcome(std::move(outcome)) {}

    runner::TaskResultPtr execute() override {
      std::string error;
      pagg_status s =
        m_stage.compute(std::move(m_job), m_outcome->artifacts, error);
      return std::make_unique<runner::TaskResult>(s, std::move(error));
    }

    private:
    const Stage& m_stage;
    Job m_job;
    std::shared_ptr<ComputeOutcome> m_outcome;
  };

  /** @brief Hand the compute step to the runner. The loop is resumed on the
   * io_context once the task finished. */
  void process(PreparedJob&& prepared) {
    m_outcome = std::make_shared<ComputeOutcome>();

    pagg_status s = m_ledger.markInProgress(Stage::Round, prepared.id);
    if(s != PAGG_OK) {
      m_outcome->status = s;
      m_outcome->error = "could not mark job as in progress";
      boost::asio::post(m_service.ioContext(),
                        [this]() { loop(boost::system::error_code()); });
      return;
    }

    auto task = std::make_unique<ComputeTask>(
      m_stage, std::move(prepared.job), m_outcome);

    std::shared_ptr<ComputeOutcome> outcome = m_outcome;
    const Clock::time_point dispatched = Clock::now();
    task->getFinishedSignal().connect(
      [this, outcome, dispatched](const runner::TaskResult& result) {
        outcome->status = result.getStatus();
        outcome->error = result.getError();
        outcome->elapsed = Since(dispatched);
        outcome->computed = true;
        boost::asio::post(m_service.ioContext(),
                          [this]() { loop(boost::system::error_code()); });
      });

    pagg_log(PAGG_ENGINE,
             PAGG_DEBUG,
             "Dispatching {} job of batch {} to a worker.",
             Stage::Round,
             prepared.id);
    m_runner.push(std::move(task));
  }

#include <boost/asio/yield.hpp>
  void loop(const boost::system::error_code& ec) {
    if(ec && ec != boost::asio::error::operation_aborted) {
      pagg_log(PAGG_ENGINE,
               PAGG_LOCALWARNING,
               "Polling timer of {} reported an error: {}",
               Stage::ServiceName,
               ec.message());
    }

    reenter(m_coro) {
      while(!m_stopRequested) {
        if(m_settings.maxJobs != 0 && m_claimed >= m_settings.maxJobs) {
          pagg_log(PAGG_ENGINE,
                   PAGG_INFO,
                   "Took {} jobs, stopping {}.",
                   m_claimed,
                   Stage::ServiceName);
          break;
        }

        m_claimedBefore = m_claimed;
        m_prepared = getNextJob();
        if(!m_prepared) {
          if(m_claimed != m_claimedBefore) {
            // Claimed, but failed while preparing. Try the next one at once.
            continue;
          }
          if(recoverJobs())
            continue;
          if(m_settings.maxJobs != 0) {
            pagg_log(PAGG_ENGINE,
                     PAGG_INFO,
                     "No ready {} job left, stopping {}.",
                     Stage::Round,
                     Stage::ServiceName);
            break;
          }
          m_timer.expires_after(m_settings.pollingInterval);
          yield m_timer.async_wait(
            [this](const boost::system::error_code& ec) { loop(ec); });
          continue;
        }

        m_currentId = m_prepared->id;
        m_currentStarted = m_prepared->started;
        yield process(std::move(*m_prepared));

        m_prepared.reset();
        if(m_outcome->computed) {
          m_metrics.observe(metrics::WitnessGenerationTime,
                            Stage::Round,
                            m_outcome->elapsed);
        }
        if(m_outcome->status == PAGG_OK) {
          saveResult(
            m_currentId, m_currentStarted, std::move(m_outcome->artifacts));
        } else {
          saveFailure(m_currentId,
                      m_currentStarted,
                      m_outcome->status,
                      m_outcome->error);
        }
        m_outcome.reset();
      }

      m_finished = true;
      m_finishedSignal();
    }
  }
#include <boost/asio/unyield.hpp>

  Stage& m_stage;
  Service& m_service;
  runner::Runner& m_runner;
  queue::JobLedger& m_ledger;
  queue::DependencyResolver& m_resolver;
  blob::ObjectStore& m_store;
  MetricsSink& m_metrics;
  JobProcessorSettings m_settings;

  boost::asio::coroutine m_coro;
  boost::asio::steady_timer m_timer;

  std::optional<PreparedJob> m_prepared;
  std::shared_ptr<ComputeOutcome> m_outcome;
  JobId m_currentId = 0;
  Clock::time_point m_currentStarted;

  std::atomic_bool m_stopRequested = false;
  std::atomic_bool m_finished = false;
  uint64_t m_claimed = 0;
  uint64_t m_claimedBefore = 0;
  uint64_t m_succeeded = 0;
  uint64_t m_failed = 0;

  FinishedSignal m_finishedSignal;
};
}
