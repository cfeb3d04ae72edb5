#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <proofagg/common/circuit_key.hpp>
#include <proofagg/common/status.h>

namespace pagg::queue {
enum class WitnessJobStatus {
  Queued,
  Picked,
  InProgress,
  Successful,
  Failed,
};

const char*
WitnessJobStatusToStr(WitnessJobStatus status);

bool
WitnessJobStatusFromStr(std::string_view str, WitnessJobStatus& status);

std::ostream&
operator<<(std::ostream& o, WitnessJobStatus status);

struct WitnessJobRecord {
  AggregationRound round = AggregationRound::BasicCircuits;
  BatchNumber batch = 0;
  WitnessJobStatus status = WitnessJobStatus::Queued;
  uint32_t attempts = 0;
  std::string error;
  bool retryable = true;
  uint64_t timeTakenMS = 0;
  std::string pickedBy;
};

/** @brief Downstream job handed to the prover after a stage succeeded. */
struct ProverJobRecord {
  CircuitKey key;
  std::string circuitBlobUrl;
  bool isNodeFinalProof = false;
};

/** @brief Durable record of the witness jobs of all rounds and of the prover
 * jobs they produce.
 *
 * Implementations must make claimNextReadyJob atomic across processes. All
 * other mutations may be grouped with beginTransaction() and commit().
 */
class JobLedger {
  public:
  virtual ~JobLedger();

  /** @brief Atomically claim the lowest queued job of round whose dependency
   * slots all reference successful prover jobs.
   *
   * The job moves to Picked and its attempts are incremented. Returns an
   * empty optional if no job is ready.
   */
  virtual pagg_status claimNextReadyJob(AggregationRound round,
                                        std::string_view pickedBy,
                                        std::optional<BatchNumber>& out) = 0;

  virtual pagg_status markInProgress(AggregationRound round,
                                     BatchNumber batch) = 0;

  /** @brief Prover job ids recorded as dependencies, in slot order. Unset
   * slots yield PAGG_DEPENDENCY_COUNT_MISMATCH.
   */
  virtual pagg_status getDependencyJobIds(AggregationRound round,
                                          BatchNumber batch,
                                          std::vector<ProverJobId>& out) = 0;

  virtual pagg_status getProverJobKey(ProverJobId id, CircuitKey& out) = 0;

  virtual pagg_status markFailed(AggregationRound round,
                                 BatchNumber batch,
                                 std::string_view error,
                                 bool retryable) = 0;

  /** @brief Insert a prover job. Inserting a known key updates its URL and
   * returns the existing id.
   */
  virtual pagg_status insertProverJob(const ProverJobRecord& job,
                                      ProverJobId& id) = 0;

  virtual pagg_status markSucceeded(AggregationRound round,
                                    BatchNumber batch,
                                    std::chrono::milliseconds elapsed) = 0;

  virtual pagg_status beginTransaction() = 0;
  virtual pagg_status commit() = 0;
  virtual pagg_status rollback() = 0;

  /// Producer side, used by upstream rounds.
  virtual pagg_status insertWitnessJob(AggregationRound round,
                                       BatchNumber batch,
                                       uint32_t dependencySlots) = 0;
  virtual pagg_status setDependency(AggregationRound round,
                                    BatchNumber batch,
                                    uint32_t slot,
                                    ProverJobId proverJob) = 0;
  virtual pagg_status markProverJobSucceeded(ProverJobId id) = 0;

  virtual pagg_status getWitnessJob(AggregationRound round,
                                    BatchNumber batch,
                                    WitnessJobRecord& out) = 0;
  virtual pagg_status countProverJobs(const CircuitKey& key,
                                      uint64_t& count) = 0;

  /** @brief Move failed, retryable jobs of round with fewer than maxAttempts
   * attempts back to Queued.
   *
   * @param requeued receives the number of requeued jobs.
   */
  virtual pagg_status requeueFailedJobs(AggregationRound round,
                                        uint32_t maxAttempts,
                                        uint64_t& requeued) = 0;

  /** @brief Recover Picked or InProgress jobs of round whose processing
   * started at least processingTimeout ago, e.g. after the processing
   * instance died.
   *
   * Jobs with fewer than maxAttempts attempts go back to Queued. The others
   * are marked Failed and not retryable.
   */
  virtual pagg_status requeueStuckJobs(
    AggregationRound round,
    std::chrono::milliseconds processingTimeout,
    uint32_t maxAttempts,
    uint64_t& requeued,
    uint64_t& failed) = 0;
};

/** @brief Scope guard around a ledger transaction. Rolls back on destruction
 * unless commit() succeeded.
 */
class LedgerTransaction {
  public:
  explicit LedgerTransaction(JobLedger& ledger);
  ~LedgerTransaction();

  LedgerTransaction(const LedgerTransaction&) = delete;
  LedgerTransaction& operator=(const LedgerTransaction&) = delete;

  pagg_status begin();
  pagg_status commit();
  pagg_status rollback();

  bool active() const { return m_active; }

  private:
  JobLedger& m_ledger;
  bool m_active = false;
};
}
