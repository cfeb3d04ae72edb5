#pragma once

#include <memory>
#include <mutex>
#include <string>

#include <proofagg/queue/ledger.hpp>

struct sqlite3;

namespace pagg::queue {
/** @brief JobLedger on top of an SQLite database file.
 *
 * Every instance holds its own connection. Several instances, also in several
 * processes, may share one database file. The connection runs in WAL mode with
 * a busy timeout, claims use BEGIN IMMEDIATE to serialize writers.
 */
class SQLiteLedger : public JobLedger {
  public:
  explicit SQLiteLedger(std::string path, int busyTimeoutMS = 5000);
  virtual ~SQLiteLedger();

  /** @brief Open the database and create the schema if missing. */
  pagg_status open();
  void close();

  bool isOpen() const { return m_db != nullptr; }
  const std::string& path() const { return m_path; }

  pagg_status claimNextReadyJob(AggregationRound round,
                                std::string_view pickedBy,
                                std::optional<BatchNumber>& out) override;
  pagg_status markInProgress(AggregationRound round,
                             BatchNumber batch) override;
  pagg_status getDependencyJobIds(AggregationRound round,
                                  BatchNumber batch,
                                  std::vector<ProverJobId>& out) override;
  pagg_status getProverJobKey(ProverJobId id, CircuitKey& out) override;
  pagg_status markFailed(AggregationRound round,
                         BatchNumber batch,
                         std::string_view error,
                         bool retryable) override;
  pagg_status insertProverJob(const ProverJobRecord& job,
                              ProverJobId& id) override;
  pagg_status markSucceeded(AggregationRound round,
                            BatchNumber batch,
                            std::chrono::milliseconds elapsed) override;

  pagg_status beginTransaction() override;
  pagg_status commit() override;
  pagg_status rollback() override;

  pagg_status insertWitnessJob(AggregationRound round,
                               BatchNumber batch,
                               uint32_t dependencySlots) override;
  pagg_status setDependency(AggregationRound round,
                            BatchNumber batch,
                            uint32_t slot,
                            ProverJobId proverJob) override;
  pagg_status markProverJobSucceeded(ProverJobId id) override;
  pagg_status getWitnessJob(AggregationRound round,
                            BatchNumber batch,
                            WitnessJobRecord& out) override;
  pagg_status countProverJobs(const CircuitKey& key,
                              uint64_t& count) override;
  pagg_status requeueFailedJobs(AggregationRound round,
                                uint32_t maxAttempts,
                                uint64_t& requeued) override;
  pagg_status requeueStuckJobs(AggregationRound round,
                               std::chrono::milliseconds processingTimeout,
                               uint32_t maxAttempts,
                               uint64_t& requeued,
                               uint64_t& failed) override;

  private:
  class Statement;

  pagg_status exec(const char* sql);
  pagg_status updateWitnessJobStatus(AggregationRound round,
                                     BatchNumber batch,
                                     const char* sql,
                                     const char* what);

  std::string m_path;
  int m_busyTimeoutMS;
  sqlite3* m_db = nullptr;
  std::mutex m_mutex;
};
}
