#pragma once

#include <map>
#include <vector>

#include <proofagg/common/circuit_key.hpp>
#include <proofagg/common/status.h>

namespace pagg::queue {
class JobLedger;

/** @brief Maps a job to the upstream artifacts it consumes.
 *
 * The order of the returned keys is the slot order recorded in the ledger and
 * must be kept when the artifacts are handed to the compute step.
 */
class DependencyResolver {
  public:
  explicit DependencyResolver(JobLedger& ledger);
  ~DependencyResolver();

  /** @brief Number of dependencies every job of round must have. */
  void setExpectedCount(AggregationRound round, uint32_t count);

  /** @brief Resolve the upstream keys of the job (round, batch).
   *
   * Fails with PAGG_DEPENDENCY_COUNT_MISMATCH if no count was set for round,
   * if the recorded dependencies differ from the expected count, if a slot
   * is unset or if a slot references an unknown prover job.
   */
  pagg_status resolve(AggregationRound round,
                      BatchNumber batch,
                      std::vector<CircuitKey>& out) const;

  private:
  JobLedger& m_ledger;
  std::map<AggregationRound, uint32_t> m_expectedCounts;
};
}
