#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <proofagg/common/circuit_key.hpp>
#include <proofagg/common/status.h>
#include <proofagg/queue/ledger.hpp>
#include <proofagg/scheduler/circuit.hpp>
#include <proofagg/scheduler/proof.hpp>
#include <proofagg/scheduler/verification.hpp>
#include <proofagg/scheduler/witness.hpp>

namespace pagg::blob {
class ObjectStore;
}

namespace pagg {
/** @brief Terminal aggregation round. Merges the node-round proofs of a batch
 * into the scheduler circuit that is then proven as final proof.
 */
class SchedulerStage {
  public:
  using JobId = BatchNumber;
  using Dependency = ProofWrapper;
  using Job = SchedulerJob;
  using Artifacts = CircuitWrapper;

  static constexpr AggregationRound Round = AggregationRound::Scheduler;
  static constexpr const char* ServiceName = "fri_scheduler_witness_generator";

  /// Maximum number of proofs the scheduler circuit can take.
  static constexpr uint64_t DefaultCapacity = 1 << 14;

  SchedulerStage(blob::ObjectStore& store,
                 std::shared_ptr<const VerificationParameters> parameters,
                 uint64_t capacity = DefaultCapacity);
  ~SchedulerStage();

  /** @brief Merge partial input, node verification key, proofs and leaf-layer
   * parameters of batch into a job.
   *
   * proofs must be in resolver order and are kept in that order.
   */
  pagg_status prepare(BatchNumber batch,
                      std::vector<ProofWrapper>&& proofs,
                      SchedulerJob& job,
                      std::string& error);

  /** @brief Build the scheduler circuit. Does no I/O. */
  pagg_status compute(SchedulerJob&& job,
                      CircuitWrapper& artifacts,
                      std::string& error) const;

  CircuitKey artifactKey(BatchNumber batch) const;
  queue::ProverJobRecord onSuccess(BatchNumber batch,
                                   const std::string& url) const;
  void onFailure(BatchNumber batch,
                 pagg_status status,
                 const std::string& error) const;

  uint64_t capacity() const { return m_capacity; }

  private:
  blob::ObjectStore& m_store;
  std::shared_ptr<const VerificationParameters> m_parameters;
  uint64_t m_capacity;
};
}
