#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <cereal/types/array.hpp>
#include <cereal/types/vector.hpp>

#include <proofagg/blob/object_store.hpp>
#include <proofagg/scheduler/proof.hpp>
#include <proofagg/scheduler/verification.hpp>

namespace pagg {
/** @brief Instance witness of the scheduler circuit.
 *
 * The batch-specific part comes from the partial input. Node verification key,
 * proofs and leaf-layer parameters are merged in while preparing a job.
 */
struct SchedulerWitness {
  std::vector<FieldElement> prevBlockData;
  std::vector<FieldElement> blockMetaParameters;
  std::vector<FieldElement> auxOutputWitness;
  std::vector<FieldElement> nodeLayerVkCommitment;

  VerificationKey nodeLayerVkWitness;
  std::vector<RecursionProof> proofWitnesses;
  LeafLayerParameterTable leafLayerParameters;

  template<class Archive>
  void serialize(Archive& ar) {
    ar(CEREAL_NVP(prevBlockData),
       CEREAL_NVP(blockMetaParameters),
       CEREAL_NVP(auxOutputWitness),
       CEREAL_NVP(nodeLayerVkCommitment),
       CEREAL_NVP(nodeLayerVkWitness),
       CEREAL_NVP(proofWitnesses),
       CEREAL_NVP(leafLayerParameters));
  }
};

/** @brief Scheduler witness as written by the basic-circuit round. */
struct SchedulerPartialInput {
  SchedulerWitness witness;

  template<class Archive>
  void serialize(Archive& ar) {
    ar(CEREAL_NVP(witness));
  }
};

/** @brief Fully merged input of one scheduler compute step. */
struct SchedulerJob {
  BatchNumber batch = 0;
  SchedulerWitness witness;
  VerificationKey nodeVk;
};
}

template<>
struct pagg::blob::StoredObject<pagg::SchedulerPartialInput> {
  using Key = pagg::BatchNumber;
  static constexpr const char* bucket = "scheduler_witness_jobs_fri";
  static std::string name(const Key& batch) {
    return "scheduler_witness_" + std::to_string(batch) + ".bin";
  }
};
