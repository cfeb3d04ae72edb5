#include <proofagg/blob/object_store.hpp>
#include <proofagg/common/log.h>
#include <proofagg/scheduler/scheduler_stage.hpp>

#include <fmt/format.h>

namespace pagg {
SchedulerStage::SchedulerStage(
  blob::ObjectStore& store,
  std::shared_ptr<const VerificationParameters> parameters,
  uint64_t capacity)
  : m_store(store)
  , m_parameters(std::move(parameters))
  , m_capacity(capacity) {}
SchedulerStage::~SchedulerStage() {}

pagg_status
SchedulerStage::prepare(BatchNumber batch,
                        std::vector<ProofWrapper>&& proofs,
                        SchedulerJob& job,
                        std::string& error) {
  SchedulerPartialInput input;
  pagg_status s = m_store.get(batch, input);
  if(s != PAGG_OK) {
    error = fmt::format("could not fetch scheduler partial input of batch {}",
                        batch);
    return s;
  }

  std::vector<RecursionProof> recursiveProofs;
  recursiveProofs.reserve(proofs.size());
  for(std::size_t i = 0; i < proofs.size(); ++i) {
    const ProofWrapper::Kind kind = proofs[i].kind();
    RecursionProof proof;
    s = extractRecursiveProof(std::move(proofs[i]), proof);
    if(s != PAGG_OK) {
      error = fmt::format("expected only recursive proofs for scheduler batch "
                          "{}, dependency {} is a {} proof",
                          batch,
                          i,
                          ProofKindToStr(kind));
      return s;
    }
    recursiveProofs.push_back(std::move(proof));
  }

  SchedulerWitness& witness = input.witness;
  witness.nodeLayerVkWitness = m_parameters->nodeLayerVk;
  witness.proofWitnesses = std::move(recursiveProofs);

  s = MakeLeafLayerParameterTable(m_parameters->leafLayerParameters,
                                  witness.leafLayerParameters);
  if(s != PAGG_OK) {
    error = fmt::format("got {} leaf layer parameters instead of {}",
                        m_parameters->leafLayerParameters.size(),
                        BaseLayerCircuitCount);
    return s;
  }

  job.batch = batch;
  job.witness = std::move(witness);
  job.nodeVk = m_parameters->nodeLayerVk;

  pagg_log(PAGG_SCHEDULER,
           PAGG_DEBUG,
           "Prepared scheduler job of batch {} with {} proofs.",
           batch,
           job.witness.proofWitnesses.size());
  return PAGG_OK;
}

pagg_status
SchedulerStage::compute(SchedulerJob&& job,
                        CircuitWrapper& artifacts,
                        std::string& error) const {
  pagg_log(PAGG_SCHEDULER,
           PAGG_INFO,
           "Starting fri witness generation of type {} for batch {}.",
           Round,
           job.batch);

  if(job.witness.proofWitnesses.size() > m_capacity) {
    error = fmt::format("batch {} has {} proofs, the scheduler circuit takes "
                        "at most {}",
                        job.batch,
                        job.witness.proofWitnesses.size(),
                        m_capacity);
    return PAGG_CAPACITY_EXCEEDED;
  }

  SchedulerCircuit circuit;
  circuit.config.proofConfig = RecursionLayerProofConfig();
  circuit.config.vkFixedParameters = job.nodeVk.fixedParameters;
  circuit.config.capacity = m_capacity;
  circuit.witness = std::move(job.witness);

  artifacts.circuit = std::move(circuit);
  return PAGG_OK;
}

CircuitKey
SchedulerStage::artifactKey(BatchNumber batch) const {
  return CircuitKey{ batch, 1, 0, 0, Round };
}

queue::ProverJobRecord
SchedulerStage::onSuccess(BatchNumber batch, const std::string& url) const {
  queue::ProverJobRecord job;
  job.key = artifactKey(batch);
  job.circuitBlobUrl = url;
  job.isNodeFinalProof = false;
  return job;
}

void
SchedulerStage::onFailure(BatchNumber batch,
                          pagg_status status,
                          const std::string& error) const {
  pagg_log(PAGG_SCHEDULER,
           PAGG_LOCALERROR,
           "Scheduler job of batch {} failed with {} ({}): {}",
           batch,
           status,
           pagg_status_is_input_contract_violation(status)
             ? "input contract violation"
             : "transient",
           error);
}
}
