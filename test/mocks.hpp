#pragma once

#include <boost/filesystem.hpp>

#include <catch2/catch.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <proofagg/common/circuit_key.hpp>
#include <proofagg/engine/metrics.hpp>
#include <proofagg/queue/ledger.hpp>
#include <proofagg/scheduler/proof.hpp>
#include <proofagg/scheduler/verification.hpp>
#include <proofagg/scheduler/witness.hpp>

/** @brief Directory below the system temp path, removed on destruction. */
class TempDir {
  public:
  TempDir()
    : m_path(boost::filesystem::temp_directory_path() /
             boost::filesystem::unique_path("proofagg-test-%%%%-%%%%-%%%%")) {
    boost::filesystem::create_directories(m_path);
  }
  ~TempDir() {
    boost::system::error_code ec;
    boost::filesystem::remove_all(m_path, ec);
  }

  const boost::filesystem::path& path() const { return m_path; }
  std::string file(const std::string& name) const {
    return (m_path / name).string();
  }

  private:
  boost::filesystem::path m_path;
};

/** @brief Key of the node-round proof a scheduler job consumes in slot. */
inline pagg::CircuitKey
NodeProofKey(pagg::BatchNumber batch, uint32_t slot) {
  return pagg::CircuitKey{ batch,
                           static_cast<uint8_t>(slot + 1),
                           0,
                           0,
                           pagg::AggregationRound::NodeAggregation };
}

/** @brief Record a scheduler job of batch with count node-round dependencies.
 *
 * Every dependency gets a prover job. The first succeededCount of them are
 * marked successful, the default marks all of them.
 */
inline std::vector<pagg::ProverJobId>
SeedSchedulerJob(pagg::queue::JobLedger& ledger,
                 pagg::BatchNumber batch,
                 uint32_t count,
                 int succeededCount = -1) {
  using namespace pagg;
  std::vector<ProverJobId> ids;
  REQUIRE(ledger.insertWitnessJob(AggregationRound::Scheduler, batch, count) ==
          PAGG_OK);
  for(uint32_t slot = 0; slot < count; ++slot) {
    queue::ProverJobRecord job;
    job.key = NodeProofKey(batch, slot);
    job.circuitBlobUrl = "memory://prover_jobs_fri/" + job.key.encode();
    job.isNodeFinalProof = true;

    ProverJobId id = 0;
    REQUIRE(ledger.insertProverJob(job, id) == PAGG_OK);
    if(succeededCount < 0 || static_cast<int>(slot) < succeededCount) {
      REQUIRE(ledger.markProverJobSucceeded(id) == PAGG_OK);
    }
    REQUIRE(ledger.setDependency(
              AggregationRound::Scheduler, batch, slot, id) == PAGG_OK);
    ids.push_back(id);
  }
  return ids;
}

/** @brief Node-round proof whose public inputs identify batch and slot. */
inline pagg::ProofWrapper
MakeNodeProof(pagg::BatchNumber batch, uint32_t slot) {
  pagg::RecursionProof proof;
  proof.circuitType = 2;
  proof.publicInputs = { batch, slot };
  proof.payload = { 'n', static_cast<char>('0' + slot % 10) };
  return pagg::ProofWrapper{ std::move(proof) };
}

inline pagg::ProofWrapper
MakeBaseProof(pagg::BatchNumber batch) {
  pagg::BaseProof proof;
  proof.circuitType = 1;
  proof.publicInputs = { batch };
  return pagg::ProofWrapper{ std::move(proof) };
}

inline pagg::SchedulerPartialInput
MakePartialInput(pagg::BatchNumber batch) {
  pagg::SchedulerPartialInput input;
  input.witness.prevBlockData = { batch - 1 };
  input.witness.blockMetaParameters = { 1, 0 };
  input.witness.auxOutputWitness = { 7, 7 };
  input.witness.nodeLayerVkCommitment = { 11, 12, 13, 14 };
  return input;
}

inline std::shared_ptr<const pagg::VerificationParameters>
MakeVerificationParameters(
  std::size_t leafCount = pagg::BaseLayerCircuitCount) {
  auto params = std::make_shared<pagg::VerificationParameters>();
  params->nodeLayerVk.fixedParameters.circuitType = 2;
  params->nodeLayerVk.fixedParameters.domainSize = 1 << 20;
  params->nodeLayerVk.fixedParameters.numColumns = 130;
  params->nodeLayerVk.fixedParameters.lookupWidth = 4;
  params->nodeLayerVk.fixedParameters.capSize = 16;
  params->nodeLayerVk.setupMerkleTreeCap = { 21, 22, 23 };
  for(std::size_t i = 0; i < leafCount; ++i) {
    pagg::LeafLayerParameters leaf;
    leaf.circuitType = static_cast<uint8_t>(i + 1);
    leaf.vkCommitment = { i, i * 2 };
    params->leafLayerParameters.push_back(std::move(leaf));
  }
  return params;
}

/** @brief Keeps every observed sample for later inspection. */
class RecordingMetricsSink : public pagg::engine::MetricsSink {
  public:
  void observe(std::string_view name,
               pagg::AggregationRound round,
               std::chrono::nanoseconds duration) override {
    std::unique_lock lock(m_mutex);
    (void)duration;
    ++m_samples[std::string(name)];
    m_rounds.push_back(round);
  }

  std::size_t count(std::string_view name) const {
    std::unique_lock lock(m_mutex);
    auto it = m_samples.find(std::string(name));
    return it == m_samples.end() ? 0 : it->second;
  }

  std::vector<pagg::AggregationRound> rounds() const {
    std::unique_lock lock(m_mutex);
    return m_rounds;
  }

  private:
  mutable std::mutex m_mutex;
  std::map<std::string, std::size_t> m_samples;
  std::vector<pagg::AggregationRound> m_rounds;
};
