#include <catch2/catch.hpp>

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>

#include <proofagg/blob/memory_object_store.hpp>
#include <proofagg/scheduler/scheduler_stage.hpp>

#include "mocks.hpp"

using namespace pagg;

namespace {
std::vector<ProofWrapper>
MakeNodeProofs(BatchNumber batch, uint32_t count) {
  std::vector<ProofWrapper> proofs;
  for(uint32_t slot = 0; slot < count; ++slot) {
    proofs.push_back(MakeNodeProof(batch, slot));
  }
  return proofs;
}

void
PutPartialInput(blob::ObjectStore& store, BatchNumber batch) {
  std::string url;
  REQUIRE(store.put(batch, MakePartialInput(batch), url) == PAGG_OK);
  REQUIRE(url == "memory://scheduler_witness_jobs_fri/scheduler_witness_" +
                   std::to_string(batch) + ".bin");
}
}

TEST_CASE("Scheduler job merges partial input, key, proofs and leaf table",
          "[scheduler][stage]") {
  blob::MemoryObjectStore store;
  auto params = MakeVerificationParameters();
  SchedulerStage stage(store, params, 16);
  PutPartialInput(store, 42);

  SchedulerJob job;
  std::string error;
  REQUIRE(stage.prepare(42, MakeNodeProofs(42, 3), job, error) == PAGG_OK);
  REQUIRE(error.empty());

  CHECK(job.batch == 42);
  CHECK(job.nodeVk == params->nodeLayerVk);
  CHECK(job.witness.nodeLayerVkWitness == params->nodeLayerVk);
  CHECK(job.witness.prevBlockData == std::vector<FieldElement>{ 41 });
  CHECK(job.witness.nodeLayerVkCommitment ==
        std::vector<FieldElement>{ 11, 12, 13, 14 });

  REQUIRE(job.witness.proofWitnesses.size() == 3);
  for(uint32_t slot = 0; slot < 3; ++slot) {
    CHECK(job.witness.proofWitnesses[slot].publicInputs ==
          std::vector<FieldElement>{ 42, slot });
  }

  for(std::size_t i = 0; i < BaseLayerCircuitCount; ++i) {
    CHECK(job.witness.leafLayerParameters[i] ==
          params->leafLayerParameters[i]);
  }
}

TEST_CASE("Scheduler job without partial input is not prepared",
          "[scheduler][stage]") {
  blob::MemoryObjectStore store;
  SchedulerStage stage(store, MakeVerificationParameters());

  SchedulerJob job;
  std::string error;
  REQUIRE(stage.prepare(42, MakeNodeProofs(42, 3), job, error) ==
          PAGG_OBJECT_NOT_FOUND);
  REQUIRE(!error.empty());
}

TEST_CASE("Base proofs are rejected by the scheduler", "[scheduler][stage]") {
  blob::MemoryObjectStore store;
  SchedulerStage stage(store, MakeVerificationParameters());
  PutPartialInput(store, 42);

  std::vector<ProofWrapper> proofs = MakeNodeProofs(42, 3);
  proofs[1] = MakeBaseProof(42);

  SchedulerJob job;
  std::string error;
  REQUIRE(stage.prepare(42, std::move(proofs), job, error) ==
          PAGG_UNEXPECTED_ARTIFACT_KIND);
  CHECK(error.find("dependency 1 is a base proof") != std::string::npos);
  CHECK(!pagg_status_is_retryable(PAGG_UNEXPECTED_ARTIFACT_KIND));
}

TEST_CASE("Leaf layer parameters must cover every base circuit type",
          "[scheduler][stage]") {
  blob::MemoryObjectStore store;
  PutPartialInput(store, 42);

  auto count = GENERATE(as<std::size_t>{}, 0, 12, 14);
  SchedulerStage stage(store, MakeVerificationParameters(count));

  SchedulerJob job;
  std::string error;
  REQUIRE(stage.prepare(42, MakeNodeProofs(42, 3), job, error) ==
          PAGG_LAYER_PARAMETER_COUNT_MISMATCH);
  CHECK(error.find("instead of 13") != std::string::npos);
}

TEST_CASE("Scheduler circuit is built from the job", "[scheduler][stage]") {
  blob::MemoryObjectStore store;
  auto params = MakeVerificationParameters();
  SchedulerStage stage(store, params, 4);
  PutPartialInput(store, 42);

  SchedulerJob job;
  std::string error;
  REQUIRE(stage.prepare(42, MakeNodeProofs(42, 3), job, error) == PAGG_OK);

  CircuitWrapper circuit;
  REQUIRE(stage.compute(std::move(job), circuit, error) == PAGG_OK);
  REQUIRE(circuit.kind() == CircuitWrapper::Recursive);

  const SchedulerCircuit& c = std::get<SchedulerCircuit>(circuit.circuit);
  CHECK(c.config.proofConfig == RecursionLayerProofConfig());
  CHECK(c.config.vkFixedParameters == params->nodeLayerVk.fixedParameters);
  CHECK(c.config.capacity == 4);
  CHECK(c.witness.proofWitnesses.size() == 3);

  CircuitKey key = stage.artifactKey(42);
  CHECK(key == CircuitKey{ 42, 1, 0, 0, AggregationRound::Scheduler });
  CHECK(key.encode() == "42_0_1_Scheduler_0.bin");

  queue::ProverJobRecord next = stage.onSuccess(42, "memory://x");
  CHECK(next.key == key);
  CHECK(next.circuitBlobUrl == "memory://x");
  CHECK(!next.isNodeFinalProof);
}

TEST_CASE("More proofs than the circuit capacity are rejected",
          "[scheduler][stage]") {
  blob::MemoryObjectStore store;
  SchedulerStage stage(store, MakeVerificationParameters(), 2);
  PutPartialInput(store, 42);

  SchedulerJob job;
  std::string error;
  REQUIRE(stage.prepare(42, MakeNodeProofs(42, 3), job, error) == PAGG_OK);

  CircuitWrapper circuit;
  REQUIRE(stage.compute(std::move(job), circuit, error) ==
          PAGG_CAPACITY_EXCEEDED);
  CHECK(error.find("at most 2") != std::string::npos);
}

TEST_CASE("Verification parameters are read back as written",
          "[scheduler][verification]") {
  TempDir dir;
  auto written = MakeVerificationParameters();
  REQUIRE(SaveVerificationParameters(dir.path() / "keys", *written) ==
          PAGG_OK);
  REQUIRE(
    boost::filesystem::exists(dir.path() / "keys" / "node_layer_vk.json"));
  REQUIRE(boost::filesystem::exists(dir.path() / "keys" /
                                    "leaf_layer_parameters.json"));

  std::shared_ptr<const VerificationParameters> read;
  REQUIRE(LoadVerificationParameters(dir.path() / "keys", read) == PAGG_OK);
  REQUIRE(read);
  CHECK(read->nodeLayerVk == written->nodeLayerVk);
  CHECK(read->leafLayerParameters == written->leafLayerParameters);
}

TEST_CASE("Missing or broken verification parameters are reported",
          "[scheduler][verification]") {
  TempDir dir;
  std::shared_ptr<const VerificationParameters> read;

  SECTION("Missing directory") {
    REQUIRE(LoadVerificationParameters(dir.path() / "nothing", read) ==
            PAGG_FILE_NOT_FOUND_ERROR);
  }
  SECTION("Broken file") {
    REQUIRE(SaveVerificationParameters(dir.path(),
                                       *MakeVerificationParameters()) ==
            PAGG_OK);
    boost::filesystem::ofstream o(dir.path() / "node_layer_vk.json");
    o << "{ \"node_layer_vk\": ";
    o.close();
    REQUIRE(LoadVerificationParameters(dir.path(), read) == PAGG_PARSE_ERROR);
  }
  REQUIRE(!read);
}
