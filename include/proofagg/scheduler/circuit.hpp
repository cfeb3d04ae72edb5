#pragma once

#include <cstdint>
#include <variant>
#include <vector>

#include <cereal/types/variant.hpp>
#include <cereal/types/vector.hpp>

#include <proofagg/blob/object_store.hpp>
#include <proofagg/scheduler/verification.hpp>
#include <proofagg/scheduler/witness.hpp>

namespace pagg {
struct ProofConfig {
  uint32_t friLdeFactor = 0;
  uint32_t merkleTreeCapSize = 0;
  uint32_t securityLevel = 0;
  uint32_t powBits = 0;

  bool operator==(const ProofConfig& o) const {
    return friLdeFactor == o.friLdeFactor &&
           merkleTreeCapSize == o.merkleTreeCapSize &&
           securityLevel == o.securityLevel && powBits == o.powBits;
  }

  template<class Archive>
  void serialize(Archive& ar) {
    ar(CEREAL_NVP(friLdeFactor),
       CEREAL_NVP(merkleTreeCapSize),
       CEREAL_NVP(securityLevel),
       CEREAL_NVP(powBits));
  }
};

/** @brief Proof configuration shared by all recursion-layer circuits. */
ProofConfig
RecursionLayerProofConfig();

struct SchedulerConfig {
  ProofConfig proofConfig;
  VerificationKeyFixedParameters vkFixedParameters;
  uint64_t capacity = 0;

  template<class Archive>
  void serialize(Archive& ar) {
    ar(CEREAL_NVP(proofConfig),
       CEREAL_NVP(vkFixedParameters),
       CEREAL_NVP(capacity));
  }
};

struct SchedulerCircuit {
  SchedulerWitness witness;
  SchedulerConfig config;

  template<class Archive>
  void serialize(Archive& ar) {
    ar(CEREAL_NVP(witness), CEREAL_NVP(config));
  }
};

struct BaseLayerCircuit {
  uint8_t circuitType = 0;
  std::vector<char> payload;

  template<class Archive>
  void serialize(Archive& ar) {
    ar(CEREAL_NVP(circuitType), CEREAL_NVP(payload));
  }
};

/** @brief Circuit as stored in the prover jobs bucket, tagged by its layer.
 *
 * The scheduler circuit is the only recursive-layer circuit built here.
 */
struct CircuitWrapper {
  enum Kind { Base, Recursive };

  std::variant<BaseLayerCircuit, SchedulerCircuit> circuit;

  Kind kind() const { return static_cast<Kind>(circuit.index()); }

  template<class Archive>
  void serialize(Archive& ar) {
    ar(CEREAL_NVP(circuit));
  }
};
}

template<>
struct pagg::blob::StoredObject<pagg::CircuitWrapper> {
  using Key = pagg::CircuitKey;
  static constexpr const char* bucket = "prover_jobs_fri";
  static std::string name(const Key& key) { return key.encode(); }
};
