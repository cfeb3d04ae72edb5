#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include <cereal/types/common.hpp>
#include <cereal/types/variant.hpp>
#include <cereal/types/vector.hpp>

#include <proofagg/blob/object_store.hpp>
#include <proofagg/common/circuit_key.hpp>
#include <proofagg/common/status.h>

namespace pagg {
/// Element of the proof system's base field, kept in canonical form.
using FieldElement = uint64_t;

/** @brief Proof of one base-layer circuit. Only consumed by the leaf round. */
struct BaseProof {
  uint8_t circuitType = 0;
  std::vector<FieldElement> publicInputs;
  std::vector<char> payload;

  template<class Archive>
  void serialize(Archive& ar) {
    ar(CEREAL_NVP(circuitType), CEREAL_NVP(publicInputs), CEREAL_NVP(payload));
  }
};

/** @brief Proof produced by an aggregation round (leaf, node or scheduler). */
struct RecursionProof {
  uint8_t circuitType = 0;
  std::vector<FieldElement> publicInputs;
  std::vector<char> payload;

  bool operator==(const RecursionProof& o) const {
    return circuitType == o.circuitType && publicInputs == o.publicInputs &&
           payload == o.payload;
  }

  template<class Archive>
  void serialize(Archive& ar) {
    ar(CEREAL_NVP(circuitType), CEREAL_NVP(publicInputs), CEREAL_NVP(payload));
  }
};

/** @brief Proof as stored in the proofs bucket, tagged by its layer. */
struct ProofWrapper {
  enum Kind { Base, Recursive };

  std::variant<BaseProof, RecursionProof> proof;

  Kind kind() const { return static_cast<Kind>(proof.index()); }

  template<class Archive>
  void serialize(Archive& ar) {
    ar(CEREAL_NVP(proof));
  }
};

const char*
ProofKindToStr(ProofWrapper::Kind kind);

/** @brief Move the recursive proof out of w.
 *
 * @return PAGG_UNEXPECTED_ARTIFACT_KIND if w holds a base proof.
 */
pagg_status
extractRecursiveProof(ProofWrapper&& w, RecursionProof& out);
}

template<>
struct pagg::blob::StoredObject<pagg::ProofWrapper> {
  using Key = pagg::CircuitKey;
  static constexpr const char* bucket = "proofs_fri";
  static std::string name(const Key& key) { return "proof_" + key.encode(); }
};
