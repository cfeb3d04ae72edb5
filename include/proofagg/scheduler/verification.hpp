#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <vector>

#include <boost/filesystem/path.hpp>

#include <cereal/types/common.hpp>
#include <cereal/types/vector.hpp>

#include <proofagg/common/status.h>
#include <proofagg/scheduler/proof.hpp>

namespace pagg {
/// Number of base-layer circuit types of the pipeline. Fixes the width of the
/// leaf-layer parameter table.
constexpr std::size_t BaseLayerCircuitCount = 13;

/** @brief Parameters of a verification key that a circuit verifying proofs
 * of that key needs at build time. */
struct VerificationKeyFixedParameters {
  uint8_t circuitType = 0;
  uint64_t domainSize = 0;
  uint32_t numColumns = 0;
  uint32_t lookupWidth = 0;
  uint32_t capSize = 0;

  bool operator==(const VerificationKeyFixedParameters& o) const {
    return circuitType == o.circuitType && domainSize == o.domainSize &&
           numColumns == o.numColumns && lookupWidth == o.lookupWidth &&
           capSize == o.capSize;
  }

  template<class Archive>
  void serialize(Archive& ar) {
    ar(CEREAL_NVP(circuitType),
       CEREAL_NVP(domainSize),
       CEREAL_NVP(numColumns),
       CEREAL_NVP(lookupWidth),
       CEREAL_NVP(capSize));
  }
};

struct VerificationKey {
  VerificationKeyFixedParameters fixedParameters;
  std::vector<FieldElement> setupMerkleTreeCap;

  bool operator==(const VerificationKey& o) const {
    return fixedParameters == o.fixedParameters &&
           setupMerkleTreeCap == o.setupMerkleTreeCap;
  }

  template<class Archive>
  void serialize(Archive& ar) {
    ar(CEREAL_NVP(fixedParameters), CEREAL_NVP(setupMerkleTreeCap));
  }
};

/** @brief Commitment to the verification key of one leaf-layer circuit. */
struct LeafLayerParameters {
  uint8_t circuitType = 0;
  std::vector<FieldElement> vkCommitment;

  bool operator==(const LeafLayerParameters& o) const {
    return circuitType == o.circuitType && vkCommitment == o.vkCommitment;
  }

  template<class Archive>
  void serialize(Archive& ar) {
    ar(CEREAL_NVP(circuitType), CEREAL_NVP(vkCommitment));
  }
};

using LeafLayerParameterTable =
  std::array<LeafLayerParameters, BaseLayerCircuitCount>;

/** @brief Fixed parameters of the round before the scheduler.
 *
 * Loaded once at start-up and shared read-only by all jobs.
 */
struct VerificationParameters {
  VerificationKey nodeLayerVk;
  std::vector<LeafLayerParameters> leafLayerParameters;
};

/** @brief Convert the loaded leaf-layer list into the fixed-width table.
 *
 * @return PAGG_LAYER_PARAMETER_COUNT_MISMATCH if the list does not have
 * exactly BaseLayerCircuitCount entries.
 */
pagg_status
MakeLeafLayerParameterTable(const std::vector<LeafLayerParameters>& params,
                            LeafLayerParameterTable& out);

/** @brief Read node_layer_vk.json and leaf_layer_parameters.json from dir. */
pagg_status
LoadVerificationParameters(
  const boost::filesystem::path& dir,
  std::shared_ptr<const VerificationParameters>& out);

pagg_status
SaveVerificationParameters(const boost::filesystem::path& dir,
                           const VerificationParameters& params);
}
