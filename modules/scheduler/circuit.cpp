#include <proofagg/scheduler/circuit.hpp>

namespace pagg {
ProofConfig
RecursionLayerProofConfig() {
  ProofConfig config;
  config.friLdeFactor = 2;
  config.merkleTreeCapSize = 16;
  config.securityLevel = 100;
  config.powBits = 0;
  return config;
}
}
