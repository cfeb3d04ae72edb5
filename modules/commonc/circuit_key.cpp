#include <proofagg/common/circuit_key.hpp>

#include <fmt/format.h>

namespace pagg {
const char*
AggregationRoundToStr(AggregationRound round) {
  switch(round) {
    case AggregationRound::BasicCircuits:
      return "BasicCircuits";
    case AggregationRound::LeafAggregation:
      return "LeafAggregation";
    case AggregationRound::NodeAggregation:
      return "NodeAggregation";
    case AggregationRound::Scheduler:
      return "Scheduler";
  }
  return "Unknown";
}

bool
AggregationRoundFromInt(int value, AggregationRound& round) {
  if(value < static_cast<int>(AggregationRound::BasicCircuits) ||
     value > static_cast<int>(AggregationRound::Scheduler)) {
    return false;
  }
  round = static_cast<AggregationRound>(value);
  return true;
}

std::ostream&
operator<<(std::ostream& o, AggregationRound round) {
  return o << AggregationRoundToStr(round);
}

std::string
CircuitKey::encode() const {
  return fmt::format("{}_{}_{}_{}_{}.bin",
                     batch,
                     sequenceNumber,
                     circuitId,
                     AggregationRoundToStr(round),
                     depth);
}

std::ostream&
operator<<(std::ostream& o, const CircuitKey& key) {
  return o << "{batch: " << key.batch
           << ", circuit: " << static_cast<int>(key.circuitId)
           << ", seq: " << key.sequenceNumber << ", depth: " << key.depth
           << ", round: " << key.round << "}";
}
}
