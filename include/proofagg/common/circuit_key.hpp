#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <tuple>

#include <cereal/access.hpp>
#include <cereal/types/common.hpp>
#include <fmt/ostream.h>

#include <proofagg/common/types.h>

namespace pagg {
using BatchNumber = pagg_batch_number;
using ProverJobId = pagg_id;

/** @brief Rounds of the aggregation pipeline, in pipeline order.
 *
 * A round consumes only artifacts of earlier rounds. The numeric values are
 * persisted in the ledger and must not change.
 */
enum class AggregationRound : uint8_t {
  BasicCircuits = 0,
  LeafAggregation = 1,
  NodeAggregation = 2,
  Scheduler = 3,
};

const char*
AggregationRoundToStr(AggregationRound round);

bool
AggregationRoundFromInt(int value, AggregationRound& round);

std::ostream&
operator<<(std::ostream& o, AggregationRound round);

/** @brief Identity of one circuit and of the artifacts produced from it.
 *
 * Uniquely determines a blob location. Encoding is a pure function of the
 * fields, so re-putting under the same key overwrites deterministically.
 */
struct CircuitKey {
  BatchNumber batch = 0;
  uint8_t circuitId = 0;
  uint16_t sequenceNumber = 0;
  uint16_t depth = 0;
  AggregationRound round = AggregationRound::BasicCircuits;

  std::string encode() const;

  bool operator==(const CircuitKey& o) const {
    return std::tie(batch, circuitId, sequenceNumber, depth, round) ==
           std::tie(o.batch, o.circuitId, o.sequenceNumber, o.depth, o.round);
  }
  bool operator!=(const CircuitKey& o) const { return !(*this == o); }
  bool operator<(const CircuitKey& o) const {
    return std::tie(batch, round, circuitId, depth, sequenceNumber) <
           std::tie(o.batch, o.round, o.circuitId, o.depth, o.sequenceNumber);
  }

  template<class Archive>
  void serialize(Archive& ar) {
    ar(batch, circuitId, sequenceNumber, depth, round);
  }
};

std::ostream&
operator<<(std::ostream& o, const CircuitKey& key);
}

template<>
struct fmt::formatter<pagg::AggregationRound> : fmt::ostream_formatter {};
template<>
struct fmt::formatter<pagg::CircuitKey> : fmt::ostream_formatter {};
