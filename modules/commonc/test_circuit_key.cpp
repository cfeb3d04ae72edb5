#include <catch2/catch.hpp>

#include <proofagg/common/circuit_key.hpp>

using namespace pagg;

TEST_CASE("Circuit keys encode to blob names", "[commonc][circuit_key]") {
  CircuitKey key{ 42, 1, 0, 0, AggregationRound::Scheduler };
  REQUIRE(key.encode() == "42_0_1_Scheduler_0.bin");
  REQUIRE(key.encode() == CircuitKey(key).encode());

  CircuitKey node{ 7, 3, 2, 1, AggregationRound::NodeAggregation };
  REQUIRE(node.encode() == "7_2_3_NodeAggregation_1.bin");
  REQUIRE(node.encode() != key.encode());

  REQUIRE(fmt::format("{}", AggregationRound::LeafAggregation) ==
          "LeafAggregation");
  REQUIRE(fmt::format("{}", key) ==
          "{batch: 42, circuit: 1, seq: 0, depth: 0, round: Scheduler}");
}

TEST_CASE("Aggregation rounds are read from their persisted value",
          "[commonc][circuit_key]") {
  AggregationRound round = AggregationRound::BasicCircuits;
  REQUIRE(AggregationRoundFromInt(3, round));
  REQUIRE(round == AggregationRound::Scheduler);
  REQUIRE(!AggregationRoundFromInt(4, round));
  REQUIRE(!AggregationRoundFromInt(-1, round));
  REQUIRE(round == AggregationRound::Scheduler);
}
