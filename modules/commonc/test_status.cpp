#include <catch2/catch.hpp>

#include <sstream>

#include <proofagg/common/log.h>
#include <proofagg/common/status.h>

TEST_CASE("Input contract violations are never retried", "[commonc][status]") {
  for(pagg_status s : { PAGG_UNEXPECTED_ARTIFACT_KIND,
                        PAGG_DEPENDENCY_COUNT_MISMATCH,
                        PAGG_LAYER_PARAMETER_COUNT_MISMATCH,
                        PAGG_CAPACITY_EXCEEDED }) {
    CHECK(pagg_status_is_input_contract_violation(s));
    CHECK(!pagg_status_is_retryable(s));
  }

  for(pagg_status s : { PAGG_STORAGE_ERROR,
                        PAGG_OBJECT_NOT_FOUND,
                        PAGG_SERIALIZATION_ERROR,
                        PAGG_DATABASE_ERROR,
                        PAGG_TRANSACTION_ERROR,
                        PAGG_WORKER_ERROR }) {
    CHECK(!pagg_status_is_input_contract_violation(s));
    CHECK(pagg_status_is_retryable(s));
  }

  CHECK(!pagg_status_is_retryable(PAGG_OK));
}

TEST_CASE("Status codes print their description", "[commonc][status]") {
  std::stringstream s;
  s << PAGG_CAPACITY_EXCEEDED;
  REQUIRE(s.str() == "capacity exceeded");
  REQUIRE(fmt::format("{}", PAGG_OBJECT_NOT_FOUND) == "object not found");
}
