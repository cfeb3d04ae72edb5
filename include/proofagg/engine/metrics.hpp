#pragma once

#include <chrono>
#include <string_view>

#include <proofagg/common/circuit_key.hpp>

namespace pagg::engine {
namespace metrics {
constexpr const char* BlobFetchTime =
  "prover_fri.witness_generation.blob_fetch_time";
constexpr const char* PrepareJobTime =
  "prover_fri.witness_generation.prepare_job_time";
constexpr const char* WitnessGenerationTime =
  "prover_fri.witness_generation.witness_generation_time";
constexpr const char* BlobSaveTime =
  "prover_fri.witness_generation.blob_save_time";
}

/** @brief Receiver of timing samples, labelled by aggregation round. */
class MetricsSink {
  public:
  virtual ~MetricsSink();

  virtual void observe(std::string_view name,
                       AggregationRound round,
                       std::chrono::nanoseconds duration) = 0;
};

/** @brief Writes every sample to the Engine log channel at DEBUG. */
class LogMetricsSink : public MetricsSink {
  public:
  virtual ~LogMetricsSink();

  void observe(std::string_view name,
               AggregationRound round,
               std::chrono::nanoseconds duration) override;
};
}
