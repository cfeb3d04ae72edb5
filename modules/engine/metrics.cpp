#include <proofagg/common/log.h>
#include <proofagg/engine/metrics.hpp>

namespace pagg::engine {
MetricsSink::~MetricsSink() {}
LogMetricsSink::~LogMetricsSink() {}

void
LogMetricsSink::observe(std::string_view name,
                        AggregationRound round,
                        std::chrono::nanoseconds duration) {
  pagg_log(PAGG_ENGINE,
           PAGG_DEBUG,
           "{}{{aggregation_round=\"{}\"}} {:.3f}ms",
           name,
           round,
           std::chrono::duration<double, std::milli>(duration).count());
}
}
