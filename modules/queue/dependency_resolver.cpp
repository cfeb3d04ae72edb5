#include <proofagg/common/log.h>
#include <proofagg/queue/dependency_resolver.hpp>
#include <proofagg/queue/ledger.hpp>

namespace pagg::queue {
DependencyResolver::DependencyResolver(JobLedger& ledger)
  : m_ledger(ledger) {}
DependencyResolver::~DependencyResolver() {}

void
DependencyResolver::setExpectedCount(AggregationRound round, uint32_t count) {
  m_expectedCounts[round] = count;
}

pagg_status
DependencyResolver::resolve(AggregationRound round,
                            BatchNumber batch,
                            std::vector<CircuitKey>& out) const {
  out.clear();

  auto expected = m_expectedCounts.find(round);
  if(expected == m_expectedCounts.end()) {
    pagg_log(PAGG_QUEUE,
             PAGG_LOCALERROR,
             "No dependency count configured for {} jobs, cannot resolve "
             "batch {}!",
             round,
             batch);
    return PAGG_DEPENDENCY_COUNT_MISMATCH;
  }

  std::vector<ProverJobId> ids;
  pagg_status s = m_ledger.getDependencyJobIds(round, batch, ids);
  if(s != PAGG_OK)
    return s;

  if(ids.size() != expected->second) {
    pagg_log(PAGG_QUEUE,
             PAGG_LOCALERROR,
             "{} job of batch {} has {} dependencies, expected {}!",
             round,
             batch,
             ids.size(),
             expected->second);
    return PAGG_DEPENDENCY_COUNT_MISMATCH;
  }

  out.reserve(ids.size());
  for(ProverJobId id : ids) {
    CircuitKey key;
    s = m_ledger.getProverJobKey(id, key);
    if(s == PAGG_JOB_NOT_FOUND) {
      pagg_log(PAGG_QUEUE,
               PAGG_LOCALERROR,
               "{} job of batch {} depends on unknown prover job {}!",
               round,
               batch,
               id);
      out.clear();
      return PAGG_DEPENDENCY_COUNT_MISMATCH;
    }
    if(s != PAGG_OK) {
      out.clear();
      return s;
    }
    out.push_back(key);
  }

  pagg_log(PAGG_QUEUE,
           PAGG_TRACE,
           "Resolved {} dependencies of {} job of batch {}.",
           out.size(),
           round,
           batch);
  return PAGG_OK;
}
}
