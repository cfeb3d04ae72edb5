#include <proofagg/common/log.h>
#include <proofagg/queue/ledger.hpp>

namespace pagg::queue {
const char*
WitnessJobStatusToStr(WitnessJobStatus status) {
  switch(status) {
    case WitnessJobStatus::Queued:
      return "queued";
    case WitnessJobStatus::Picked:
      return "picked";
    case WitnessJobStatus::InProgress:
      return "in_progress";
    case WitnessJobStatus::Successful:
      return "successful";
    case WitnessJobStatus::Failed:
      return "failed";
  }
  return "unknown";
}

bool
WitnessJobStatusFromStr(std::string_view str, WitnessJobStatus& status) {
  for(auto s : { WitnessJobStatus::Queued,
                 WitnessJobStatus::Picked,
                 WitnessJobStatus::InProgress,
                 WitnessJobStatus::Successful,
                 WitnessJobStatus::Failed }) {
    if(str == WitnessJobStatusToStr(s)) {
      status = s;
      return true;
    }
  }
  return false;
}

std::ostream&
operator<<(std::ostream& o, WitnessJobStatus status) {
  return o << WitnessJobStatusToStr(status);
}

JobLedger::~JobLedger() {}

LedgerTransaction::LedgerTransaction(JobLedger& ledger)
  : m_ledger(ledger) {}

LedgerTransaction::~LedgerTransaction() {
  if(m_active) {
    pagg_status s = rollback();
    if(s != PAGG_OK) {
      pagg_log(PAGG_QUEUE,
               PAGG_LOCALERROR,
               "Could not roll back abandoned transaction! Status: {}",
               s);
    }
  }
}

pagg_status
LedgerTransaction::begin() {
  if(m_active)
    return PAGG_TRANSACTION_ERROR;
  pagg_status s = m_ledger.beginTransaction();
  if(s == PAGG_OK)
    m_active = true;
  return s;
}

pagg_status
LedgerTransaction::commit() {
  if(!m_active)
    return PAGG_TRANSACTION_ERROR;
  pagg_status s = m_ledger.commit();
  if(s == PAGG_OK)
    m_active = false;
  return s;
}

pagg_status
LedgerTransaction::rollback() {
  if(!m_active)
    return PAGG_TRANSACTION_ERROR;
  m_active = false;
  return m_ledger.rollback();
}
}
