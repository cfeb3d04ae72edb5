#include <proofagg/common/status.h>

const char*
pagg_status_to_str(pagg_status status) {
  switch(status) {
    case PAGG_OK:
      return "ok";
    case PAGG_PENDING:
      return "pending";
    case PAGG_ABORTED:
      return "aborted";
    case PAGG_STORAGE_ERROR:
      return "storage error";
    case PAGG_OBJECT_NOT_FOUND:
      return "object not found";
    case PAGG_SERIALIZATION_ERROR:
      return "serialization error";
    case PAGG_DATABASE_ERROR:
      return "database error";
    case PAGG_TRANSACTION_ERROR:
      return "transaction error";
    case PAGG_JOB_NOT_FOUND:
      return "job not found";
    case PAGG_WORKER_ERROR:
      return "worker error";
    case PAGG_FILE_NOT_FOUND_ERROR:
      return "file not found";
    case PAGG_PARSE_ERROR:
      return "parse error";
    case PAGG_UNEXPECTED_ARTIFACT_KIND:
      return "unexpected artifact kind";
    case PAGG_DEPENDENCY_COUNT_MISMATCH:
      return "dependency count mismatch";
    case PAGG_LAYER_PARAMETER_COUNT_MISMATCH:
      return "layer parameter count mismatch";
    case PAGG_CAPACITY_EXCEEDED:
      return "capacity exceeded";
    case PAGG_GENERIC_ERROR:
      return "generic error";
  }
  return "unknown status";
}

bool
pagg_status_is_input_contract_violation(pagg_status status) {
  switch(status) {
    case PAGG_UNEXPECTED_ARTIFACT_KIND:
    case PAGG_DEPENDENCY_COUNT_MISMATCH:
    case PAGG_LAYER_PARAMETER_COUNT_MISMATCH:
    case PAGG_CAPACITY_EXCEEDED:
      return true;
    default:
      return false;
  }
}

bool
pagg_status_is_retryable(pagg_status status) {
  return status != PAGG_OK && !pagg_status_is_input_contract_violation(status);
}
