#ifndef PROOFAGG_COMMON_STATUS_H
#define PROOFAGG_COMMON_STATUS_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdbool.h>

typedef enum pagg_status {
  PAGG_OK,
  PAGG_PENDING,
  PAGG_ABORTED,
  PAGG_STORAGE_ERROR,
  PAGG_OBJECT_NOT_FOUND,
  PAGG_SERIALIZATION_ERROR,
  PAGG_DATABASE_ERROR,
  PAGG_TRANSACTION_ERROR,
  PAGG_JOB_NOT_FOUND,
  PAGG_WORKER_ERROR,
  PAGG_FILE_NOT_FOUND_ERROR,
  PAGG_PARSE_ERROR,

  // Input-contract violations. Retrying does not help with these.
  PAGG_UNEXPECTED_ARTIFACT_KIND,
  PAGG_DEPENDENCY_COUNT_MISMATCH,
  PAGG_LAYER_PARAMETER_COUNT_MISMATCH,
  PAGG_CAPACITY_EXCEEDED,

  PAGG_GENERIC_ERROR
} pagg_status;

const char*
pagg_status_to_str(pagg_status status);

bool
pagg_status_is_input_contract_violation(pagg_status status);

/** @brief True if a job failing with this status may be requeued.
 */
bool
pagg_status_is_retryable(pagg_status status);

#ifdef __cplusplus
}

#include <iostream>

inline std::ostream&
operator<<(std::ostream& o, pagg_status status) {
  return o << pagg_status_to_str(status);
}
#endif

#endif
