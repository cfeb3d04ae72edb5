#ifndef PROOFAGG_COMMON_TYPES_H
#define PROOFAGG_COMMON_TYPES_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

typedef uint64_t pagg_id;
typedef uint32_t pagg_worker;
typedef uint32_t pagg_batch_number;

#ifdef __cplusplus
}
#endif

#endif
