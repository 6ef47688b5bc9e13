#ifndef __COMMITMENTS_H__
#define __COMMITMENTS_H__

#include "solana_tss_export.h"

#ifdef __cplusplus
extern "C" {
#endif //__cplusplus

#include <stdint.h>

typedef uint8_t commitments_sha256_t[32];

typedef struct commitments_commitment
{
    commitments_sha256_t salt;
    commitments_sha256_t commitment;
} commitments_commitment_t;

typedef enum
{
    COMMITMENTS_SUCCESS               =  0,
    COMMITMENTS_INTERNAL_ERROR        = -1,
    COMMITMENTS_INVALID_PARAMETER     = -2,
    COMMITMENTS_OUT_OF_MEMORY         = -3,
    COMMITMENTS_INVALID_COMMITMENT    = -5,
} commitments_status;

/* Creates commitment SHA256(salt || data) with a fresh random salt */
SOLANA_TSS_EXPORT commitments_status commitments_create_commitment_for_data(const uint8_t *data, uint32_t data_len, commitments_commitment_t *commitment);
/* Verfies the data commitment */
SOLANA_TSS_EXPORT commitments_status commitments_verify_commitment(const uint8_t *data, uint32_t data_len, const commitments_commitment_t *commitment);

#ifdef __cplusplus
}
#endif //__cplusplus

#endif //__COMMITMENTS_H__
