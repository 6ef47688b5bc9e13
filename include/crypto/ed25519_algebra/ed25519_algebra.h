#ifndef __ED25519_ALGEBRA_H__
#define __ED25519_ALGEBRA_H__

#include "solana_tss_export.h"

#include "crypto/elliptic_curve_algebra/elliptic_curve_algebra_status.h"
#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif //__cplusplus

#define ED25519_FIELD_SIZE 32
#define ED25519_COMPRESSED_POINT_LEN 32
#define ED25519_SIGNATURE_LEN 64
#define ED25519_SEED_LEN 32

/* The group order L = 2^252 + 27742317777372353535851937790883648493, little endian */
SOLANA_TSS_EXPORT extern const uint8_t ED25519_ORDER[];

typedef struct ed25519_algebra_ctx ed25519_algebra_ctx_t;
typedef uint8_t ed25519_point_t[ED25519_COMPRESSED_POINT_LEN];
typedef uint8_t ed25519_le_scalar_t[ED25519_FIELD_SIZE];
typedef uint8_t ed25519_le_large_scalar_t[ED25519_FIELD_SIZE * 2];
typedef uint8_t ed25519_seed_t[ED25519_SEED_LEN];

/* Initializes libsodium, returns NULL if it can't be initialized */
SOLANA_TSS_EXPORT ed25519_algebra_ctx_t *ed25519_algebra_ctx_new();
SOLANA_TSS_EXPORT void ed25519_algebra_ctx_free(ed25519_algebra_ctx_t *ctx);

/* Verifies that point is a canonical encoding of a point on the ed25519 curve */
SOLANA_TSS_EXPORT elliptic_curve_algebra_status ed25519_algebra_is_point_on_curve(const ed25519_algebra_ctx_t *ctx, const ed25519_point_t *point);
/* Accepts only points of the prime order subgroup, rejects the identity, the small order points and points with a torsion component */
SOLANA_TSS_EXPORT elliptic_curve_algebra_status ed25519_algebra_validate_public_key(const ed25519_algebra_ctx_t *ctx, const ed25519_point_t *point);
/* Returns g^exp over the ed25519 curve, exp is any 256bit little endian number */
SOLANA_TSS_EXPORT elliptic_curve_algebra_status ed25519_algebra_generator_mul(const ed25519_algebra_ctx_t *ctx, ed25519_point_t *res, const ed25519_le_scalar_t *exp);
/* Adds p1 and p2 points over the ed25519 curve */
SOLANA_TSS_EXPORT elliptic_curve_algebra_status ed25519_algebra_add_points(const ed25519_algebra_ctx_t *ctx, ed25519_point_t *res, const ed25519_point_t *p1, const ed25519_point_t *p2);
/* Computes p^exp over the ed25519 curve, p must be the identity or a point of the prime order subgroup */
SOLANA_TSS_EXPORT elliptic_curve_algebra_status ed25519_algebra_point_mul(const ed25519_algebra_ctx_t *ctx, ed25519_point_t *res, const ed25519_point_t *p, const ed25519_le_scalar_t *exp);

/* Returns ELLIPTIC_CURVE_ALGEBRA_INVALID_SCALAR if val >= ED25519_ORDER */
SOLANA_TSS_EXPORT elliptic_curve_algebra_status ed25519_algebra_is_canonical_scalar(const ed25519_algebra_ctx_t *ctx, const ed25519_le_scalar_t *val);
/* Adds a and b over the ed25519 order */
SOLANA_TSS_EXPORT elliptic_curve_algebra_status ed25519_algebra_add_scalars(const ed25519_algebra_ctx_t *ctx, ed25519_le_scalar_t *res, const ed25519_le_scalar_t *a, const ed25519_le_scalar_t *b);
/* Multiplies a and b over the ed25519 order */
SOLANA_TSS_EXPORT elliptic_curve_algebra_status ed25519_algebra_mul_scalars(const ed25519_algebra_ctx_t *ctx, ed25519_le_scalar_t *res, const ed25519_le_scalar_t *a, const ed25519_le_scalar_t *b);
/* Computes a * b + c over the ed25519 order */
SOLANA_TSS_EXPORT elliptic_curve_algebra_status ed25519_algebra_mul_add(const ed25519_algebra_ctx_t *ctx, ed25519_le_scalar_t *res, const ed25519_le_scalar_t *a, const ed25519_le_scalar_t *b, const ed25519_le_scalar_t *c);
/* Computes s % ED25519_ORDER */
SOLANA_TSS_EXPORT elliptic_curve_algebra_status ed25519_algebra_reduce(const ed25519_algebra_ctx_t *ctx, ed25519_le_scalar_t *res, const ed25519_le_large_scalar_t *s);
/* Returns a random number over the ed25519 order, zero is returned as ELLIPTIC_CURVE_ALGEBRA_INVALID_SCALAR */
SOLANA_TSS_EXPORT elliptic_curve_algebra_status ed25519_algebra_rand(const ed25519_algebra_ctx_t *ctx, ed25519_le_scalar_t *res);

/* Calculates SHA512(data) and reduces the result to the ed25519 order */
SOLANA_TSS_EXPORT elliptic_curve_algebra_status ed25519_algebra_hash_to_scalar(const ed25519_algebra_ctx_t *ctx, ed25519_le_scalar_t *res, const uint8_t *data, uint32_t data_len);
/* Calculates H(RAM) the hash of R || public key || message and reduces the result to the ed25519 order */
SOLANA_TSS_EXPORT elliptic_curve_algebra_status ed25519_calc_hram(const ed25519_algebra_ctx_t *ctx, ed25519_le_scalar_t *hram, const ed25519_point_t *R, const ed25519_point_t *public_key, const uint8_t *message, uint32_t message_size);
/* Expands a RFC8032 private seed into the clamped signing scalar */
SOLANA_TSS_EXPORT elliptic_curve_algebra_status ed25519_algebra_expand_seed(ed25519_le_scalar_t *res, const ed25519_seed_t *seed);

/* RFC8032 signature of message using the private seed, the public key is derived from the seed */
SOLANA_TSS_EXPORT elliptic_curve_algebra_status ed25519_algebra_sign(const ed25519_algebra_ctx_t *ctx, uint8_t signature[ED25519_SIGNATURE_LEN], const ed25519_seed_t *seed, const uint8_t *message, uint32_t message_size);

/* Verifies the signature using the message and public_key key, returns 1 if the signature is valid */
SOLANA_TSS_EXPORT int ed25519_verify(const ed25519_algebra_ctx_t *ctx, const uint8_t *message, size_t message_len, const uint8_t signature[ED25519_SIGNATURE_LEN], const uint8_t public_key[ED25519_COMPRESSED_POINT_LEN]);

#ifdef __cplusplus
}
#endif //__cplusplus

#endif //#ifndef __ED25519_ALGEBRA_H__
