#pragma once

#include "crypto/ed25519_algebra/ed25519_algebra.h"
#include "crypto/commitments/commitments.h"

#include <openssl/crypto.h>
#include <string.h>

#include <array>
#include <string>
#include <vector>

namespace solana_tss
{
namespace common
{
namespace cosigner
{

typedef std::vector<uint8_t> byte_vector_t;

struct elliptic_curve_point
{
    ed25519_point_t data;
    elliptic_curve_point() {memset(&data, 0, sizeof(ed25519_point_t));}
    explicit elliptic_curve_point(const ed25519_point_t& point) {memcpy(&data, point, sizeof(ed25519_point_t));}

    bool operator==(const elliptic_curve_point& other) const {return memcmp(data, other.data, sizeof(ed25519_point_t)) == 0;}
    bool operator!=(const elliptic_curve_point& other) const {return !(*this == other);}
    bool operator<(const elliptic_curve_point& other) const {return memcmp(data, other.data, sizeof(ed25519_point_t)) < 0;}
};

struct elliptic_curve_scalar
{
    ed25519_le_scalar_t data;
    elliptic_curve_scalar() {memset(&data, 0, sizeof(ed25519_le_scalar_t));}
    elliptic_curve_scalar(const elliptic_curve_scalar& other) {memcpy(&data, other.data, sizeof(ed25519_le_scalar_t));}
    elliptic_curve_scalar& operator=(const elliptic_curve_scalar& other) {memcpy(&data, other.data, sizeof(ed25519_le_scalar_t)); return *this;}
    ~elliptic_curve_scalar() {OPENSSL_cleanse(&data, sizeof(ed25519_le_scalar_t));}

    bool operator==(const elliptic_curve_scalar& other) const {return CRYPTO_memcmp(data, other.data, sizeof(ed25519_le_scalar_t)) == 0;}
    bool operator!=(const elliptic_curve_scalar& other) const {return !(*this == other);}
};

struct commitment
{
    commitment() {memset(&data, 0, sizeof(commitments_commitment_t));}
    commitment(const commitments_commitment_t* hash) {memcpy(&data, hash, sizeof(commitments_commitment_t));}
    commitments_commitment_t data;
};

// the private key reference of a participant, seed is the RFC8032 private key
struct ed25519_keypair
{
    ed25519_seed_t seed;
    elliptic_curve_point public_key;
    ed25519_keypair() {memset(&seed, 0, sizeof(ed25519_seed_t));}
    ed25519_keypair(const ed25519_keypair& other) : public_key(other.public_key) {memcpy(&seed, other.seed, sizeof(ed25519_seed_t));}
    ed25519_keypair& operator=(const ed25519_keypair& other) {memcpy(&seed, other.seed, sizeof(ed25519_seed_t)); public_key = other.public_key; return *this;}
    ~ed25519_keypair() {OPENSSL_cleanse(&seed, sizeof(ed25519_seed_t));}
};

struct eddsa_signature
{
    ed25519_point_t R;
    ed25519_le_scalar_t s;

    std::array<uint8_t, ED25519_SIGNATURE_LEN> serialize() const
    {
        std::array<uint8_t, ED25519_SIGNATURE_LEN> raw;
        memcpy(raw.data(), R, sizeof(ed25519_point_t));
        memcpy(raw.data() + sizeof(ed25519_point_t), s, sizeof(ed25519_le_scalar_t));
        return raw;
    }
};

}
}
}
