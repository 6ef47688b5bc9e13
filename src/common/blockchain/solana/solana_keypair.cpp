#include "blockchain/solana/solana_keypair.h"
#include "blockchain/solana/base58.h"
#include "cosigner/cosigner_exception.h"
#include "cosigner/platform_service.h"
#include "logging/logging_t.h"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>

#include <memory>

namespace solana_tss
{
namespace blockchain
{
namespace solana
{

using common::cosigner::cosigner_exception;

ed25519_keypair keypair_from_seed(const ed25519_seed_t& seed)
{
    std::unique_ptr<EVP_PKEY, void(*)(EVP_PKEY*)> pkey(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, NULL, seed, sizeof(ed25519_seed_t)), EVP_PKEY_free);
    if (!pkey)
    {
        LOG_ERROR("failed to load ed25519 private key, error %lu", ERR_get_error());
        throw cosigner_exception(cosigner_exception::INTERNAL_ERROR);
    }

    ed25519_keypair keypair;
    size_t len = sizeof(ed25519_point_t);
    if (!EVP_PKEY_get_raw_public_key(pkey.get(), keypair.public_key.data, &len) || len != sizeof(ed25519_point_t))
    {
        LOG_ERROR("failed to derive ed25519 public key, error %lu", ERR_get_error());
        throw cosigner_exception(cosigner_exception::INTERNAL_ERROR);
    }
    memcpy(keypair.seed, seed, sizeof(ed25519_seed_t));
    return keypair;
}

ed25519_keypair generate_keypair(const common::cosigner::platform_service& service)
{
    ed25519_seed_t seed;
    service.gen_random(sizeof(ed25519_seed_t), seed);
    ed25519_keypair keypair = keypair_from_seed(seed);
    OPENSSL_cleanse(seed, sizeof(ed25519_seed_t));
    return keypair;
}

ed25519_keypair parse_keypair(const std::string& base58)
{
    uint8_t raw[SOLANA_KEYPAIR_SIZE];
    base58_decode_fixed(base58, raw, sizeof(raw));

    ed25519_seed_t seed;
    memcpy(seed, raw, sizeof(ed25519_seed_t));
    ed25519_keypair keypair = keypair_from_seed(seed);
    OPENSSL_cleanse(seed, sizeof(ed25519_seed_t));

    bool match = memcmp(keypair.public_key.data, raw + ED25519_SEED_LEN, sizeof(ed25519_point_t)) == 0;
    OPENSSL_cleanse(raw, sizeof(raw));
    if (!match)
    {
        LOG_ERROR("keypair public key doesn't match its private key");
        throw cosigner_exception(cosigner_exception::BAD_KEY);
    }
    return keypair;
}

std::string serialize_keypair(const ed25519_keypair& keypair)
{
    uint8_t raw[SOLANA_KEYPAIR_SIZE];
    memcpy(raw, keypair.seed, sizeof(ed25519_seed_t));
    memcpy(raw + ED25519_SEED_LEN, keypair.public_key.data, sizeof(ed25519_point_t));
    std::string ret = base58_encode(raw, sizeof(raw));
    OPENSSL_cleanse(raw, sizeof(raw));
    return ret;
}

elliptic_curve_point parse_pubkey(const std::string& base58)
{
    elliptic_curve_point pubkey;
    base58_decode_fixed(base58, pubkey.data, sizeof(ed25519_point_t));
    return pubkey;
}

std::string to_string(const elliptic_curve_point& pubkey)
{
    return base58_encode(pubkey.data, sizeof(ed25519_point_t));
}

solana_hash_t parse_hash(const std::string& base58)
{
    solana_hash_t hash;
    base58_decode_fixed(base58, hash.data(), hash.size());
    return hash;
}

std::string to_string(const solana_hash_t& hash)
{
    return base58_encode(hash.data(), hash.size());
}

}
}
}
