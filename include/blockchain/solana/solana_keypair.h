#pragma once

#include "solana_tss_export.h"

#include "cosigner/types.h"

#include <array>
#include <string>

namespace solana_tss
{
namespace common
{
namespace cosigner
{
class platform_service;
}
}

namespace blockchain
{
namespace solana
{

using common::cosigner::ed25519_keypair;
using common::cosigner::elliptic_curve_point;

typedef std::array<uint8_t, 32> solana_hash_t;

// solana keypairs are serialized as seed || public key, 64 bytes
constexpr size_t SOLANA_KEYPAIR_SIZE = ED25519_SEED_LEN + ED25519_COMPRESSED_POINT_LEN;

SOLANA_TSS_EXPORT ed25519_keypair keypair_from_seed(const ed25519_seed_t& seed);
SOLANA_TSS_EXPORT ed25519_keypair generate_keypair(const common::cosigner::platform_service& service);

// throws DECODING_ERROR for bad encoding and BAD_KEY if the public key doesn't match the seed
SOLANA_TSS_EXPORT ed25519_keypair parse_keypair(const std::string& base58);
SOLANA_TSS_EXPORT std::string serialize_keypair(const ed25519_keypair& keypair);

SOLANA_TSS_EXPORT elliptic_curve_point parse_pubkey(const std::string& base58);
SOLANA_TSS_EXPORT std::string to_string(const elliptic_curve_point& pubkey);
SOLANA_TSS_EXPORT solana_hash_t parse_hash(const std::string& base58);
SOLANA_TSS_EXPORT std::string to_string(const solana_hash_t& hash);

}
}
}
