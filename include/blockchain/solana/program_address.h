#pragma once

#include "solana_tss_export.h"

#include "blockchain/solana/solana_keypair.h"

#include <string>
#include <vector>

namespace solana_tss
{
namespace blockchain
{
namespace solana
{

constexpr size_t MAX_SEED_LEN = 32;
constexpr size_t MAX_SEEDS = 16;

// sha256(base || seed || owner), throws INVALID_PARAMETERS for seeds longer than MAX_SEED_LEN
SOLANA_TSS_EXPORT elliptic_curve_point create_with_seed(const elliptic_curve_point& base, const std::string& seed, const elliptic_curve_point& owner);

// Returns the first address off the ed25519 curve derived from the seeds and a bump seed,
// bump seeds are tried from 255 down. Throws INVALID_PARAMETERS for too many or too long seeds.
SOLANA_TSS_EXPORT elliptic_curve_point find_program_address(const std::vector<common::cosigner::byte_vector_t>& seeds, const elliptic_curve_point& program_id, uint8_t* bump = NULL);

}
}
}
