#pragma once

#include "solana_tss_export.h"

#include "blockchain/solana/solana_transaction.h"

#include <string>

namespace solana_tss
{
namespace blockchain
{
namespace solana
{

SOLANA_TSS_EXPORT extern const elliptic_curve_point STAKE_PROGRAM_ID;
SOLANA_TSS_EXPORT extern const elliptic_curve_point STAKE_CONFIG_ID;
SOLANA_TSS_EXPORT extern const elliptic_curve_point SYSVAR_RENT_ID;
SOLANA_TSS_EXPORT extern const elliptic_curve_point SYSVAR_CLOCK_ID;
SOLANA_TSS_EXPORT extern const elliptic_curve_point SYSVAR_STAKE_HISTORY_ID;

// size of the stake program account state
constexpr uint64_t STAKE_STATE_SIZE = 200;
constexpr uint32_t SYSTEM_INSTRUCTION_CREATE_ACCOUNT_WITH_SEED = 3;

enum stake_instruction_type
{
    STAKE_INITIALIZE = 0,
    STAKE_DELEGATE = 2,
    STAKE_WITHDRAW = 4,
    STAKE_DEACTIVATE = 5,
};

// the stake account created by create_unsigned_stake_account for this authority and seed
SOLANA_TSS_EXPORT elliptic_curve_point stake_account_address(const elliptic_curve_point& authority, const std::string& seed);

SOLANA_TSS_EXPORT instruction create_account_with_seed_instruction(const elliptic_curve_point& from, const elliptic_curve_point& to, const elliptic_curve_point& base,
    const std::string& seed, uint64_t lamports, uint64_t space, const elliptic_curve_point& owner);
// authority is both staker and withdrawer, no lockup
SOLANA_TSS_EXPORT instruction initialize_stake_instruction(const elliptic_curve_point& stake_account, const elliptic_curve_point& authority);
SOLANA_TSS_EXPORT instruction delegate_stake_instruction(const elliptic_curve_point& stake_account, const elliptic_curve_point& authority, const elliptic_curve_point& vote_account);
SOLANA_TSS_EXPORT instruction deactivate_stake_instruction(const elliptic_curve_point& stake_account, const elliptic_curve_point& authority);
SOLANA_TSS_EXPORT instruction withdraw_stake_instruction(const elliptic_curve_point& stake_account, const elliptic_curve_point& authority, const elliptic_curve_point& destination, uint64_t lamports);

// creates the stake account from authority and seed with rent_exempt_lamports + stake_lamports and delegates it to vote_account
SOLANA_TSS_EXPORT solana_transaction create_unsigned_stake_account(uint64_t stake_lamports, uint64_t rent_exempt_lamports, const std::string& seed,
    const elliptic_curve_point& authority, const elliptic_curve_point& vote_account, const solana_hash_t& recent_blockhash);
SOLANA_TSS_EXPORT solana_transaction create_unsigned_deactivate_stake(const elliptic_curve_point& stake_account, const elliptic_curve_point& authority, const solana_hash_t& recent_blockhash);
SOLANA_TSS_EXPORT solana_transaction create_unsigned_withdraw_stake(const elliptic_curve_point& stake_account, const elliptic_curve_point& destination,
    const elliptic_curve_point& authority, uint64_t lamports, const solana_hash_t& recent_blockhash);

}
}
}
