#pragma once

#include "solana_tss_export.h"

#include "blockchain/solana/solana_transaction.h"

#include <optional>
#include <string>

namespace solana_tss
{
namespace blockchain
{
namespace solana
{

SOLANA_TSS_EXPORT extern const elliptic_curve_point TOKEN_PROGRAM_ID;
SOLANA_TSS_EXPORT extern const elliptic_curve_point ASSOCIATED_TOKEN_PROGRAM_ID;

constexpr uint8_t TOKEN_INSTRUCTION_TRANSFER_CHECKED = 12;
constexpr uint8_t ASSOCIATED_TOKEN_INSTRUCTION_CREATE_IDEMPOTENT = 1;

// packed sizes of the token program accounts
constexpr size_t TOKEN_ACCOUNT_SIZE = 165;
constexpr size_t MINT_ACCOUNT_SIZE = 82;

struct token_account
{
    elliptic_curve_point mint;
    elliptic_curve_point owner;
    uint64_t amount;
};

// the token account owned by the wallet for this mint
SOLANA_TSS_EXPORT elliptic_curve_point associated_token_address(const elliptic_curve_point& wallet, const elliptic_curve_point& mint);

// creates the associated token account of owner, succeeds if it already exists
SOLANA_TSS_EXPORT instruction create_associated_token_account_instruction(const elliptic_curve_point& payer, const elliptic_curve_point& owner, const elliptic_curve_point& mint);
SOLANA_TSS_EXPORT instruction transfer_checked_instruction(const elliptic_curve_point& source, const elliptic_curve_point& mint, const elliptic_curve_point& destination,
    const elliptic_curve_point& owner, uint64_t amount, uint8_t decimals);

// throw INVALID_ACCOUNT_DATA
SOLANA_TSS_EXPORT token_account parse_token_account(const byte_vector_t& data);
SOLANA_TSS_EXPORT uint8_t parse_mint_decimals(const byte_vector_t& data);

// truncates fractions of the smallest unit, saturates
SOLANA_TSS_EXPORT uint64_t to_token_amount(double amount, uint8_t decimals);

// Token transfer between the associated token accounts of owner and to, owner pays the fees.
// The destination account is created first when create_destination is set.
SOLANA_TSS_EXPORT solana_transaction create_unsigned_spl_transfer(double amount, uint8_t decimals, const elliptic_curve_point& to, const elliptic_curve_point& token_mint,
    const std::optional<std::string>& memo, bool create_destination, const elliptic_curve_point& owner, const solana_hash_t& recent_blockhash);

}
}
}
