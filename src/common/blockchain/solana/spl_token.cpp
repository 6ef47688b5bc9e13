#include "blockchain/solana/spl_token.h"
#include "blockchain/solana/program_address.h"
#include "cosigner/cosigner_exception.h"
#include "logging/logging_t.h"
#include "wire_utils.h"

#include <math.h>
#include <string.h>

namespace solana_tss
{
namespace blockchain
{
namespace solana
{

using common::cosigner::cosigner_exception;

static const ed25519_point_t TOKEN_PROGRAM_RAW = {
    0x06, 0xdd, 0xf6, 0xe1, 0xd7, 0x65, 0xa1, 0x93, 0xd9, 0xcb, 0xe1, 0x46, 0xce, 0xeb, 0x79, 0xac,
    0x1c, 0xb4, 0x85, 0xed, 0x5f, 0x5b, 0x37, 0x91, 0x3a, 0x8c, 0xf5, 0x85, 0x7e, 0xff, 0x00, 0xa9};

static const ed25519_point_t ASSOCIATED_TOKEN_PROGRAM_RAW = {
    0x8c, 0x97, 0x25, 0x8f, 0x4e, 0x24, 0x89, 0xf1, 0xbb, 0x3d, 0x10, 0x29, 0x14, 0x8e, 0x0d, 0x83,
    0x0b, 0x5a, 0x13, 0x99, 0xda, 0xff, 0x10, 0x84, 0x04, 0x8e, 0x7b, 0xd8, 0xdb, 0xe9, 0xf8, 0x59};

const elliptic_curve_point TOKEN_PROGRAM_ID(TOKEN_PROGRAM_RAW);
const elliptic_curve_point ASSOCIATED_TOKEN_PROGRAM_ID(ASSOCIATED_TOKEN_PROGRAM_RAW);

// token account layout: mint, owner, amount, ...
static constexpr size_t TOKEN_ACCOUNT_AMOUNT_OFFSET = 64;
// mint layout: COption<authority>, supply, decimals, is_initialized, ...
static constexpr size_t MINT_DECIMALS_OFFSET = 44;
static constexpr size_t MINT_INITIALIZED_OFFSET = 45;

static byte_vector_t to_seed(const elliptic_curve_point& key)
{
    return byte_vector_t(key.data, key.data + sizeof(ed25519_point_t));
}

elliptic_curve_point associated_token_address(const elliptic_curve_point& wallet, const elliptic_curve_point& mint)
{
    std::vector<byte_vector_t> seeds;
    seeds.push_back(to_seed(wallet));
    seeds.push_back(to_seed(TOKEN_PROGRAM_ID));
    seeds.push_back(to_seed(mint));
    return find_program_address(seeds, ASSOCIATED_TOKEN_PROGRAM_ID);
}

instruction create_associated_token_account_instruction(const elliptic_curve_point& payer, const elliptic_curve_point& owner, const elliptic_curve_point& mint)
{
    instruction ins;
    ins.program_id = ASSOCIATED_TOKEN_PROGRAM_ID;
    ins.accounts.push_back(account_meta{payer, true, true});
    ins.accounts.push_back(account_meta{associated_token_address(owner, mint), false, true});
    ins.accounts.push_back(account_meta{owner, false, false});
    ins.accounts.push_back(account_meta{mint, false, false});
    ins.accounts.push_back(account_meta{SYSTEM_PROGRAM_ID, false, false});
    ins.accounts.push_back(account_meta{TOKEN_PROGRAM_ID, false, false});
    ins.data.push_back(ASSOCIATED_TOKEN_INSTRUCTION_CREATE_IDEMPOTENT);
    return ins;
}

instruction transfer_checked_instruction(const elliptic_curve_point& source, const elliptic_curve_point& mint, const elliptic_curve_point& destination,
    const elliptic_curve_point& owner, uint64_t amount, uint8_t decimals)
{
    instruction ins;
    ins.program_id = TOKEN_PROGRAM_ID;
    ins.accounts.push_back(account_meta{source, false, true});
    ins.accounts.push_back(account_meta{mint, false, false});
    ins.accounts.push_back(account_meta{destination, false, true});
    ins.accounts.push_back(account_meta{owner, true, false});

    ins.data.push_back(TOKEN_INSTRUCTION_TRANSFER_CHECKED);
    append_le<uint64_t>(ins.data, amount);
    ins.data.push_back(decimals);
    return ins;
}

token_account parse_token_account(const byte_vector_t& data)
{
    if (data.size() < TOKEN_ACCOUNT_SIZE)
    {
        LOG_ERROR("token account data is %lu bytes, expected %lu", data.size(), TOKEN_ACCOUNT_SIZE);
        throw cosigner_exception(cosigner_exception::INVALID_ACCOUNT_DATA);
    }

    token_account account;
    memcpy(account.mint.data, data.data(), sizeof(ed25519_point_t));
    memcpy(account.owner.data, data.data() + sizeof(ed25519_point_t), sizeof(ed25519_point_t));
    account.amount = 0;
    for (size_t i = 0; i < sizeof(uint64_t); ++i)
        account.amount |= (uint64_t)data[TOKEN_ACCOUNT_AMOUNT_OFFSET + i] << (8 * i);
    return account;
}

uint8_t parse_mint_decimals(const byte_vector_t& data)
{
    if (data.size() < MINT_ACCOUNT_SIZE || data[MINT_INITIALIZED_OFFSET] != 1)
    {
        LOG_ERROR("invalid mint account data of %lu bytes", data.size());
        throw cosigner_exception(cosigner_exception::INVALID_ACCOUNT_DATA);
    }
    return data[MINT_DECIMALS_OFFSET];
}

uint64_t to_token_amount(double amount, uint8_t decimals)
{
    if (!(amount > 0))
        return 0;
    double units = amount * pow(10.0, decimals);
    if (units >= 18446744073709551615.0)
        return UINT64_MAX;
    return (uint64_t)units;
}

solana_transaction create_unsigned_spl_transfer(double amount, uint8_t decimals, const elliptic_curve_point& to, const elliptic_curve_point& token_mint,
    const std::optional<std::string>& memo, bool create_destination, const elliptic_curve_point& owner, const solana_hash_t& recent_blockhash)
{
    std::vector<instruction> instructions;
    if (create_destination)
        instructions.push_back(create_associated_token_account_instruction(owner, to, token_mint));
    instructions.push_back(transfer_checked_instruction(associated_token_address(owner, token_mint), token_mint, associated_token_address(to, token_mint),
        owner, to_token_amount(amount, decimals), decimals));
    if (memo)
        instructions.push_back(memo_instruction(*memo));
    return solana_transaction::new_unsigned(solana_message::compile(instructions, owner, recent_blockhash));
}

}
}
}
