#include "blockchain/solana/stake.h"
#include "blockchain/solana/program_address.h"
#include "wire_utils.h"

namespace solana_tss
{
namespace blockchain
{
namespace solana
{

static const ed25519_point_t STAKE_PROGRAM_RAW = {
    0x06, 0xa1, 0xd8, 0x17, 0x91, 0x37, 0x54, 0x2a, 0x98, 0x34, 0x37, 0xbd, 0xfe, 0x2a, 0x7a, 0xb2,
    0x55, 0x7f, 0x53, 0x5c, 0x8a, 0x78, 0x72, 0x2b, 0x68, 0xa4, 0x9d, 0xc0, 0x00, 0x00, 0x00, 0x00};

static const ed25519_point_t STAKE_CONFIG_RAW = {
    0x06, 0xa1, 0xd8, 0x17, 0xa5, 0x02, 0x05, 0x0b, 0x68, 0x07, 0x91, 0xe6, 0xce, 0x6d, 0xb8, 0x8e,
    0x1e, 0x5b, 0x71, 0x50, 0xf6, 0x1f, 0xc6, 0x79, 0x0a, 0x4e, 0xb4, 0xd1, 0x00, 0x00, 0x00, 0x00};

static const ed25519_point_t SYSVAR_RENT_RAW = {
    0x06, 0xa7, 0xd5, 0x17, 0x19, 0x2c, 0x5c, 0x51, 0x21, 0x8c, 0xc9, 0x4c, 0x3d, 0x4a, 0xf1, 0x7f,
    0x58, 0xda, 0xee, 0x08, 0x9b, 0xa1, 0xfd, 0x44, 0xe3, 0xdb, 0xd9, 0x8a, 0x00, 0x00, 0x00, 0x00};

static const ed25519_point_t SYSVAR_CLOCK_RAW = {
    0x06, 0xa7, 0xd5, 0x17, 0x18, 0xc7, 0x74, 0xc9, 0x28, 0x56, 0x63, 0x98, 0x69, 0x1d, 0x5e, 0xb6,
    0x8b, 0x5e, 0xb8, 0xa3, 0x9b, 0x4b, 0x6d, 0x5c, 0x73, 0x55, 0x5b, 0x21, 0x00, 0x00, 0x00, 0x00};

static const ed25519_point_t SYSVAR_STAKE_HISTORY_RAW = {
    0x06, 0xa7, 0xd5, 0x17, 0x19, 0x35, 0x84, 0xd0, 0xfe, 0xed, 0x9b, 0xb3, 0x43, 0x1d, 0x13, 0x20,
    0x6b, 0xe5, 0x44, 0x28, 0x1b, 0x57, 0xb8, 0x56, 0x6c, 0xc5, 0x37, 0x5f, 0xf4, 0x00, 0x00, 0x00};

const elliptic_curve_point STAKE_PROGRAM_ID(STAKE_PROGRAM_RAW);
const elliptic_curve_point STAKE_CONFIG_ID(STAKE_CONFIG_RAW);
const elliptic_curve_point SYSVAR_RENT_ID(SYSVAR_RENT_RAW);
const elliptic_curve_point SYSVAR_CLOCK_ID(SYSVAR_CLOCK_RAW);
const elliptic_curve_point SYSVAR_STAKE_HISTORY_ID(SYSVAR_STAKE_HISTORY_RAW);

static instruction stake_instruction(stake_instruction_type type)
{
    instruction ins;
    ins.program_id = STAKE_PROGRAM_ID;
    append_le<uint32_t>(ins.data, type);
    return ins;
}

elliptic_curve_point stake_account_address(const elliptic_curve_point& authority, const std::string& seed)
{
    return create_with_seed(authority, seed, STAKE_PROGRAM_ID);
}

instruction create_account_with_seed_instruction(const elliptic_curve_point& from, const elliptic_curve_point& to, const elliptic_curve_point& base,
    const std::string& seed, uint64_t lamports, uint64_t space, const elliptic_curve_point& owner)
{
    instruction ins;
    ins.program_id = SYSTEM_PROGRAM_ID;
    ins.accounts.push_back(account_meta{from, true, true});
    ins.accounts.push_back(account_meta{to, false, true});
    ins.accounts.push_back(account_meta{base, true, false});

    append_le<uint32_t>(ins.data, SYSTEM_INSTRUCTION_CREATE_ACCOUNT_WITH_SEED);
    append_pubkey(ins.data, base);
    append_string(ins.data, seed);
    append_le<uint64_t>(ins.data, lamports);
    append_le<uint64_t>(ins.data, space);
    append_pubkey(ins.data, owner);
    return ins;
}

instruction initialize_stake_instruction(const elliptic_curve_point& stake_account, const elliptic_curve_point& authority)
{
    instruction ins = stake_instruction(STAKE_INITIALIZE);
    ins.accounts.push_back(account_meta{stake_account, false, true});
    ins.accounts.push_back(account_meta{SYSVAR_RENT_ID, false, false});

    // authorized staker and withdrawer
    append_pubkey(ins.data, authority);
    append_pubkey(ins.data, authority);
    // lockup: unix timestamp, epoch, custodian
    append_le<int64_t>(ins.data, 0);
    append_le<uint64_t>(ins.data, 0);
    append_pubkey(ins.data, elliptic_curve_point());
    return ins;
}

instruction delegate_stake_instruction(const elliptic_curve_point& stake_account, const elliptic_curve_point& authority, const elliptic_curve_point& vote_account)
{
    instruction ins = stake_instruction(STAKE_DELEGATE);
    ins.accounts.push_back(account_meta{stake_account, false, true});
    ins.accounts.push_back(account_meta{vote_account, false, false});
    ins.accounts.push_back(account_meta{SYSVAR_CLOCK_ID, false, false});
    ins.accounts.push_back(account_meta{SYSVAR_STAKE_HISTORY_ID, false, false});
    ins.accounts.push_back(account_meta{STAKE_CONFIG_ID, false, false});
    ins.accounts.push_back(account_meta{authority, true, false});
    return ins;
}

instruction deactivate_stake_instruction(const elliptic_curve_point& stake_account, const elliptic_curve_point& authority)
{
    instruction ins = stake_instruction(STAKE_DEACTIVATE);
    ins.accounts.push_back(account_meta{stake_account, false, true});
    ins.accounts.push_back(account_meta{SYSVAR_CLOCK_ID, false, false});
    ins.accounts.push_back(account_meta{authority, true, false});
    return ins;
}

instruction withdraw_stake_instruction(const elliptic_curve_point& stake_account, const elliptic_curve_point& authority, const elliptic_curve_point& destination, uint64_t lamports)
{
    instruction ins = stake_instruction(STAKE_WITHDRAW);
    ins.accounts.push_back(account_meta{stake_account, false, true});
    ins.accounts.push_back(account_meta{destination, false, true});
    ins.accounts.push_back(account_meta{SYSVAR_CLOCK_ID, false, false});
    ins.accounts.push_back(account_meta{SYSVAR_STAKE_HISTORY_ID, false, false});
    ins.accounts.push_back(account_meta{authority, true, false});
    append_le<uint64_t>(ins.data, lamports);
    return ins;
}

solana_transaction create_unsigned_stake_account(uint64_t stake_lamports, uint64_t rent_exempt_lamports, const std::string& seed,
    const elliptic_curve_point& authority, const elliptic_curve_point& vote_account, const solana_hash_t& recent_blockhash)
{
    elliptic_curve_point stake_account = stake_account_address(authority, seed);
    uint64_t lamports = rent_exempt_lamports + stake_lamports;
    if (lamports < stake_lamports)
        lamports = UINT64_MAX;

    std::vector<instruction> instructions;
    instructions.push_back(create_account_with_seed_instruction(authority, stake_account, authority, seed, lamports, STAKE_STATE_SIZE, STAKE_PROGRAM_ID));
    instructions.push_back(initialize_stake_instruction(stake_account, authority));
    instructions.push_back(delegate_stake_instruction(stake_account, authority, vote_account));
    return solana_transaction::new_unsigned(solana_message::compile(instructions, authority, recent_blockhash));
}

solana_transaction create_unsigned_deactivate_stake(const elliptic_curve_point& stake_account, const elliptic_curve_point& authority, const solana_hash_t& recent_blockhash)
{
    std::vector<instruction> instructions(1, deactivate_stake_instruction(stake_account, authority));
    return solana_transaction::new_unsigned(solana_message::compile(instructions, authority, recent_blockhash));
}

solana_transaction create_unsigned_withdraw_stake(const elliptic_curve_point& stake_account, const elliptic_curve_point& destination,
    const elliptic_curve_point& authority, uint64_t lamports, const solana_hash_t& recent_blockhash)
{
    std::vector<instruction> instructions(1, withdraw_stake_instruction(stake_account, authority, destination, lamports));
    return solana_transaction::new_unsigned(solana_message::compile(instructions, authority, recent_blockhash));
}

}
}
}
