#pragma once

#include "solana_tss_export.h"

#include "blockchain/solana/solana_keypair.h"

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace solana_tss
{
namespace blockchain
{
namespace solana
{

using common::cosigner::byte_vector_t;

typedef std::array<uint8_t, ED25519_SIGNATURE_LEN> solana_signature_t;

constexpr uint64_t LAMPORTS_PER_SOL = 1000000000;
constexpr uint32_t SYSTEM_INSTRUCTION_TRANSFER = 2;

SOLANA_TSS_EXPORT extern const elliptic_curve_point SYSTEM_PROGRAM_ID;
SOLANA_TSS_EXPORT extern const elliptic_curve_point MEMO_PROGRAM_ID;

struct account_meta
{
    elliptic_curve_point pubkey;
    bool is_signer;
    bool is_writable;
};

struct instruction
{
    elliptic_curve_point program_id;
    std::vector<account_meta> accounts;
    byte_vector_t data;
};

struct compiled_instruction
{
    uint8_t program_id_index;
    std::vector<uint8_t> accounts;
    byte_vector_t data;
};

struct message_header
{
    uint8_t num_required_signatures;
    uint8_t num_readonly_signed_accounts;
    uint8_t num_readonly_unsigned_accounts;
};

// legacy transaction message
struct SOLANA_TSS_EXPORT solana_message
{
    message_header header;
    std::vector<elliptic_curve_point> account_keys;
    solana_hash_t recent_blockhash;
    std::vector<compiled_instruction> instructions;

    // the payer is the first account and always a writable signer, the other accounts are ordered
    // writable signers, readonly signers, writable non signers, readonly non signers
    static solana_message compile(const std::vector<instruction>& instructions, const elliptic_curve_point& payer, const solana_hash_t& recent_blockhash);
    // throws INVALID_TRANSACTION if data isn't exactly one message
    static solana_message parse(const byte_vector_t& data);

    byte_vector_t serialize() const;
    bool is_signer(size_t index) const {return index < header.num_required_signatures;}
};

struct SOLANA_TSS_EXPORT solana_transaction
{
    std::vector<solana_signature_t> signatures;
    solana_message message;

    // all signatures are zeroed
    static solana_transaction new_unsigned(const solana_message& message);
    // throws INVALID_TRANSACTION
    static solana_transaction parse(const byte_vector_t& data);

    byte_vector_t serialize() const;
    // the first signature, base58 encoded
    std::string id() const;
};

SOLANA_TSS_EXPORT instruction transfer_instruction(const elliptic_curve_point& from, const elliptic_curve_point& to, uint64_t lamports);
SOLANA_TSS_EXPORT instruction memo_instruction(const std::string& memo);
// truncates fractions of a lamport
SOLANA_TSS_EXPORT uint64_t sol_to_lamports(double sol);

// transfer from payer to the destination, followed by a memo instruction if a memo is given
SOLANA_TSS_EXPORT solana_transaction create_unsigned_transfer(double amount, const elliptic_curve_point& to, const std::optional<std::string>& memo, const elliptic_curve_point& payer, const solana_hash_t& recent_blockhash);

}
}
}
