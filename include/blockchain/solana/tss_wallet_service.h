#pragma once

#include "solana_tss_export.h"

#include "blockchain/solana/rpc_service.h"
#include "blockchain/solana/solana_transaction.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace solana_tss
{
namespace common
{
namespace cosigner
{
class aggregated_eddsa_signing_service;
class platform_service;
}
}

namespace blockchain
{
namespace solana
{

struct generated_keypair
{
    std::string secret_share;
    std::string public_share;
};

// all points, scalars and commitments are base58 encoded
struct agg_step_one_result
{
    std::string session_id;
    std::string nonce_point;
    std::string nonce_commitment;
};

struct agg_step_two_result
{
    std::string aggregate_nonce_point;
    std::string partial_signature;
};

struct token_balance
{
    std::string address;
    std::string token_mint;
    uint64_t amount;
    uint8_t decimals;
};

struct stake_result
{
    std::string stake_account;
    std::string transaction_id;
};

struct agg_signatures_result
{
    byte_vector_t signed_transaction;
    std::string transaction_id;
};

// Wallet operations, keys and hashes are base58 strings as used by solana tools
class SOLANA_TSS_EXPORT tss_wallet_service final
{
public:
    tss_wallet_service(const common::cosigner::platform_service& service, common::cosigner::aggregated_eddsa_signing_service& signing_service, rpc_service& rpc);

    generated_keypair generate_keypair();
    uint64_t balance(const std::string& address, solana_network network);
    std::string airdrop(const std::string& to, double amount, solana_network network);
    std::string recent_block_hash(solana_network network);
    std::string send_single(const std::string& keypair, double amount, const std::string& to, const std::optional<std::string>& memo, solana_network network);

    // balance of the owner's associated token account, throws ACCOUNT_NOT_FOUND if it doesn't exist
    token_balance spl_token_balance(const std::string& owner, const std::string& token_mint, solana_network network);
    // decimals are read from the mint, the destination token account is created if missing
    std::string spl_send_single(const std::string& keypair, double amount, const std::string& to, const std::string& token_mint, const std::optional<std::string>& memo, solana_network network);

    std::string stake_account_address(const std::string& authority, const std::string& seed);
    // creates a stake account from the keypair and seed and delegates amount SOL to vote_account
    stake_result stake(const std::string& keypair, double amount, const std::string& seed, const std::string& vote_account, solana_network network);
    std::string deactivate_stake(const std::string& keypair, const std::string& stake_account, solana_network network);
    std::string withdraw_stake(const std::string& keypair, const std::string& stake_account, const std::string& to, double amount, solana_network network);

    std::string aggregate_keys(const std::vector<std::string>& keys);
    // builds the transfer from the aggregated key and starts signing its message
    agg_step_one_result agg_send_step_one(const std::string& keypair, double amount, const std::string& to, const std::optional<std::string>& memo,
        const std::string& recent_block_hash, const std::vector<std::string>& keys);
    // Token transfer from the aggregated key. The destination token account is always created idempotently,
    // so every party builds the same message without asking the node.
    agg_step_one_result spl_agg_send_step_one(const std::string& keypair, double amount, uint8_t decimals, const std::string& to, const std::string& token_mint,
        const std::optional<std::string>& memo, const std::string& recent_block_hash, const std::vector<std::string>& keys);
    // rent_exempt_lamports must be the same for every party, see stake_rent_exemption
    agg_step_one_result agg_stake_step_one(const std::string& keypair, double amount, uint64_t rent_exempt_lamports, const std::string& seed, const std::string& vote_account,
        const std::string& recent_block_hash, const std::vector<std::string>& keys);
    agg_step_one_result agg_deactivate_stake_step_one(const std::string& keypair, const std::string& stake_account, const std::string& recent_block_hash, const std::vector<std::string>& keys);
    agg_step_one_result agg_withdraw_stake_step_one(const std::string& keypair, const std::string& stake_account, const std::string& to, double amount,
        const std::string& recent_block_hash, const std::vector<std::string>& keys);
    uint64_t stake_rent_exemption(solana_network network);

    // commit-reveal only, commitments are keyed by signer public key, returns this party's nonce point
    std::string agg_send_reveal_nonce(const std::string& session_id, const std::map<std::string, std::string>& commitments);
    // nonce points are keyed by signer public key
    agg_step_two_result agg_send_step_two(const std::string& keypair, const std::string& session_id, const std::map<std::string, std::string>& remote_nonce_points);
    // partial signatures are keyed by signer public key, broadcasts the signed transaction
    agg_signatures_result aggregate_signatures(const std::string& session_id, const std::map<std::string, std::string>& partial_signatures, solana_network network);
    void cancel(const std::string& session_id);

private:
    agg_step_one_result start_aggregated(const ed25519_keypair& signer, const solana_transaction& tx, const std::vector<elliptic_curve_point>& keys);
    std::string sign_and_send(const ed25519_keypair& signer, solana_transaction tx, solana_network network);

    const common::cosigner::platform_service& _service;
    common::cosigner::aggregated_eddsa_signing_service& _signing_service;
    rpc_service& _rpc;

    static const std::unique_ptr<ed25519_algebra_ctx_t, void(*)(ed25519_algebra_ctx_t*)> _ed25519;
};

}
}
}
