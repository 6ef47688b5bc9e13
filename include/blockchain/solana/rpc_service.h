#pragma once

#include "solana_tss_export.h"

#include "blockchain/solana/solana_keypair.h"

#include <optional>
#include <string>
#include <vector>

namespace solana_tss
{
namespace blockchain
{
namespace solana
{

enum solana_network
{
    MAINNET,
    TESTNET,
    DEVNET,
};

// accepts mainnet/testnet/devnet in any case, throws INVALID_NETWORK
SOLANA_TSS_EXPORT solana_network parse_network(const std::string& name);
SOLANA_TSS_EXPORT const char* to_string(solana_network network);
SOLANA_TSS_EXPORT const char* cluster_url(solana_network network);

// blockchain node access, implementations throw cosigner_exception(RPC_FAILED) on failure
class SOLANA_TSS_EXPORT rpc_service
{
public:
    virtual ~rpc_service();

    // node url used for the network, the public cluster by default
    virtual std::string endpoint(solana_network network) const;

    virtual uint64_t get_balance(const elliptic_curve_point& address, solana_network network) = 0;
    // returns the airdrop transaction signature
    virtual std::string request_airdrop(const elliptic_curve_point& to, uint64_t lamports, solana_network network) = 0;
    virtual solana_hash_t get_latest_blockhash(solana_network network) = 0;
    // account data, nullopt if the account doesn't exist
    virtual std::optional<std::vector<uint8_t>> get_account_data(const elliptic_curve_point& address, solana_network network) = 0;
    virtual uint64_t get_minimum_balance_for_rent_exemption(size_t data_len, solana_network network) = 0;
    // returns the transaction signature as reported by the node
    virtual std::string send_transaction(const std::vector<uint8_t>& serialized_transaction, solana_network network) = 0;
    // blocks until the transaction is confirmed or its blockhash expires
    virtual void confirm_transaction(const std::string& signature, const solana_hash_t& recent_blockhash, solana_network network) = 0;
};

}
}
}
