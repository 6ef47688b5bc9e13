#include "blockchain/solana/rpc_service.h"
#include "cosigner/cosigner_exception.h"
#include "logging/logging_t.h"

#include <strings.h>

namespace solana_tss
{
namespace blockchain
{
namespace solana
{

using common::cosigner::cosigner_exception;

rpc_service::~rpc_service()
{
}

std::string rpc_service::endpoint(solana_network network) const
{
    return cluster_url(network);
}

solana_network parse_network(const std::string& name)
{
    if (strcasecmp(name.c_str(), "mainnet") == 0)
        return MAINNET;
    if (strcasecmp(name.c_str(), "testnet") == 0)
        return TESTNET;
    if (strcasecmp(name.c_str(), "devnet") == 0)
        return DEVNET;
    LOG_ERROR("Unrecognized network: %s", name.c_str());
    throw cosigner_exception(cosigner_exception::INVALID_NETWORK);
}

const char* to_string(solana_network network)
{
    switch (network)
    {
    case MAINNET: return "mainnet";
    case TESTNET: return "testnet";
    case DEVNET: return "devnet";
    default:
        return "UNKNOWN";
    }
}

const char* cluster_url(solana_network network)
{
    switch (network)
    {
    case MAINNET: return "https://api.mainnet-beta.solana.com";
    case TESTNET: return "https://api.testnet.solana.com";
    case DEVNET: return "https://api.devnet.solana.com";
    default:
        LOG_ERROR("Unknown network %d", (int)network);
        throw cosigner_exception(cosigner_exception::INVALID_NETWORK);
    }
}

}
}
}
