#pragma once

#include "solana_tss_export.h"

#include "blockchain/solana/rpc_service.h"
#include "blockchain/solana/solana_transaction.h"

#include <memory>
#include <string>

namespace solana_tss
{
namespace blockchain
{
namespace solana
{

using common::cosigner::eddsa_signature;

class SOLANA_TSS_EXPORT transaction_assembler final
{
public:
    // Places signature in the slot of signer and returns the serialized transaction.
    // signed_message must be the transaction's message bytes (MESSAGE_MISMATCH), the signer must be one of
    // the required signers (INVALID_TRANSACTION) and the signature is verified against the reparsed wire
    // format (SIGNATURE_VERIFICATION_FAILED)
    static byte_vector_t attach_signature(solana_transaction& tx, const elliptic_curve_point& signer, const eddsa_signature& signature, const byte_vector_t& signed_message);

    // sends the transaction, RPC failures become BROADCAST_FAILED. Returns the signature reported by the node
    static std::string broadcast(rpc_service& rpc, solana_network network, const byte_vector_t& serialized_transaction);

private:
    static const std::unique_ptr<ed25519_algebra_ctx_t, void(*)(ed25519_algebra_ctx_t*)> _ed25519;
};

}
}
}
