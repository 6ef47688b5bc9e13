#include "blockchain/solana/transaction_assembler.h"
#include "cosigner/cosigner_exception.h"
#include "logging/logging_t.h"

namespace solana_tss
{
namespace blockchain
{
namespace solana
{

using common::cosigner::cosigner_exception;

const std::unique_ptr<ed25519_algebra_ctx_t, void(*)(ed25519_algebra_ctx_t*)> transaction_assembler::_ed25519(ed25519_algebra_ctx_new(), ed25519_algebra_ctx_free);

byte_vector_t transaction_assembler::attach_signature(solana_transaction& tx, const elliptic_curve_point& signer, const eddsa_signature& signature, const byte_vector_t& signed_message)
{
    if (!_ed25519)
    {
        LOG_ERROR("Failed to create ed25519 algebra");
        throw cosigner_exception(cosigner_exception::NO_MEM);
    }

    size_t slot = tx.message.header.num_required_signatures;
    for (size_t i = 0; i < tx.message.header.num_required_signatures && i < tx.message.account_keys.size(); ++i)
    {
        if (tx.message.account_keys[i] == signer)
        {
            slot = i;
            break;
        }
    }
    if (slot >= tx.message.header.num_required_signatures || tx.signatures.size() != tx.message.header.num_required_signatures)
    {
        LOG_ERROR("signer %s isn't a required signer of the transaction", to_string(signer).c_str());
        throw cosigner_exception(cosigner_exception::INVALID_TRANSACTION);
    }

    byte_vector_t message = tx.message.serialize();
    if (message != signed_message)
    {
        LOG_ERROR("the signed message doesn't match the transaction message");
        throw cosigner_exception(cosigner_exception::MESSAGE_MISMATCH);
    }

    tx.signatures[slot] = signature.serialize();
    byte_vector_t serialized = tx.serialize();

    // check what is actually going to be sent
    solana_transaction parsed = solana_transaction::parse(serialized);
    byte_vector_t parsed_message = parsed.message.serialize();
    if (!ed25519_verify(_ed25519.get(), parsed_message.data(), parsed_message.size(), parsed.signatures[slot].data(), parsed.message.account_keys[slot].data))
    {
        LOG_FATAL("signature of %s doesn't verify against the transaction", to_string(signer).c_str());
        throw cosigner_exception(cosigner_exception::SIGNATURE_VERIFICATION_FAILED);
    }
    return serialized;
}

std::string transaction_assembler::broadcast(rpc_service& rpc, solana_network network, const byte_vector_t& serialized_transaction)
{
    try
    {
        std::string signature = rpc.send_transaction(serialized_transaction, network);
        LOG_INFO("transaction %s sent to %s (%s)", signature.c_str(), to_string(network), rpc.endpoint(network).c_str());
        return signature;
    }
    catch (const cosigner_exception& e)
    {
        if (e.error_code() != cosigner_exception::RPC_FAILED)
            throw;
        LOG_ERROR("Failed sending transaction to %s (%s), error %s", to_string(network), rpc.endpoint(network).c_str(), e.what());
        throw cosigner_exception(cosigner_exception::BROADCAST_FAILED);
    }
}

}
}
}
