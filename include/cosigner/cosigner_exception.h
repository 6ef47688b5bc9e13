#pragma once

#include "solana_tss_export.h"

#include "crypto/commitments/commitments.h"
#include "crypto/elliptic_curve_algebra/elliptic_curve_algebra_status.h"

#include <exception>
#include <string>

namespace solana_tss
{
namespace common
{
namespace cosigner
{

class SOLANA_TSS_EXPORT cosigner_exception : public std::exception
{
public:
    enum exception_code
    {
        GENERIC_ERROR,
        INTERNAL_ERROR,
        NO_MEM,

        // input validation
        INVALID_PARAMETERS,
        DECODING_ERROR,
        INVALID_MESSAGE,
        INVALID_KEY_SET,
        DUPLICATE_KEY,
        KEY_NOT_IN_KEY_SET,
        BAD_KEY,
        INVALID_NETWORK,
        INVALID_TRANSACTION,
        MESSAGE_MISMATCH,
        INVALID_ACCOUNT_DATA,

        // protocol state
        SESSION_NOT_FOUND,
        SESSION_BUSY,
        DUPLICATE_SESSION,
        NONCE_ALREADY_CONSUMED,
        SESSION_IMMUTABLE,
        OUT_OF_ORDER_REQUEST,
        INVALID_COMMITMENT,

        // cryptographic
        INCOMPLETE_SIGNATURE_SET,
        SIGNATURE_VERIFICATION_FAILED,

        // external
        RPC_FAILED,
        BROADCAST_FAILED,
        ACCOUNT_NOT_FOUND,
    };

    cosigner_exception(exception_code err) : _err(err) {}
    ~cosigner_exception();

    const char* what() const noexcept override
    {
        switch (_err)
        {
            case INTERNAL_ERROR: return "Internal error has occurred";
            case NO_MEM: return "Out of memory";
            case INVALID_PARAMETERS: return "Invalid parameter";
            case DECODING_ERROR: return "Malformed or non canonical point or scalar encoding";
            case INVALID_MESSAGE: return "The message to sign is empty or too long";
            case INVALID_KEY_SET: return "At least two distinct public keys are required";
            case DUPLICATE_KEY: return "The key set contains the same public key more than once";
            case KEY_NOT_IN_KEY_SET: return "The provided key is not in the list of public keys";
            case BAD_KEY: return "The private key doesn't match the session public key";
            case INVALID_NETWORK: return "Unrecognized network, please select mainnet/testnet/devnet";
            case INVALID_TRANSACTION: return "Malformed transaction";
            case MESSAGE_MISMATCH: return "The signed message doesn't match the transaction message";
            case INVALID_ACCOUNT_DATA: return "Account data doesn't match the expected layout";
            case SESSION_NOT_FOUND: return "Unknown or expired signing session";
            case SESSION_BUSY: return "The signing session is being processed by another request, try later";
            case DUPLICATE_SESSION: return "A signing session for this message and key set is already in progress";
            case NONCE_ALREADY_CONSUMED: return "The session nonce was already used, start a new session";
            case SESSION_IMMUTABLE: return "The signing session was already aggregated";
            case OUT_OF_ORDER_REQUEST: return "The request is not valid in the current session state";
            case INVALID_COMMITMENT: return "Nonce point doesn't match its commitment";
            case INCOMPLETE_SIGNATURE_SET: return "Partial signatures are missing for some participants";
            case SIGNATURE_VERIFICATION_FAILED: return "The resulting signature doesn't verify";
            case RPC_FAILED: return "Blockchain rpc request failed";
            case BROADCAST_FAILED: return "Failed sending transaction";
            case ACCOUNT_NOT_FOUND: return "The account doesn't exist";
            case GENERIC_ERROR:
            default: return "Unexpected error";
        }
    }
    exception_code error_code() const {return _err;}

    // true when the session can't make progress anymore and the client should start a new one
    bool retry_with_new_session() const
    {
        switch (_err)
        {
            case SESSION_NOT_FOUND:
            case NONCE_ALREADY_CONSUMED:
            case SIGNATURE_VERIFICATION_FAILED:
            case BROADCAST_FAILED:
                return true;
            default:
                return false;
        }
    }

private:
    const exception_code _err;
};

SOLANA_TSS_EXPORT void throw_cosigner_exception(elliptic_curve_algebra_status status);
SOLANA_TSS_EXPORT void throw_cosigner_exception(commitments_status status);

}
}
}
