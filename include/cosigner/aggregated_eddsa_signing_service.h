#pragma once

#include "solana_tss_export.h"

#include "cosigner/types.h"
#include "cosigner/mpc_globals.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace solana_tss
{
namespace common
{
namespace cosigner
{

class platform_service;
class signing_session_store;

struct signing_start_result
{
    std::string session_id;
    // set when using DIRECT_NONCE_EXCHANGE, in COMMIT_REVEAL_NONCE_EXCHANGE it's returned by store_commitments
    elliptic_curve_point nonce_point;
    // set when using COMMIT_REVEAL_NONCE_EXCHANGE
    commitment nonce_commitment;
};

struct partial_signature_result
{
    elliptic_curve_point aggregate_nonce_point;
    elliptic_curve_scalar partial_signature;
};

struct aggregated_signature_result
{
    eddsa_signature signature;
    elliptic_curve_point aggregated_key;
    byte_vector_t message;
};

// Multi party ed25519 signing, every party runs its own instance:
// start_signing -> [store_commitments] -> partial_sign -> aggregate_signatures
// The resulting signature verifies against the aggregated key using standard ed25519 verification
class SOLANA_TSS_EXPORT aggregated_eddsa_signing_service final
{
public:
    aggregated_eddsa_signing_service(const platform_service& service, signing_session_store& store, const signing_config& config = signing_config());

    elliptic_curve_point aggregate_keys(const std::vector<elliptic_curve_point>& keys) const;

    signing_start_result start_signing(const byte_vector_t& message, const std::vector<elliptic_curve_point>& keys, const elliptic_curve_point& self_key);
    // commit-reveal only, commitments must contain all other participants, returns this party's nonce point
    elliptic_curve_point store_commitments(const std::string& session_id, const std::map<elliptic_curve_point, commitment>& commitments);
    partial_signature_result partial_sign(const std::string& session_id, const std::map<elliptic_curve_point, elliptic_curve_point>& remote_nonce_points, const ed25519_keypair& keypair);
    // two parties only
    partial_signature_result partial_sign(const std::string& session_id, const elliptic_curve_point& remote_nonce_point, const ed25519_keypair& keypair);
    aggregated_signature_result aggregate_signatures(const std::string& session_id, const std::map<elliptic_curve_point, elliptic_curve_scalar>& partial_signatures);

    void cancel_signing(const std::string& session_id);
    // throws SESSION_NOT_FOUND if there is no live session for this message and key set
    std::string find_session(const byte_vector_t& message, const std::vector<elliptic_curve_point>& keys, const elliptic_curve_point& self_key);

    const signing_config& config() const {return _config;}

private:
    static byte_vector_t build_commitment_data(const elliptic_curve_point& signer, const elliptic_curve_point& nonce_point);

    const platform_service& _service;
    signing_session_store& _store;
    const signing_config _config;

    static const std::unique_ptr<ed25519_algebra_ctx_t, void(*)(ed25519_algebra_ctx_t*)> _ed25519;
};

}
}
}
