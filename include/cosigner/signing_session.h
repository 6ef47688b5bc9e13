#pragma once

#include "solana_tss_export.h"

#include "cosigner/types.h"

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace solana_tss
{
namespace common
{
namespace cosigner
{

enum signing_session_status
{
    AWAITING_COMMIT,
    AWAITING_PARTIAL,
    AGGREGATED,
    EXPIRED,
    CANCELLED,
};

SOLANA_TSS_EXPORT const char* to_string(signing_session_status status);

struct signing_session
{
    std::string id;
    // the deterministic identity, see signing_session_identity
    std::string identity;
    byte_vector_t message;
    std::vector<elliptic_curve_point> participant_keys;
    elliptic_curve_point self_key;
    elliptic_curve_point aggregated_key;
    elliptic_curve_scalar self_coefficient;

    elliptic_curve_scalar local_nonce_secret;
    bool has_nonce_secret = false;
    elliptic_curve_point local_nonce_point;
    commitment local_nonce_commitment;

    std::map<elliptic_curve_point, commitment> remote_commitments;
    std::map<elliptic_curve_point, elliptic_curve_point> remote_nonce_points;
    elliptic_curve_point aggregate_nonce_point;
    std::map<elliptic_curve_point, elliptic_curve_scalar> partial_signatures;

    signing_session_status status = AWAITING_COMMIT;
    uint64_t created_at_msec = 0;
    uint64_t last_activity_msec = 0;

    // guards every field above, held by locked_session
    std::mutex lock;

    signing_session() {}
    signing_session(const signing_session&) = delete;
    signing_session& operator=(const signing_session&) = delete;
    ~signing_session() {wipe_secret();}

    void wipe_secret()
    {
        OPENSSL_cleanse(local_nonce_secret.data, sizeof(ed25519_le_scalar_t));
        has_nonce_secret = false;
    }

    bool is_live() const {return status == AWAITING_COMMIT || status == AWAITING_PARTIAL;}
};

// hex(SHA256(message || sorted participant keys || self key)), at most one live session exists per identity
SOLANA_TSS_EXPORT std::string signing_session_identity(const byte_vector_t& message, const std::vector<elliptic_curve_point>& keys, const elliptic_curve_point& self_key);

}
}
}
