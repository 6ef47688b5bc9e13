#include "cosigner/aggregated_eddsa_signing_service.h"
#include "cosigner/cosigner_exception.h"
#include "cosigner/key_aggregation.h"
#include "cosigner/platform_service.h"
#include "cosigner/signing_session_store.h"
#include "utils.h"
#include "logging/logging_t.h"

#include <inttypes.h>
#include <openssl/crypto.h>

namespace solana_tss
{
namespace common
{
namespace cosigner
{

const std::unique_ptr<ed25519_algebra_ctx_t, void(*)(ed25519_algebra_ctx_t*)> aggregated_eddsa_signing_service::_ed25519(ed25519_algebra_ctx_new(), ed25519_algebra_ctx_free);

aggregated_eddsa_signing_service::aggregated_eddsa_signing_service(const platform_service& service, signing_session_store& store, const signing_config& config) :
    _service(service),
    _store(store),
    _config(config)
{
    if (!_ed25519)
    {
        LOG_ERROR("Failed to create ed25519 algebra");
        throw cosigner_exception(cosigner_exception::NO_MEM);
    }
    if (config.nonce_exchange != DIRECT_NONCE_EXCHANGE && config.nonce_exchange != COMMIT_REVEAL_NONCE_EXCHANGE)
    {
        LOG_ERROR("unknown nonce exchange mode %d", config.nonce_exchange);
        throw cosigner_exception(cosigner_exception::INVALID_PARAMETERS);
    }
}

elliptic_curve_point aggregated_eddsa_signing_service::aggregate_keys(const std::vector<elliptic_curve_point>& keys) const
{
    return key_aggregation(keys).aggregated_public_key();
}

signing_start_result aggregated_eddsa_signing_service::start_signing(const byte_vector_t& message, const std::vector<elliptic_curve_point>& keys, const elliptic_curve_point& self_key)
{
    if (message.empty() || message.size() > MAX_MESSAGE_SIZE)
    {
        LOG_ERROR("invalid message size %lu", message.size());
        throw cosigner_exception(cosigner_exception::INVALID_MESSAGE);
    }

    key_aggregation aggregation(keys);
    if (!aggregation.contains(self_key))
    {
        LOG_ERROR("self key is not part of the %lu participant keys", keys.size());
        throw cosigner_exception(cosigner_exception::KEY_NOT_IN_KEY_SET);
    }

    std::shared_ptr<signing_session> session = std::make_shared<signing_session>();
    session->id = generate_session_id(_service);
    session->identity = signing_session_identity(message, keys, self_key);
    session->message = message;
    session->participant_keys = keys;
    session->self_key = self_key;
    session->aggregated_key = aggregation.aggregated_public_key();
    session->self_coefficient = aggregation.coefficient(self_key);

    LOG_INFO("Entering session id = %s", session->id.c_str());

    elliptic_curve_algebra_status status = ELLIPTIC_CURVE_ALGEBRA_UNKNOWN_ERROR;
    size_t j = 0;
    while (j < 1024 && status != ELLIPTIC_CURVE_ALGEBRA_SUCCESS)
    {
        j++;
        status = ed25519_algebra_rand(_ed25519.get(), &session->local_nonce_secret.data);
    }

    if (status != ELLIPTIC_CURVE_ALGEBRA_SUCCESS)
    {
        LOG_ERROR("Failed to generate nonce");
        throw cosigner_exception(cosigner_exception::INTERNAL_ERROR);
    }
    session->has_nonce_secret = true;
    throw_cosigner_exception(ed25519_algebra_generator_mul(_ed25519.get(), &session->local_nonce_point.data, &session->local_nonce_secret.data));

    signing_start_result result;
    result.session_id = session->id;
    if (_config.nonce_exchange == COMMIT_REVEAL_NONCE_EXCHANGE)
    {
        byte_vector_t data = build_commitment_data(self_key, session->local_nonce_point);
        throw_cosigner_exception(commitments_create_commitment_for_data(data.data(), data.size(), &session->local_nonce_commitment.data));
        result.nonce_commitment = session->local_nonce_commitment;
    }
    else
        result.nonce_point = session->local_nonce_point;

    session->status = AWAITING_COMMIT;
    session->created_at_msec = session->last_activity_msec = _service.now_msec();
    _store.create_session(session);

    LOG_INFO("Started signing session %s, %lu participants, message size %lu", result.session_id.c_str(), keys.size(), message.size());
    return result;
}

elliptic_curve_point aggregated_eddsa_signing_service::store_commitments(const std::string& session_id, const std::map<elliptic_curve_point, commitment>& commitments)
{
    LOG_INFO("Entering session id = %s", session_id.c_str());
    locked_session session = _store.lock_session(session_id);

    if (_config.nonce_exchange != COMMIT_REVEAL_NONCE_EXCHANGE)
    {
        LOG_ERROR("commitments are only exchanged in commit-reveal mode");
        throw cosigner_exception(cosigner_exception::OUT_OF_ORDER_REQUEST);
    }
    if (session->status == AGGREGATED || session->status == CANCELLED)
    {
        LOG_ERROR("session %s is %s", session_id.c_str(), to_string(session->status));
        throw cosigner_exception(cosigner_exception::SESSION_IMMUTABLE);
    }
    if (session->status != AWAITING_COMMIT || !session->remote_commitments.empty())
    {
        LOG_ERROR("session %s is %s, commitments already stored", session_id.c_str(), to_string(session->status));
        throw cosigner_exception(cosigner_exception::OUT_OF_ORDER_REQUEST);
    }

    std::map<elliptic_curve_point, commitment> remote;
    for (auto i = commitments.begin(); i != commitments.end(); ++i)
    {
        if (i->first == session->self_key)
        {
            if (CRYPTO_memcmp(&i->second.data, &session->local_nonce_commitment.data, sizeof(commitments_commitment_t)) != 0)
            {
                LOG_ERROR("got a different commitment for my own key");
                throw cosigner_exception(cosigner_exception::INVALID_PARAMETERS);
            }
            continue;
        }
        bool found = false;
        for (auto key = session->participant_keys.begin(); key != session->participant_keys.end(); ++key)
            found |= *key == i->first;
        if (!found)
        {
            LOG_ERROR("got commitment from a key which isn't part of session %s", session_id.c_str());
            throw cosigner_exception(cosigner_exception::INVALID_PARAMETERS);
        }
        remote[i->first] = i->second;
    }

    if (remote.size() != session->participant_keys.size() - 1)
    {
        LOG_ERROR("got %lu commitments, expected %lu", remote.size(), session->participant_keys.size() - 1);
        throw cosigner_exception(cosigner_exception::INVALID_PARAMETERS);
    }

    session->remote_commitments.swap(remote);
    session->last_activity_msec = _service.now_msec();
    return session->local_nonce_point;
}

partial_signature_result aggregated_eddsa_signing_service::partial_sign(const std::string& session_id, const std::map<elliptic_curve_point, elliptic_curve_point>& remote_nonce_points, const ed25519_keypair& keypair)
{
    LOG_INFO("Entering session id = %s", session_id.c_str());
    locked_session session = _store.lock_session(session_id);

    if (session->status == AGGREGATED || session->status == CANCELLED)
    {
        LOG_ERROR("session %s is %s", session_id.c_str(), to_string(session->status));
        throw cosigner_exception(cosigner_exception::SESSION_IMMUTABLE);
    }
    if (session->status != AWAITING_COMMIT || !session->has_nonce_secret)
    {
        LOG_ERROR("the nonce of session %s was already used", session_id.c_str());
        throw cosigner_exception(cosigner_exception::NONCE_ALREADY_CONSUMED);
    }
    if (_config.nonce_exchange == COMMIT_REVEAL_NONCE_EXCHANGE && session->remote_commitments.empty())
    {
        LOG_ERROR("session %s didn't receive the nonce commitments yet", session_id.c_str());
        throw cosigner_exception(cosigner_exception::OUT_OF_ORDER_REQUEST);
    }

    // from this point the nonce is consumed, whatever the result is
    elliptic_curve_scalar r(session->local_nonce_secret);
    session->wipe_secret();
    session->status = AWAITING_PARTIAL;
    session->last_activity_msec = _service.now_msec();

    if (keypair.public_key != session->self_key)
    {
        LOG_ERROR("the signing key is not the session key");
        throw cosigner_exception(cosigner_exception::BAD_KEY);
    }
    elliptic_curve_scalar x;
    throw_cosigner_exception(ed25519_algebra_expand_seed(&x.data, &keypair.seed));
    elliptic_curve_point derived;
    throw_cosigner_exception(ed25519_algebra_generator_mul(_ed25519.get(), &derived.data, &x.data));
    if (derived != keypair.public_key)
    {
        LOG_ERROR("the private key doesn't match the session key");
        throw cosigner_exception(cosigner_exception::BAD_KEY);
    }

    std::map<elliptic_curve_point, elliptic_curve_point> remote;
    for (auto i = remote_nonce_points.begin(); i != remote_nonce_points.end(); ++i)
    {
        if (i->first == session->self_key)
        {
            if (i->second != session->local_nonce_point)
            {
                LOG_ERROR("got a different nonce point for my own key");
                throw cosigner_exception(cosigner_exception::INVALID_PARAMETERS);
            }
            continue;
        }
        bool found = false;
        for (auto key = session->participant_keys.begin(); key != session->participant_keys.end(); ++key)
            found |= *key == i->first;
        if (!found)
        {
            LOG_ERROR("got nonce point from a key which isn't part of session %s", session_id.c_str());
            throw cosigner_exception(cosigner_exception::INVALID_PARAMETERS);
        }
        throw_cosigner_exception(ed25519_algebra_validate_public_key(_ed25519.get(), &i->second.data));

        if (_config.nonce_exchange == COMMIT_REVEAL_NONCE_EXCHANGE)
        {
            auto commit = session->remote_commitments.find(i->first);
            if (commit == session->remote_commitments.end())
            {
                LOG_ERROR("missing commitment for nonce point");
                throw cosigner_exception(cosigner_exception::INVALID_COMMITMENT);
            }
            byte_vector_t data = build_commitment_data(i->first, i->second);
            if (commitments_verify_commitment(data.data(), data.size(), &commit->second.data) != COMMITMENTS_SUCCESS)
            {
                LOG_ERROR("failed to verify nonce commitment in session %s", session_id.c_str());
                throw cosigner_exception(cosigner_exception::INVALID_COMMITMENT);
            }
        }
        remote[i->first] = i->second;
    }

    if (remote.size() != session->participant_keys.size() - 1)
    {
        LOG_ERROR("got %lu nonce points, expected %lu", remote.size(), session->participant_keys.size() - 1);
        throw cosigner_exception(cosigner_exception::INVALID_PARAMETERS);
    }

    elliptic_curve_point R(session->local_nonce_point);
    for (auto i = remote.begin(); i != remote.end(); ++i)
        throw_cosigner_exception(ed25519_algebra_add_points(_ed25519.get(), &R.data, &R.data, &i->second.data));

    elliptic_curve_scalar e;
    throw_cosigner_exception(ed25519_calc_hram(_ed25519.get(), &e.data, &R.data, &session->aggregated_key.data, session->message.data(), session->message.size()));
    throw_cosigner_exception(ed25519_algebra_mul_scalars(_ed25519.get(), &e.data, &e.data, &session->self_coefficient.data));

    partial_signature_result result;
    throw_cosigner_exception(ed25519_algebra_mul_add(_ed25519.get(), &result.partial_signature.data, &e.data, &x.data, &r.data));
    result.aggregate_nonce_point = R;

    session->remote_nonce_points.swap(remote);
    session->aggregate_nonce_point = R;
    session->partial_signatures[session->self_key] = result.partial_signature;
    return result;
}

partial_signature_result aggregated_eddsa_signing_service::partial_sign(const std::string& session_id, const elliptic_curve_point& remote_nonce_point, const ed25519_keypair& keypair)
{
    elliptic_curve_point remote_key;
    {
        locked_session session = _store.lock_session(session_id);
        if (session->participant_keys.size() != 2)
        {
            LOG_ERROR("session %s has %lu participants, a single nonce point was supplied", session_id.c_str(), session->participant_keys.size());
            throw cosigner_exception(cosigner_exception::INVALID_PARAMETERS);
        }
        remote_key = session->participant_keys[0] == session->self_key ? session->participant_keys[1] : session->participant_keys[0];
    }

    std::map<elliptic_curve_point, elliptic_curve_point> remote_nonce_points;
    remote_nonce_points[remote_key] = remote_nonce_point;
    return partial_sign(session_id, remote_nonce_points, keypair);
}

aggregated_signature_result aggregated_eddsa_signing_service::aggregate_signatures(const std::string& session_id, const std::map<elliptic_curve_point, elliptic_curve_scalar>& partial_signatures)
{
    LOG_INFO("Entering session id = %s", session_id.c_str());
    locked_session session = _store.lock_session(session_id);

    if (session->status == AGGREGATED || session->status == CANCELLED)
    {
        LOG_ERROR("session %s is %s", session_id.c_str(), to_string(session->status));
        throw cosigner_exception(cosigner_exception::SESSION_IMMUTABLE);
    }
    if (session->status != AWAITING_PARTIAL || session->partial_signatures.find(session->self_key) == session->partial_signatures.end())
    {
        LOG_ERROR("session %s is %s, partial signature wasn't computed yet", session_id.c_str(), to_string(session->status));
        throw cosigner_exception(cosigner_exception::OUT_OF_ORDER_REQUEST);
    }

    std::map<elliptic_curve_point, elliptic_curve_scalar> signatures(session->partial_signatures);
    for (auto i = partial_signatures.begin(); i != partial_signatures.end(); ++i)
    {
        bool found = false;
        for (auto key = session->participant_keys.begin(); key != session->participant_keys.end(); ++key)
            found |= *key == i->first;
        if (!found)
        {
            LOG_ERROR("got partial signature from a key which isn't part of session %s", session_id.c_str());
            throw cosigner_exception(cosigner_exception::INVALID_PARAMETERS);
        }
        throw_cosigner_exception(ed25519_algebra_is_canonical_scalar(_ed25519.get(), &i->second.data));

        if (i->first == session->self_key)
        {
            if (i->second != session->partial_signatures[session->self_key])
            {
                LOG_ERROR("missmatch between my stored partial signature and the supplied one");
                throw cosigner_exception(cosigner_exception::INVALID_PARAMETERS);
            }
            continue;
        }
        signatures[i->first] = i->second;
    }

    if (signatures.size() != session->participant_keys.size())
    {
        LOG_ERROR("got %lu partial signatures, expected %lu", signatures.size(), session->participant_keys.size());
        throw cosigner_exception(cosigner_exception::INCOMPLETE_SIGNATURE_SET);
    }

    elliptic_curve_scalar s_sum;
    for (auto i = signatures.begin(); i != signatures.end(); ++i)
        throw_cosigner_exception(ed25519_algebra_add_scalars(_ed25519.get(), &s_sum.data, &s_sum.data, &i->second.data));

    aggregated_signature_result result;
    memcpy(result.signature.R, session->aggregate_nonce_point.data, sizeof(ed25519_point_t));
    memcpy(result.signature.s, s_sum.data, sizeof(ed25519_le_scalar_t));

    std::array<uint8_t, ED25519_SIGNATURE_LEN> raw_sig = result.signature.serialize();
    if (!ed25519_verify(_ed25519.get(), session->message.data(), session->message.size(), raw_sig.data(), session->aggregated_key.data))
    {
        LOG_FATAL("failed to verify aggregated signature for session %s", session_id.c_str());
        session->status = CANCELLED;
        session->partial_signatures.clear();
        _store.remove_session(session_id);
        throw cosigner_exception(cosigner_exception::SIGNATURE_VERIFICATION_FAILED);
    }

    session->partial_signatures.swap(signatures);
    session->status = AGGREGATED;
    session->wipe_secret();
    session->last_activity_msec = _service.now_msec();

    result.aggregated_key = session->aggregated_key;
    result.message = session->message;
    LOG_INFO("Finished signing session %s with %lu participants in %" PRIu64 "ms", session_id.c_str(), session->participant_keys.size(), session->last_activity_msec - session->created_at_msec);
    return result;
}

void aggregated_eddsa_signing_service::cancel_signing(const std::string& session_id)
{
    LOG_INFO("Entering session id = %s", session_id.c_str());
    locked_session session = _store.lock_session(session_id);
    if (session->status == AGGREGATED)
    {
        LOG_ERROR("session %s was already aggregated", session_id.c_str());
        throw cosigner_exception(cosigner_exception::SESSION_IMMUTABLE);
    }
    session->status = CANCELLED;
    session->wipe_secret();
    _store.remove_session(session_id);
}

std::string aggregated_eddsa_signing_service::find_session(const byte_vector_t& message, const std::vector<elliptic_curve_point>& keys, const elliptic_curve_point& self_key)
{
    std::string session_id = _store.find_session(signing_session_identity(message, keys, self_key));
    if (session_id.empty())
    {
        LOG_ERROR("no live session for this message and key set");
        throw cosigner_exception(cosigner_exception::SESSION_NOT_FOUND);
    }
    return session_id;
}

byte_vector_t aggregated_eddsa_signing_service::build_commitment_data(const elliptic_curve_point& signer, const elliptic_curve_point& nonce_point)
{
    byte_vector_t data(signer.data, signer.data + sizeof(ed25519_point_t));
    data.insert(data.end(), nonce_point.data, nonce_point.data + sizeof(ed25519_point_t));
    return data;
}

}
}
}
