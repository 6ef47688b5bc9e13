#include "cosigner/aggregated_eddsa_signing_service.h"
#include "cosigner/in_memory_signing_session_store.h"
#include "cosigner/key_aggregation.h"
#include "cosigner/mpc_globals.h"
#include "cosigner/cosigner_exception.h"
#include "test_common.h"

#include <catch2/catch.hpp>

#include <openssl/evp.h>

#include <algorithm>
#include <atomic>
#include <thread>

using namespace solana_tss::common::cosigner;

namespace
{

struct party
{
    party(const test_platform& platform, const ed25519_keypair& keypair, const signing_config& config) :
        store(platform, config.session_timeout_msec),
        service(platform, store, config),
        keypair(keypair) {}

    in_memory_signing_session_store store;
    aggregated_eddsa_signing_service service;
    ed25519_keypair keypair;
    std::string session_id;
    elliptic_curve_point nonce_point;
    commitment nonce_commitment;
    elliptic_curve_scalar partial_signature;
};

typedef std::vector<std::unique_ptr<party>> parties_t;

parties_t create_parties(const test_platform& platform, size_t count, const signing_config& config = signing_config())
{
    parties_t parties;
    std::vector<ed25519_keypair> keypairs = create_keypairs(count);
    for (auto i = keypairs.begin(); i != keypairs.end(); ++i)
        parties.push_back(std::unique_ptr<party>(new party(platform, *i, config)));
    return parties;
}

std::vector<elliptic_curve_point> party_keys(const parties_t& parties)
{
    std::vector<elliptic_curve_point> keys;
    for (auto i = parties.begin(); i != parties.end(); ++i)
        keys.push_back((*i)->keypair.public_key);
    return keys;
}

void start(parties_t& parties, const byte_vector_t& message)
{
    std::vector<elliptic_curve_point> keys = party_keys(parties);
    for (auto i = parties.begin(); i != parties.end(); ++i)
    {
        signing_start_result res = (*i)->service.start_signing(message, keys, (*i)->keypair.public_key);
        REQUIRE(res.session_id.size() == SESSION_ID_SIZE * 2);
        (*i)->session_id = res.session_id;
        (*i)->nonce_point = res.nonce_point;
        (*i)->nonce_commitment = res.nonce_commitment;
    }
}

std::map<elliptic_curve_point, elliptic_curve_point> nonce_points(const parties_t& parties)
{
    std::map<elliptic_curve_point, elliptic_curve_point> points;
    for (auto i = parties.begin(); i != parties.end(); ++i)
        points[(*i)->keypair.public_key] = (*i)->nonce_point;
    return points;
}

void partial_sign(parties_t& parties)
{
    std::map<elliptic_curve_point, elliptic_curve_point> points = nonce_points(parties);
    elliptic_curve_point R;
    for (auto i = parties.begin(); i != parties.end(); ++i)
    {
        partial_signature_result res = (*i)->service.partial_sign((*i)->session_id, points, (*i)->keypair);
        if (i == parties.begin())
            R = res.aggregate_nonce_point;
        REQUIRE(res.aggregate_nonce_point == R);
        (*i)->partial_signature = res.partial_signature;
    }
}

std::map<elliptic_curve_point, elliptic_curve_scalar> partial_signatures(const parties_t& parties)
{
    std::map<elliptic_curve_point, elliptic_curve_scalar> sigs;
    for (auto i = parties.begin(); i != parties.end(); ++i)
        sigs[(*i)->keypair.public_key] = (*i)->partial_signature;
    return sigs;
}

bool openssl_verify(const byte_vector_t& message, const eddsa_signature& signature, const elliptic_curve_point& key)
{
    EVP_PKEY* pkey = EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, NULL, key.data, sizeof(ed25519_point_t));
    if (!pkey)
        return false;
    EVP_MD_CTX* md_ctx = EVP_MD_CTX_new();
    std::array<uint8_t, ED25519_SIGNATURE_LEN> raw = signature.serialize();
    bool ret = md_ctx && EVP_DigestVerifyInit(md_ctx, NULL, NULL, NULL, pkey) == 1 &&
        EVP_DigestVerify(md_ctx, raw.data(), raw.size(), message.data(), message.size()) == 1;
    EVP_MD_CTX_free(md_ctx);
    EVP_PKEY_free(pkey);
    return ret;
}

aggregated_signature_result sign(parties_t& parties, const byte_vector_t& message)
{
    start(parties, message);
    partial_sign(parties);
    std::map<elliptic_curve_point, elliptic_curve_scalar> sigs = partial_signatures(parties);

    aggregated_signature_result first;
    for (auto i = parties.begin(); i != parties.end(); ++i)
    {
        aggregated_signature_result res = (*i)->service.aggregate_signatures((*i)->session_id, sigs);
        if (i == parties.begin())
            first = res;
        REQUIRE(res.signature.serialize() == first.signature.serialize());
        REQUIRE(res.aggregated_key == first.aggregated_key);
        REQUIRE(res.message == message);
    }
    return first;
}

byte_vector_t to_message(const std::string& str)
{
    return byte_vector_t(str.begin(), str.end());
}

}

TEST_CASE("aggregated_signing", "[signing]")
{
    test_platform platform;
    const byte_vector_t message = to_message("transfer 0.5 SOL");

    SECTION("2 parties") {
        parties_t parties = create_parties(platform, 2);
        aggregated_signature_result res = sign(parties, message);
        REQUIRE(res.aggregated_key == aggregate_public_keys(party_keys(parties)));
        REQUIRE(res.aggregated_key == parties[0]->service.aggregate_keys(party_keys(parties)));
        REQUIRE(openssl_verify(message, res.signature, res.aggregated_key));
        REQUIRE_FALSE(openssl_verify(to_message("transfer 5 SOL"), res.signature, res.aggregated_key));
        REQUIRE_FALSE(openssl_verify(message, res.signature, parties[0]->keypair.public_key));
    }

    SECTION("2 parties single nonce point") {
        parties_t parties = create_parties(platform, 2);
        start(parties, message);
        partial_signature_result a = parties[0]->service.partial_sign(parties[0]->session_id, parties[1]->nonce_point, parties[0]->keypair);
        partial_signature_result b = parties[1]->service.partial_sign(parties[1]->session_id, parties[0]->nonce_point, parties[1]->keypair);
        REQUIRE(a.aggregate_nonce_point == b.aggregate_nonce_point);
        parties[0]->partial_signature = a.partial_signature;
        parties[1]->partial_signature = b.partial_signature;
        aggregated_signature_result res = parties[1]->service.aggregate_signatures(parties[1]->session_id, partial_signatures(parties));
        REQUIRE(openssl_verify(message, res.signature, res.aggregated_key));
    }

    SECTION("3 parties") {
        parties_t parties = create_parties(platform, 3);
        aggregated_signature_result res = sign(parties, message);
        REQUIRE(openssl_verify(message, res.signature, res.aggregated_key));
    }

    SECTION("5 parties") {
        parties_t parties = create_parties(platform, 5);
        aggregated_signature_result res = sign(parties, message);
        REQUIRE(openssl_verify(message, res.signature, res.aggregated_key));
    }

    SECTION("key order") {
        parties_t parties = create_parties(platform, 3);
        std::vector<elliptic_curve_point> keys = party_keys(parties);
        for (auto i = parties.begin(); i != parties.end(); ++i)
        {
            std::rotate(keys.begin(), keys.begin() + 1, keys.end());
            signing_start_result res = (*i)->service.start_signing(message, keys, (*i)->keypair.public_key);
            (*i)->session_id = res.session_id;
            (*i)->nonce_point = res.nonce_point;
        }
        partial_sign(parties);
        aggregated_signature_result res = parties[2]->service.aggregate_signatures(parties[2]->session_id, partial_signatures(parties));
        REQUIRE(openssl_verify(message, res.signature, res.aggregated_key));
    }

    SECTION("max message size") {
        parties_t parties = create_parties(platform, 2);
        byte_vector_t big(MAX_MESSAGE_SIZE, 0x5a);
        aggregated_signature_result res = sign(parties, big);
        REQUIRE(openssl_verify(big, res.signature, res.aggregated_key));
    }
}

TEST_CASE("start_signing", "[signing]")
{
    test_platform platform;
    parties_t parties = create_parties(platform, 2);
    std::vector<elliptic_curve_point> keys = party_keys(parties);
    aggregated_eddsa_signing_service& service = parties[0]->service;
    const elliptic_curve_point& self = parties[0]->keypair.public_key;

    SECTION("invalid message") {
        REQUIRE_THROWS_MATCHES(service.start_signing(byte_vector_t(), keys, self), cosigner_exception, has_error_code(cosigner_exception::INVALID_MESSAGE));
        REQUIRE_THROWS_MATCHES(service.start_signing(byte_vector_t(MAX_MESSAGE_SIZE + 1, 1), keys, self), cosigner_exception, has_error_code(cosigner_exception::INVALID_MESSAGE));
        REQUIRE(parties[0]->store.size() == 0);
    }

    SECTION("self key not in key set") {
        ed25519_keypair other = create_keypair();
        REQUIRE_THROWS_MATCHES(service.start_signing(to_message("m"), keys, other.public_key), cosigner_exception, has_error_code(cosigner_exception::KEY_NOT_IN_KEY_SET));
    }

    SECTION("invalid key set") {
        REQUIRE_THROWS_MATCHES(service.start_signing(to_message("m"), std::vector<elliptic_curve_point>(1, self), self), cosigner_exception, has_error_code(cosigner_exception::INVALID_KEY_SET));
        REQUIRE_THROWS_MATCHES(service.start_signing(to_message("m"), std::vector<elliptic_curve_point>(2, self), self), cosigner_exception, has_error_code(cosigner_exception::DUPLICATE_KEY));
    }

    SECTION("duplicate session") {
        signing_start_result res = service.start_signing(to_message("m"), keys, self);
        REQUIRE_THROWS_MATCHES(service.start_signing(to_message("m"), keys, self), cosigner_exception, has_error_code(cosigner_exception::DUPLICATE_SESSION));
        std::reverse(keys.begin(), keys.end());
        REQUIRE_THROWS_MATCHES(service.start_signing(to_message("m"), keys, self), cosigner_exception, has_error_code(cosigner_exception::DUPLICATE_SESSION));
        REQUIRE(service.find_session(to_message("m"), keys, self) == res.session_id);

        // a different message is a different session
        signing_start_result other = service.start_signing(to_message("m2"), keys, self);
        REQUIRE(other.session_id != res.session_id);
        REQUIRE(other.nonce_point != res.nonce_point);
        REQUIRE(parties[0]->store.size() == 2);
    }

    SECTION("find_session") {
        REQUIRE_THROWS_MATCHES(service.find_session(to_message("m"), keys, self), cosigner_exception, has_error_code(cosigner_exception::SESSION_NOT_FOUND));
        signing_start_result res = service.start_signing(to_message("m"), keys, self);
        REQUIRE(service.find_session(to_message("m"), keys, self) == res.session_id);
        REQUIRE_THROWS_MATCHES(service.find_session(to_message("m"), keys, parties[1]->keypair.public_key), cosigner_exception, has_error_code(cosigner_exception::SESSION_NOT_FOUND));
        service.cancel_signing(res.session_id);
        REQUIRE_THROWS_MATCHES(service.find_session(to_message("m"), keys, self), cosigner_exception, has_error_code(cosigner_exception::SESSION_NOT_FOUND));
    }

    SECTION("invalid config") {
        signing_config config;
        config.nonce_exchange = (nonce_exchange_mode)7;
        REQUIRE_THROWS_MATCHES(aggregated_eddsa_signing_service(platform, parties[0]->store, config), cosigner_exception, has_error_code(cosigner_exception::INVALID_PARAMETERS));
    }
}

TEST_CASE("partial_sign", "[signing]")
{
    test_platform platform;
    const byte_vector_t message = to_message("memo: hello");
    parties_t parties = create_parties(platform, 3);
    start(parties, message);
    std::map<elliptic_curve_point, elliptic_curve_point> points = nonce_points(parties);
    party& a = *parties[0];

    SECTION("nonce is single use") {
        REQUIRE_NOTHROW(a.service.partial_sign(a.session_id, points, a.keypair));
        REQUIRE_THROWS_MATCHES(a.service.partial_sign(a.session_id, points, a.keypair), cosigner_exception, has_error_code(cosigner_exception::NONCE_ALREADY_CONSUMED));
    }

    SECTION("failed attempt consumes the nonce") {
        REQUIRE_THROWS_MATCHES(a.service.partial_sign(a.session_id, points, parties[1]->keypair), cosigner_exception, has_error_code(cosigner_exception::BAD_KEY));
        REQUIRE_THROWS_MATCHES(a.service.partial_sign(a.session_id, points, a.keypair), cosigner_exception, has_error_code(cosigner_exception::NONCE_ALREADY_CONSUMED));
    }

    SECTION("seed doesn't match the key") {
        ed25519_keypair wrong(a.keypair);
        wrong.seed[0] ^= 1;
        REQUIRE_THROWS_MATCHES(a.service.partial_sign(a.session_id, points, wrong), cosigner_exception, has_error_code(cosigner_exception::BAD_KEY));
    }

    SECTION("missing nonce point") {
        points.erase(parties[2]->keypair.public_key);
        REQUIRE_THROWS_MATCHES(a.service.partial_sign(a.session_id, points, a.keypair), cosigner_exception, has_error_code(cosigner_exception::INVALID_PARAMETERS));
    }

    SECTION("nonce point from a foreign key") {
        ed25519_keypair other = create_keypair();
        points[other.public_key] = parties[1]->nonce_point;
        REQUIRE_THROWS_MATCHES(a.service.partial_sign(a.session_id, points, a.keypair), cosigner_exception, has_error_code(cosigner_exception::INVALID_PARAMETERS));
    }

    SECTION("wrong self nonce point") {
        points[a.keypair.public_key] = parties[1]->nonce_point;
        REQUIRE_THROWS_MATCHES(a.service.partial_sign(a.session_id, points, a.keypair), cosigner_exception, has_error_code(cosigner_exception::INVALID_PARAMETERS));
    }

    SECTION("invalid nonce point") {
        ed25519_point_t small_order = {0};
        points[parties[1]->keypair.public_key] = elliptic_curve_point(small_order);
        REQUIRE_THROWS_MATCHES(a.service.partial_sign(a.session_id, points, a.keypair), cosigner_exception, has_error_code(cosigner_exception::DECODING_ERROR));
    }

    SECTION("single nonce point needs 2 parties") {
        REQUIRE_THROWS_MATCHES(a.service.partial_sign(a.session_id, parties[1]->nonce_point, a.keypair), cosigner_exception, has_error_code(cosigner_exception::INVALID_PARAMETERS));
        // the nonce wasn't touched
        REQUIRE_NOTHROW(a.service.partial_sign(a.session_id, points, a.keypair));
    }

    SECTION("unknown session") {
        REQUIRE_THROWS_MATCHES(a.service.partial_sign("0011", points, a.keypair), cosigner_exception, has_error_code(cosigner_exception::SESSION_NOT_FOUND));
        REQUIRE_THROWS_MATCHES(a.service.partial_sign(parties[1]->session_id, points, a.keypair), cosigner_exception, has_error_code(cosigner_exception::SESSION_NOT_FOUND));
    }

    SECTION("expired") {
        platform.advance(DEFAULT_SESSION_TIMEOUT_MSEC);
        REQUIRE_THROWS_MATCHES(a.service.partial_sign(a.session_id, points, a.keypair), cosigner_exception, has_error_code(cosigner_exception::SESSION_NOT_FOUND));
        REQUIRE(a.store.size() == 0);
    }

    SECTION("activity extends the session") {
        platform.advance(DEFAULT_SESSION_TIMEOUT_MSEC - 1);
        REQUIRE_NOTHROW(a.service.partial_sign(a.session_id, points, a.keypair));
        platform.advance(DEFAULT_SESSION_TIMEOUT_MSEC - 1);
        REQUIRE_THROWS_MATCHES(a.service.aggregate_signatures(a.session_id, std::map<elliptic_curve_point, elliptic_curve_scalar>()), cosigner_exception, has_error_code(cosigner_exception::INCOMPLETE_SIGNATURE_SET));
        platform.advance(1);
        REQUIRE_THROWS_MATCHES(a.service.aggregate_signatures(a.session_id, std::map<elliptic_curve_point, elliptic_curve_scalar>()), cosigner_exception, has_error_code(cosigner_exception::SESSION_NOT_FOUND));
    }

    SECTION("concurrent requests") {
        std::atomic<int> succeeded(0);
        std::atomic<int> rejected(0);
        std::atomic<int> unexpected(0);
        std::vector<std::thread> threads;
        for (size_t i = 0; i < 8; i++)
        {
            threads.push_back(std::thread([&]()
            {
                try
                {
                    a.service.partial_sign(a.session_id, points, a.keypair);
                    ++succeeded;
                }
                catch (const cosigner_exception& e)
                {
                    if (e.error_code() == cosigner_exception::SESSION_BUSY || e.error_code() == cosigner_exception::NONCE_ALREADY_CONSUMED)
                        ++rejected;
                    else
                        ++unexpected;
                }
            }));
        }
        for (auto i = threads.begin(); i != threads.end(); ++i)
            i->join();
        REQUIRE(succeeded == 1);
        REQUIRE(rejected == 7);
        REQUIRE(unexpected == 0);
    }
}

TEST_CASE("aggregate_signatures", "[signing]")
{
    test_platform platform;
    const byte_vector_t message = to_message("transfer 1 SOL");
    parties_t parties = create_parties(platform, 3);
    party& a = *parties[0];

    SECTION("before partial signing") {
        start(parties, message);
        REQUIRE_THROWS_MATCHES(a.service.aggregate_signatures(a.session_id, std::map<elliptic_curve_point, elliptic_curve_scalar>()), cosigner_exception, has_error_code(cosigner_exception::OUT_OF_ORDER_REQUEST));
    }

    SECTION("incomplete signature set") {
        start(parties, message);
        partial_sign(parties);
        std::map<elliptic_curve_point, elliptic_curve_scalar> sigs = partial_signatures(parties);
        sigs.erase(parties[2]->keypair.public_key);
        REQUIRE_THROWS_MATCHES(a.service.aggregate_signatures(a.session_id, sigs), cosigner_exception, has_error_code(cosigner_exception::INCOMPLETE_SIGNATURE_SET));

        // the session is still usable
        aggregated_signature_result res = a.service.aggregate_signatures(a.session_id, partial_signatures(parties));
        REQUIRE(openssl_verify(message, res.signature, res.aggregated_key));
    }

    SECTION("own signature may be omitted") {
        start(parties, message);
        partial_sign(parties);
        std::map<elliptic_curve_point, elliptic_curve_scalar> sigs = partial_signatures(parties);
        sigs.erase(a.keypair.public_key);
        aggregated_signature_result res = a.service.aggregate_signatures(a.session_id, sigs);
        REQUIRE(openssl_verify(message, res.signature, res.aggregated_key));
    }

    SECTION("wrong own signature") {
        start(parties, message);
        partial_sign(parties);
        std::map<elliptic_curve_point, elliptic_curve_scalar> sigs = partial_signatures(parties);
        sigs[a.keypair.public_key] = parties[1]->partial_signature;
        REQUIRE_THROWS_MATCHES(a.service.aggregate_signatures(a.session_id, sigs), cosigner_exception, has_error_code(cosigner_exception::INVALID_PARAMETERS));
    }

    SECTION("foreign key") {
        start(parties, message);
        partial_sign(parties);
        std::map<elliptic_curve_point, elliptic_curve_scalar> sigs = partial_signatures(parties);
        sigs[create_keypair().public_key] = parties[1]->partial_signature;
        REQUIRE_THROWS_MATCHES(a.service.aggregate_signatures(a.session_id, sigs), cosigner_exception, has_error_code(cosigner_exception::INVALID_PARAMETERS));
    }

    SECTION("non canonical scalar") {
        start(parties, message);
        partial_sign(parties);
        std::map<elliptic_curve_point, elliptic_curve_scalar> sigs = partial_signatures(parties);
        elliptic_curve_scalar bad;
        memset(bad.data, 0xff, sizeof(ed25519_le_scalar_t));
        sigs[parties[1]->keypair.public_key] = bad;
        REQUIRE_THROWS_MATCHES(a.service.aggregate_signatures(a.session_id, sigs), cosigner_exception, has_error_code(cosigner_exception::DECODING_ERROR));
    }

    SECTION("party signed a different message") {
        std::vector<elliptic_curve_point> keys = party_keys(parties);
        for (auto i = parties.begin(); i != parties.end(); ++i)
        {
            byte_vector_t msg = i == parties.begin() + 1 ? to_message("transfer 100 SOL") : message;
            signing_start_result res = (*i)->service.start_signing(msg, keys, (*i)->keypair.public_key);
            (*i)->session_id = res.session_id;
            (*i)->nonce_point = res.nonce_point;
        }
        partial_sign(parties);
        REQUIRE_THROWS_MATCHES(a.service.aggregate_signatures(a.session_id, partial_signatures(parties)), cosigner_exception, has_error_code(cosigner_exception::SIGNATURE_VERIFICATION_FAILED));
        REQUIRE_THROWS_MATCHES(a.service.aggregate_signatures(a.session_id, partial_signatures(parties)), cosigner_exception, has_error_code(cosigner_exception::SESSION_NOT_FOUND));
        REQUIRE(a.store.size() == 0);
    }

    SECTION("tampered partial signature") {
        start(parties, message);
        partial_sign(parties);
        std::map<elliptic_curve_point, elliptic_curve_scalar> sigs = partial_signatures(parties);
        sigs[parties[2]->keypair.public_key].data[0] ^= 1;
        REQUIRE_THROWS_MATCHES(a.service.aggregate_signatures(a.session_id, sigs), cosigner_exception, has_error_code(cosigner_exception::SIGNATURE_VERIFICATION_FAILED));
    }

    SECTION("immutable after aggregation") {
        sign(parties, message);
        std::map<elliptic_curve_point, elliptic_curve_point> points = nonce_points(parties);
        REQUIRE_THROWS_MATCHES(a.service.aggregate_signatures(a.session_id, partial_signatures(parties)), cosigner_exception, has_error_code(cosigner_exception::SESSION_IMMUTABLE));
        REQUIRE_THROWS_MATCHES(a.service.partial_sign(a.session_id, points, a.keypair), cosigner_exception, has_error_code(cosigner_exception::SESSION_IMMUTABLE));
        REQUIRE_THROWS_MATCHES(a.service.cancel_signing(a.session_id), cosigner_exception, has_error_code(cosigner_exception::SESSION_IMMUTABLE));

        // aggregated sessions don't block signing the same message again
        REQUIRE_NOTHROW(a.service.start_signing(message, party_keys(parties), a.keypair.public_key));

        platform.advance(DEFAULT_SESSION_TIMEOUT_MSEC);
        REQUIRE(a.store.expire_sessions() == 2);
    }
}

TEST_CASE("cancel_signing", "[signing]")
{
    test_platform platform;
    const byte_vector_t message = to_message("transfer 2 SOL");
    parties_t parties = create_parties(platform, 2);
    party& a = *parties[0];
    start(parties, message);

    SECTION("before partial signing") {
        a.service.cancel_signing(a.session_id);
        REQUIRE(a.store.size() == 0);
        REQUIRE_THROWS_MATCHES(a.service.partial_sign(a.session_id, nonce_points(parties), a.keypair), cosigner_exception, has_error_code(cosigner_exception::SESSION_NOT_FOUND));
        REQUIRE_THROWS_MATCHES(a.service.cancel_signing(a.session_id), cosigner_exception, has_error_code(cosigner_exception::SESSION_NOT_FOUND));
        REQUIRE_NOTHROW(a.service.start_signing(message, party_keys(parties), a.keypair.public_key));
    }

    SECTION("after partial signing") {
        REQUIRE_NOTHROW(a.service.partial_sign(a.session_id, nonce_points(parties), a.keypair));
        a.service.cancel_signing(a.session_id);
        REQUIRE_THROWS_MATCHES(a.service.aggregate_signatures(a.session_id, std::map<elliptic_curve_point, elliptic_curve_scalar>()), cosigner_exception, has_error_code(cosigner_exception::SESSION_NOT_FOUND));
    }
}

TEST_CASE("commit_reveal", "[signing]")
{
    test_platform platform;
    signing_config config;
    config.nonce_exchange = COMMIT_REVEAL_NONCE_EXCHANGE;
    const byte_vector_t message = to_message("transfer 3 SOL");
    parties_t parties = create_parties(platform, 3, config);
    start(parties, message);

    std::map<elliptic_curve_point, commitment> commitments;
    for (auto i = parties.begin(); i != parties.end(); ++i)
    {
        REQUIRE((*i)->nonce_point == elliptic_curve_point());
        commitments[(*i)->keypair.public_key] = (*i)->nonce_commitment;
    }
    party& a = *parties[0];

    SECTION("full flow") {
        for (auto i = parties.begin(); i != parties.end(); ++i)
            (*i)->nonce_point = (*i)->service.store_commitments((*i)->session_id, commitments);
        partial_sign(parties);
        std::map<elliptic_curve_point, elliptic_curve_scalar> sigs = partial_signatures(parties);
        for (auto i = parties.begin(); i != parties.end(); ++i)
        {
            aggregated_signature_result res = (*i)->service.aggregate_signatures((*i)->session_id, sigs);
            REQUIRE(openssl_verify(message, res.signature, res.aggregated_key));
        }
    }

    SECTION("nonce point before commitments") {
        std::map<elliptic_curve_point, elliptic_curve_point> points;
        points[parties[1]->keypair.public_key] = parties[1]->nonce_point;
        REQUIRE_THROWS_MATCHES(a.service.partial_sign(a.session_id, points, a.keypair), cosigner_exception, has_error_code(cosigner_exception::OUT_OF_ORDER_REQUEST));
    }

    SECTION("commitments are stored once") {
        REQUIRE_NOTHROW(a.service.store_commitments(a.session_id, commitments));
        REQUIRE_THROWS_MATCHES(a.service.store_commitments(a.session_id, commitments), cosigner_exception, has_error_code(cosigner_exception::OUT_OF_ORDER_REQUEST));
    }

    SECTION("missing commitment") {
        commitments.erase(parties[2]->keypair.public_key);
        REQUIRE_THROWS_MATCHES(a.service.store_commitments(a.session_id, commitments), cosigner_exception, has_error_code(cosigner_exception::INVALID_PARAMETERS));
    }

    SECTION("wrong own commitment") {
        commitments[a.keypair.public_key] = parties[1]->nonce_commitment;
        REQUIRE_THROWS_MATCHES(a.service.store_commitments(a.session_id, commitments), cosigner_exception, has_error_code(cosigner_exception::INVALID_PARAMETERS));
    }

    SECTION("revealed point doesn't match the commitment") {
        for (auto i = parties.begin(); i != parties.end(); ++i)
            (*i)->nonce_point = (*i)->service.store_commitments((*i)->session_id, commitments);

        // party 2 reveals a point it didn't commit to
        std::map<elliptic_curve_point, elliptic_curve_point> points = nonce_points(parties);
        points[parties[2]->keypair.public_key] = create_keypair().public_key;
        REQUIRE_THROWS_MATCHES(a.service.partial_sign(a.session_id, points, a.keypair), cosigner_exception, has_error_code(cosigner_exception::INVALID_COMMITMENT));
        REQUIRE_THROWS_MATCHES(a.service.partial_sign(a.session_id, nonce_points(parties), a.keypair), cosigner_exception, has_error_code(cosigner_exception::NONCE_ALREADY_CONSUMED));
    }

    SECTION("direct mode has no commitments") {
        parties_t direct = create_parties(platform, 2);
        start(direct, message);
        REQUIRE_THROWS_MATCHES(direct[0]->service.store_commitments(direct[0]->session_id, std::map<elliptic_curve_point, commitment>()), cosigner_exception, has_error_code(cosigner_exception::OUT_OF_ORDER_REQUEST));
    }
}
