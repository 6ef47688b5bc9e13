#include "cosigner/key_aggregation.h"
#include "cosigner/mpc_globals.h"
#include "cosigner/cosigner_exception.h"
#include "test_common.h"

#include <catch2/catch.hpp>

#include <algorithm>

using namespace solana_tss::common::cosigner;

TEST_CASE("key_aggregation", "[aggregation]")
{
    std::vector<ed25519_keypair> keypairs = create_keypairs(4);
    std::vector<elliptic_curve_point> keys = public_keys(keypairs);

    SECTION("order independent") {
        elliptic_curve_point expected = aggregate_public_keys(keys);
        std::vector<elliptic_curve_point> permuted(keys);
        std::sort(permuted.begin(), permuted.end());
        do
        {
            REQUIRE(aggregate_public_keys(permuted) == expected);
        } while (std::next_permutation(permuted.begin(), permuted.end()));

        key_aggregation a(keys);
        std::reverse(keys.begin(), keys.end());
        key_aggregation b(keys);
        REQUIRE(a.keyset_hash() == b.keyset_hash());
        for (auto i = keys.begin(); i != keys.end(); ++i)
            REQUIRE(a.coefficient(*i) == b.coefficient(*i));
    }

    SECTION("valid public key") {
        std::unique_ptr<ed25519_algebra_ctx_t, void(*)(ed25519_algebra_ctx_t*)> ctx(ed25519_algebra_ctx_new(), ed25519_algebra_ctx_free);
        elliptic_curve_point aggregated = aggregate_public_keys(keys);
        REQUIRE(ed25519_algebra_validate_public_key(ctx.get(), &aggregated.data) == ELLIPTIC_CURVE_ALGEBRA_SUCCESS);
        for (auto i = keys.begin(); i != keys.end(); ++i)
            REQUIRE(aggregated != *i);
    }

    SECTION("coefficients depend on the whole set") {
        key_aggregation full(keys);
        std::vector<elliptic_curve_point> subset(keys.begin(), keys.begin() + 3);
        key_aggregation partial(subset);
        REQUIRE(full.keyset_hash() != partial.keyset_hash());
        REQUIRE(full.coefficient(keys[0]) != partial.coefficient(keys[0]));
        REQUIRE(full.coefficient(keys[0]) != full.coefficient(keys[1]));
        REQUIRE(full.aggregated_public_key() != partial.aggregated_public_key());
    }

    SECTION("contains") {
        key_aggregation aggregation(keys);
        REQUIRE(aggregation.keys().size() == keys.size());
        REQUIRE(aggregation.contains(keys[2]));
        ed25519_keypair other = create_keypair();
        REQUIRE_FALSE(aggregation.contains(other.public_key));
        REQUIRE_THROWS_MATCHES(aggregation.coefficient(other.public_key), cosigner_exception, has_error_code(cosigner_exception::KEY_NOT_IN_KEY_SET));
    }

    SECTION("too few keys") {
        std::vector<elliptic_curve_point> single(1, keys[0]);
        REQUIRE_THROWS_MATCHES(key_aggregation(single), cosigner_exception, has_error_code(cosigner_exception::INVALID_KEY_SET));
        REQUIRE_THROWS_AS(key_aggregation(std::vector<elliptic_curve_point>()), cosigner_exception);
    }

    SECTION("too many keys") {
        std::vector<elliptic_curve_point> many = public_keys(create_keypairs(MAX_PARTICIPANTS + 1));
        REQUIRE_THROWS_MATCHES(aggregate_public_keys(many), cosigner_exception, has_error_code(cosigner_exception::INVALID_KEY_SET));
    }

    SECTION("duplicate key") {
        keys.push_back(keys[1]);
        REQUIRE_THROWS_MATCHES(aggregate_public_keys(keys), cosigner_exception, has_error_code(cosigner_exception::DUPLICATE_KEY));
    }

    SECTION("invalid key") {
        ed25519_point_t off_curve = {2};
        keys.push_back(elliptic_curve_point(off_curve));
        REQUIRE_THROWS_MATCHES(aggregate_public_keys(keys), cosigner_exception, has_error_code(cosigner_exception::DECODING_ERROR));

        keys.pop_back();
        ed25519_point_t small_order = {0};
        keys.push_back(elliptic_curve_point(small_order));
        REQUIRE_THROWS_MATCHES(aggregate_public_keys(keys), cosigner_exception, has_error_code(cosigner_exception::DECODING_ERROR));
    }
}
