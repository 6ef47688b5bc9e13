#include "crypto/commitments/commitments.h"

#include <string.h>

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

TEST_CASE("commitments", "commitments") {
    const uint8_t data[] = "nonce point";
    commitments_commitment_t commitment;
    REQUIRE(commitments_create_commitment_for_data(data, sizeof(data), &commitment) == COMMITMENTS_SUCCESS);

    SECTION("verify") {
        REQUIRE(commitments_verify_commitment(data, sizeof(data), &commitment) == COMMITMENTS_SUCCESS);
    }

    SECTION("wrong data") {
        uint8_t other[sizeof(data)];
        memcpy(other, data, sizeof(data));
        other[0] ^= 1;
        REQUIRE(commitments_verify_commitment(other, sizeof(other), &commitment) == COMMITMENTS_INVALID_COMMITMENT);
    }

    SECTION("wrong salt") {
        commitment.salt[5] ^= 1;
        REQUIRE(commitments_verify_commitment(data, sizeof(data), &commitment) == COMMITMENTS_INVALID_COMMITMENT);
    }

    SECTION("salted") {
        commitments_commitment_t commitment2;
        REQUIRE(commitments_create_commitment_for_data(data, sizeof(data), &commitment2) == COMMITMENTS_SUCCESS);
        REQUIRE(memcmp(commitment.commitment, commitment2.commitment, sizeof(commitments_sha256_t)) != 0);
    }

    SECTION("invalid parameters") {
        REQUIRE(commitments_create_commitment_for_data(NULL, 5, &commitment) == COMMITMENTS_INVALID_PARAMETER);
        REQUIRE(commitments_verify_commitment(data, sizeof(data), NULL) == COMMITMENTS_INVALID_PARAMETER);
    }
}
