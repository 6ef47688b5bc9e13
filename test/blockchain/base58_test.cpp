#include "blockchain/solana/base58.h"
#include "blockchain/solana/solana_keypair.h"
#include "blockchain/solana/solana_transaction.h"
#include "cosigner/cosigner_exception.h"
#include "../cosigner/test_common.h"

#include <catch2/catch.hpp>

using namespace solana_tss::blockchain::solana;
using solana_tss::common::cosigner::cosigner_exception;

static std::vector<uint8_t> bytes(const std::string& str)
{
    return std::vector<uint8_t>(str.begin(), str.end());
}

TEST_CASE("base58", "[base58]")
{
    SECTION("encode") {
        REQUIRE(base58_encode(bytes("Hello World!")) == "2NEpo7TZRRrLZSi2U");
        REQUIRE(base58_encode(std::vector<uint8_t>{0, 0, 0x28, 0x7f, 0xb4, 0xcd}) == "11233QC4");
        REQUIRE(base58_encode(std::vector<uint8_t>(32, 0)) == "11111111111111111111111111111111");
        REQUIRE(base58_encode(std::vector<uint8_t>{0}) == "1");
        REQUIRE(base58_encode(std::vector<uint8_t>{0, 1, 2}) == "15T");
        REQUIRE(base58_encode(std::vector<uint8_t>()) == "");

        std::vector<uint8_t> seq;
        for (uint8_t i = 0; i < 32; i++)
            seq.push_back(i);
        REQUIRE(base58_encode(seq) == "1thX6LZfHDZZKUs92febYZhYRcXddmzfzF2NvTkPNE");
    }

    SECTION("decode") {
        REQUIRE(base58_decode("2NEpo7TZRRrLZSi2U") == bytes("Hello World!"));
        REQUIRE(base58_decode("11233QC4") == (std::vector<uint8_t>{0, 0, 0x28, 0x7f, 0xb4, 0xcd}));
        REQUIRE(base58_decode("1") == std::vector<uint8_t>{0});
        REQUIRE(base58_decode("15T") == (std::vector<uint8_t>{0, 1, 2}));
        REQUIRE(base58_decode("").empty());
    }

    SECTION("invalid characters") {
        REQUIRE_THROWS_MATCHES(base58_decode("0OIl"), cosigner_exception, has_error_code(cosigner_exception::DECODING_ERROR));
        REQUIRE_THROWS_MATCHES(base58_decode("2NEpo7TZ RRrLZSi2U"), cosigner_exception, has_error_code(cosigner_exception::DECODING_ERROR));
        REQUIRE_THROWS_MATCHES(base58_decode(std::string("15\0T", 4)), cosigner_exception, has_error_code(cosigner_exception::DECODING_ERROR));
    }

    SECTION("fixed size") {
        uint8_t out[3];
        base58_decode_fixed("15T", out, sizeof(out));
        REQUIRE(out[2] == 2);
        REQUIRE_THROWS_MATCHES(base58_decode_fixed("15T", out, 2), cosigner_exception, has_error_code(cosigner_exception::DECODING_ERROR));
        REQUIRE_THROWS_MATCHES(base58_decode_fixed("2NEpo7TZRRrLZSi2U", out, sizeof(out)), cosigner_exception, has_error_code(cosigner_exception::DECODING_ERROR));
    }
}

TEST_CASE("solana_keypair", "[base58]")
{
    // RFC 8032 test 1
    const ed25519_seed_t seed = {
        0x9d, 0x61, 0xb1, 0x9d, 0xef, 0xfd, 0x5a, 0x60, 0xba, 0x84, 0x4a, 0xf4, 0x92, 0xec, 0x2c, 0xc4,
        0x44, 0x49, 0xc5, 0x69, 0x7b, 0x32, 0x69, 0x19, 0x70, 0x3b, 0xac, 0x03, 0x1c, 0xae, 0x7f, 0x60};
    const std::string pubkey = "FVen3X669xLzsi6N2V91DoiyzHzg1uAgqiT8jZ9nS96Z";
    const std::string serialized = "49W385L4rePHy6PAaQUovbD2aacgN4HsKXSMeUzRg4fmwXszN91JuMFrQRj3vMDpZuRF3ZknQBuRBoWQJEfXstMw";

    SECTION("from seed") {
        ed25519_keypair keypair = keypair_from_seed(seed);
        REQUIRE(to_string(keypair.public_key) == pubkey);
        REQUIRE(serialize_keypair(keypair) == serialized);
        REQUIRE(parse_pubkey(pubkey) == keypair.public_key);
    }

    SECTION("parse") {
        ed25519_keypair keypair = parse_keypair(serialized);
        REQUIRE(memcmp(keypair.seed, seed, sizeof(ed25519_seed_t)) == 0);
        REQUIRE(to_string(keypair.public_key) == pubkey);
    }

    SECTION("public key doesn't match") {
        std::vector<uint8_t> raw = base58_decode(serialized);
        raw[40] ^= 1;
        REQUIRE_THROWS_MATCHES(parse_keypair(base58_encode(raw)), cosigner_exception, has_error_code(cosigner_exception::BAD_KEY));
    }

    SECTION("wrong size") {
        REQUIRE_THROWS_MATCHES(parse_keypair(pubkey), cosigner_exception, has_error_code(cosigner_exception::DECODING_ERROR));
        REQUIRE_THROWS_MATCHES(parse_pubkey(serialized), cosigner_exception, has_error_code(cosigner_exception::DECODING_ERROR));
        REQUIRE_THROWS_MATCHES(parse_hash("15T"), cosigner_exception, has_error_code(cosigner_exception::DECODING_ERROR));
    }

    SECTION("generate") {
        test_platform platform;
        ed25519_keypair keypair = generate_keypair(platform);
        ed25519_keypair parsed = parse_keypair(serialize_keypair(keypair));
        REQUIRE(parsed.public_key == keypair.public_key);
        REQUIRE(generate_keypair(platform).public_key != keypair.public_key);
    }

    SECTION("program ids") {
        REQUIRE(to_string(SYSTEM_PROGRAM_ID) == "11111111111111111111111111111111");
        REQUIRE(to_string(MEMO_PROGRAM_ID) == "MemoSq4gqABAXKb96qnH8TysNcWxMyWCqXgDLGmfcHr");
    }
}
