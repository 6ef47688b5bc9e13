#pragma once

#include <stdint.h>

namespace solana_tss
{
namespace common
{
namespace cosigner
{

constexpr int MPC_PROTOCOL_VERSION = 1;

// a solana transaction must fit a 1232 bytes packet, the message is always shorter
constexpr unsigned int MAX_MESSAGE_SIZE = 1232;
constexpr unsigned int MIN_PARTICIPANTS = 2;
constexpr unsigned int MAX_PARTICIPANTS = 64;

constexpr uint64_t DEFAULT_SESSION_TIMEOUT_MSEC = 5 * 60 * 1000;
constexpr uint64_t DEFAULT_SWEEP_INTERVAL_MSEC = 10 * 1000;

constexpr unsigned int SESSION_ID_SIZE = 16;

enum nonce_exchange_mode
{
    // nonce points are sent directly after step one, 2 rounds
    DIRECT_NONCE_EXCHANGE           = 0,
    // step one only publishes a commitment, nonce points are revealed after all commitments were received, 3 rounds
    COMMIT_REVEAL_NONCE_EXCHANGE    = 1,
};

struct signing_config
{
    uint64_t session_timeout_msec = DEFAULT_SESSION_TIMEOUT_MSEC;
    nonce_exchange_mode nonce_exchange = DIRECT_NONCE_EXCHANGE;
};

}
}
}
