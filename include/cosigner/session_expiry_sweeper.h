#pragma once

#include "solana_tss_export.h"

#include "cosigner/mpc_globals.h"

#include <condition_variable>
#include <mutex>
#include <thread>

namespace solana_tss
{
namespace common
{
namespace cosigner
{

class signing_session_store;

// calls signing_session_store::expire_sessions every interval on a background thread until destroyed
class SOLANA_TSS_EXPORT session_expiry_sweeper final
{
public:
    explicit session_expiry_sweeper(signing_session_store& store, uint64_t interval_msec = DEFAULT_SWEEP_INTERVAL_MSEC);
    ~session_expiry_sweeper();

    session_expiry_sweeper(const session_expiry_sweeper&) = delete;
    session_expiry_sweeper& operator=(const session_expiry_sweeper&) = delete;

    void stop();

private:
    void sweep_loop();

    signing_session_store& _store;
    const uint64_t _interval_msec;

    std::mutex _lock;
    std::condition_variable _cond;
    bool _stopped;
    std::thread _thread;
};

}
}
}
