#include "cosigner/session_expiry_sweeper.h"
#include "cosigner/signing_session_store.h"
#include "cosigner/cosigner_exception.h"
#include "logging/logging_t.h"

#include <chrono>
#include <exception>

namespace solana_tss
{
namespace common
{
namespace cosigner
{

session_expiry_sweeper::session_expiry_sweeper(signing_session_store& store, uint64_t interval_msec) :
    _store(store),
    _interval_msec(interval_msec),
    _stopped(false)
{
    if (!interval_msec)
    {
        LOG_ERROR("sweep interval must be positive");
        throw cosigner_exception(cosigner_exception::INVALID_PARAMETERS);
    }
    _thread = std::thread(&session_expiry_sweeper::sweep_loop, this);
}

session_expiry_sweeper::~session_expiry_sweeper()
{
    stop();
}

void session_expiry_sweeper::stop()
{
    {
        std::lock_guard<std::mutex> guard(_lock);
        _stopped = true;
    }
    _cond.notify_all();
    if (_thread.joinable())
        _thread.join();
}

void session_expiry_sweeper::sweep_loop()
{
    std::unique_lock<std::mutex> guard(_lock);
    while (!_stopped)
    {
        if (_cond.wait_for(guard, std::chrono::milliseconds(_interval_msec), [this] {return _stopped;}))
            break;

        guard.unlock();
        try
        {
            size_t count = _store.expire_sessions();
            if (count)
                LOG_INFO("expired %lu signing sessions", count);
        }
        catch (const cosigner_exception& e)
        {
            LOG_ERROR("failed to expire sessions, error %s", e.what());
        }
        catch (const std::exception& e)
        {
            LOG_ERROR("failed to expire sessions, exception %s", e.what());
        }
        guard.lock();
    }
}

}
}
}
