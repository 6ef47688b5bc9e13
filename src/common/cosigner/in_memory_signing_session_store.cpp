#include "cosigner/in_memory_signing_session_store.h"
#include "cosigner/cosigner_exception.h"
#include "cosigner/platform_service.h"
#include "logging/logging_t.h"

#include <iterator>

namespace solana_tss
{
namespace common
{
namespace cosigner
{

signing_session_store::~signing_session_store()
{
}

in_memory_signing_session_store::in_memory_signing_session_store(const platform_service& service, uint64_t session_timeout_msec) :
    _service(service),
    _timeout_msec(session_timeout_msec)
{
    if (!session_timeout_msec)
    {
        LOG_ERROR("session timeout must be positive");
        throw cosigner_exception(cosigner_exception::INVALID_PARAMETERS);
    }
}

bool in_memory_signing_session_store::timed_out(const signing_session& session, uint64_t now) const
{
    return now >= session.last_activity_msec && now - session.last_activity_msec >= _timeout_msec;
}

void in_memory_signing_session_store::erase_locked(std::map<std::string, std::shared_ptr<signing_session>>::iterator it)
{
    auto identity = _identities.find(it->second->identity);
    if (identity != _identities.end() && identity->second == it->first)
        _identities.erase(identity);
    _sessions.erase(it);
}

void in_memory_signing_session_store::create_session(std::shared_ptr<signing_session> session)
{
    if (!session || session->id.empty())
    {
        LOG_ERROR("got invalid session");
        throw cosigner_exception(cosigner_exception::INVALID_PARAMETERS);
    }

    std::lock_guard<std::mutex> store_guard(_lock);
    if (_sessions.find(session->id) != _sessions.end())
    {
        LOG_ERROR("session id %s already exists", session->id.c_str());
        throw cosigner_exception(cosigner_exception::DUPLICATE_SESSION);
    }

    auto identity = _identities.find(session->identity);
    if (identity != _identities.end())
    {
        auto existing = _sessions.find(identity->second);
        if (existing != _sessions.end())
        {
            std::unique_lock<std::mutex> guard(existing->second->lock, std::try_to_lock);
            if (!guard.owns_lock() || (existing->second->is_live() && !timed_out(*existing->second, _service.now_msec())))
            {
                LOG_ERROR("session %s is already in progress for this message and key set", identity->second.c_str());
                throw cosigner_exception(cosigner_exception::DUPLICATE_SESSION);
            }
        }
    }

    _identities[session->identity] = session->id;
    _sessions[session->id] = std::move(session);
}

locked_session in_memory_signing_session_store::lock_session(const std::string& session_id)
{
    std::lock_guard<std::mutex> store_guard(_lock);
    auto it = _sessions.find(session_id);
    if (it == _sessions.end())
    {
        LOG_ERROR("session %s not found", session_id.c_str());
        throw cosigner_exception(cosigner_exception::SESSION_NOT_FOUND);
    }

    std::shared_ptr<signing_session> session = it->second;
    std::unique_lock<std::mutex> guard(session->lock, std::try_to_lock);
    if (!guard.owns_lock())
    {
        LOG_WARN("session %s is locked by another request", session_id.c_str());
        throw cosigner_exception(cosigner_exception::SESSION_BUSY);
    }

    if (session->status == EXPIRED || timed_out(*session, _service.now_msec()))
    {
        LOG_ERROR("session %s has expired", session_id.c_str());
        if (session->is_live())
            session->status = EXPIRED;
        session->wipe_secret();
        erase_locked(it);
        throw cosigner_exception(cosigner_exception::SESSION_NOT_FOUND);
    }

    return locked_session(std::move(session), std::move(guard));
}

std::string in_memory_signing_session_store::find_session(const std::string& identity)
{
    std::lock_guard<std::mutex> store_guard(_lock);
    auto id = _identities.find(identity);
    if (id == _identities.end())
        return std::string();

    auto it = _sessions.find(id->second);
    if (it == _sessions.end())
        return std::string();

    std::unique_lock<std::mutex> guard(it->second->lock, std::try_to_lock);
    if (!guard.owns_lock())
        return it->first;
    return it->second->is_live() && !timed_out(*it->second, _service.now_msec()) ? it->first : std::string();
}

void in_memory_signing_session_store::remove_session(const std::string& session_id)
{
    std::lock_guard<std::mutex> store_guard(_lock);
    auto it = _sessions.find(session_id);
    if (it != _sessions.end())
        erase_locked(it);
}

size_t in_memory_signing_session_store::expire_sessions()
{
    size_t count = 0;
    std::lock_guard<std::mutex> store_guard(_lock);
    const uint64_t now = _service.now_msec();

    for (auto it = _sessions.begin(); it != _sessions.end();)
    {
        std::shared_ptr<signing_session> session = it->second;
        std::unique_lock<std::mutex> guard(session->lock, std::try_to_lock);
        if (!guard.owns_lock() || (session->status != EXPIRED && !timed_out(*session, now)))
        {
            ++it;
            continue;
        }

        LOG_INFO("session %s (%s) expired", it->first.c_str(), to_string(session->status));
        if (session->is_live())
            session->status = EXPIRED;
        session->wipe_secret();
        auto next = std::next(it);
        erase_locked(it);
        it = next;
        ++count;
    }
    return count;
}

size_t in_memory_signing_session_store::size() const
{
    std::lock_guard<std::mutex> store_guard(_lock);
    return _sessions.size();
}

}
}
}
