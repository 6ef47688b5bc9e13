#pragma once

#include "solana_tss_export.h"

#include "cosigner/signing_session.h"

#include <memory>
#include <mutex>
#include <string>

namespace solana_tss
{
namespace common
{
namespace cosigner
{

// exclusive access to a session, the session mutex is released when this object is destroyed
class locked_session
{
public:
    locked_session(std::shared_ptr<signing_session> session, std::unique_lock<std::mutex>&& guard) : _session(std::move(session)), _guard(std::move(guard)) {}
    locked_session(locked_session&&) = default;
    locked_session(const locked_session&) = delete;
    locked_session& operator=(const locked_session&) = delete;

    signing_session* operator->() const {return _session.get();}
    signing_session& operator*() const {return *_session;}

private:
    // the guard must be released before the session reference
    std::shared_ptr<signing_session> _session;
    std::unique_lock<std::mutex> _guard;
};

class SOLANA_TSS_EXPORT signing_session_store
{
public:
    virtual ~signing_session_store();

    // takes ownership of a fully initialized session, throws DUPLICATE_SESSION if a live session with the same identity exists
    virtual void create_session(std::shared_ptr<signing_session> session) = 0;
    // throws SESSION_NOT_FOUND for unknown or timed out sessions, SESSION_BUSY if another request holds the session
    virtual locked_session lock_session(const std::string& session_id) = 0;
    // returns the id of the live session with this identity or an empty string
    virtual std::string find_session(const std::string& identity) = 0;
    virtual void remove_session(const std::string& session_id) = 0;
    // evicts timed out sessions, returns the number of sessions removed
    virtual size_t expire_sessions() = 0;
    virtual size_t size() const = 0;
};

}
}
}
