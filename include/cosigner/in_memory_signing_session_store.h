#pragma once

#include "solana_tss_export.h"

#include "cosigner/signing_session_store.h"
#include "cosigner/mpc_globals.h"

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace solana_tss
{
namespace common
{
namespace cosigner
{

class platform_service;

class SOLANA_TSS_EXPORT in_memory_signing_session_store final : public signing_session_store
{
public:
    in_memory_signing_session_store(const platform_service& service, uint64_t session_timeout_msec = DEFAULT_SESSION_TIMEOUT_MSEC);

    in_memory_signing_session_store(const in_memory_signing_session_store&) = delete;
    in_memory_signing_session_store& operator=(const in_memory_signing_session_store&) = delete;

    void create_session(std::shared_ptr<signing_session> session) override;
    locked_session lock_session(const std::string& session_id) override;
    std::string find_session(const std::string& identity) override;
    void remove_session(const std::string& session_id) override;
    size_t expire_sessions() override;
    size_t size() const override;

private:
    bool timed_out(const signing_session& session, uint64_t now) const;
    void erase_locked(std::map<std::string, std::shared_ptr<signing_session>>::iterator it);

    const platform_service& _service;
    const uint64_t _timeout_msec;

    mutable std::mutex _lock;
    std::map<std::string, std::shared_ptr<signing_session>> _sessions;
    // identity -> session id, only live sessions are indexed
    std::map<std::string, std::string> _identities;
};

}
}
}
