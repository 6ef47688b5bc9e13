#pragma once

#include "solana_tss_export.h"

#include <stddef.h>
#include <stdint.h>

namespace solana_tss
{
namespace common
{
namespace cosigner
{

class SOLANA_TSS_EXPORT platform_service
{
public:
    virtual ~platform_service() {}

    // generate true randomness
    virtual void gen_random(size_t len, uint8_t* random_data) const = 0;
    // returns a monotonic time in milliseconds, used for session expiry
    virtual uint64_t now_msec() const = 0;
};

// RAND_bytes and the steady clock
class SOLANA_TSS_EXPORT default_platform_service final : public platform_service
{
public:
    void gen_random(size_t len, uint8_t* random_data) const override;
    uint64_t now_msec() const override;
};

}
}
}
