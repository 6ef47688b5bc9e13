#include "cosigner/platform_service.h"
#include "cosigner/cosigner_exception.h"
#include "logging/logging_t.h"

#include <openssl/rand.h>

#include <chrono>

namespace solana_tss
{
namespace common
{
namespace cosigner
{

void default_platform_service::gen_random(size_t len, uint8_t* random_data) const
{
    if (RAND_bytes(random_data, len) != 1)
    {
        LOG_ERROR("RAND_bytes failed to generate %lu bytes", len);
        throw cosigner_exception(cosigner_exception::INTERNAL_ERROR);
    }
}

uint64_t default_platform_service::now_msec() const
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now().time_since_epoch()).count();
}

}
}
}
