#include "utils.h"
#include "cosigner/mpc_globals.h"
#include "cosigner/platform_service.h"

namespace solana_tss
{
namespace common
{
namespace cosigner
{

std::string to_hex(const uint8_t* data, size_t len)
{
    static const char HEX[] = "0123456789abcdef";
    std::string ret;
    ret.reserve(len * 2);
    for (size_t i = 0; i < len; ++i)
    {
        ret.push_back(HEX[data[i] >> 4]);
        ret.push_back(HEX[data[i] & 0x0f]);
    }
    return ret;
}

std::string generate_session_id(const platform_service& service)
{
    uint8_t id[SESSION_ID_SIZE];
    service.gen_random(sizeof(id), id);
    return to_hex(id, sizeof(id));
}

}
}
}
