#pragma once

#include <stddef.h>
#include <stdint.h>
#include <string>

namespace solana_tss
{
namespace common
{
namespace cosigner
{

class platform_service;

std::string to_hex(const uint8_t* data, size_t len);
std::string generate_session_id(const platform_service& service);

}
}
}
