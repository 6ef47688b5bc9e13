#pragma once

#include "solana_tss_export.h"

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

namespace solana_tss
{
namespace blockchain
{
namespace solana
{

SOLANA_TSS_EXPORT std::string base58_encode(const uint8_t* data, size_t len);
SOLANA_TSS_EXPORT std::string base58_encode(const std::vector<uint8_t>& data);
// throws DECODING_ERROR on characters outside the bitcoin alphabet
SOLANA_TSS_EXPORT std::vector<uint8_t> base58_decode(const std::string& str);
// decodes and checks the decoded size, throws DECODING_ERROR
SOLANA_TSS_EXPORT void base58_decode_fixed(const std::string& str, uint8_t* out, size_t len);

}
}
}
