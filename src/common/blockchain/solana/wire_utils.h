#pragma once

#include "cosigner/types.h"

#include <stdint.h>

#include <string>

namespace solana_tss
{
namespace blockchain
{
namespace solana
{

// little endian, as bincode and the program instruction layouts expect
template<typename T>
inline void append_le(common::cosigner::byte_vector_t& out, T value)
{
    for (size_t i = 0; i < sizeof(T); ++i)
        out.push_back((uint8_t)((uint64_t)value >> (8 * i)));
}

inline void append_pubkey(common::cosigner::byte_vector_t& out, const common::cosigner::elliptic_curve_point& key)
{
    out.insert(out.end(), key.data, key.data + sizeof(ed25519_point_t));
}

// bincode string, u64 length prefix
inline void append_string(common::cosigner::byte_vector_t& out, const std::string& str)
{
    append_le<uint64_t>(out, str.size());
    out.insert(out.end(), str.begin(), str.end());
}

}
}
}
