#include "blockchain/solana/base58.h"
#include "cosigner/cosigner_exception.h"
#include "logging/logging_t.h"

#include <openssl/crypto.h>
#include <string.h>

namespace solana_tss
{
namespace blockchain
{
namespace solana
{

using common::cosigner::cosigner_exception;

static const char BASE58_ALPHABET[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

std::string base58_encode(const uint8_t* data, size_t len)
{
    size_t zeros = 0;
    while (zeros < len && data[zeros] == 0)
        zeros++;

    // repeated division of the big endian number by 58
    std::vector<uint8_t> num(data + zeros, data + len);
    std::string enc;
    enc.reserve(len * 138 / 100 + 1);
    while (!num.empty())
    {
        std::vector<uint8_t> quotient;
        quotient.reserve(num.size());
        uint32_t rem = 0;
        for (auto i = num.begin(); i != num.end(); ++i)
        {
            uint32_t cur = (rem << 8) + *i;
            uint32_t digit = cur / 58;
            rem = cur % 58;
            if (!quotient.empty() || digit)
                quotient.push_back((uint8_t)digit);
        }
        enc.push_back(BASE58_ALPHABET[rem]);
        num.swap(quotient);
    }

    std::string ret(zeros, '1');
    ret.append(enc.rbegin(), enc.rend());
    return ret;
}

std::string base58_encode(const std::vector<uint8_t>& data)
{
    return base58_encode(data.data(), data.size());
}

std::vector<uint8_t> base58_decode(const std::string& str)
{
    size_t zeros = 0;
    while (zeros < str.size() && str[zeros] == '1')
        zeros++;

    // little endian accumulator, multiplied by 58 for every digit
    std::vector<uint8_t> num;
    num.reserve(str.size() * 733 / 1000 + 1);
    for (size_t i = zeros; i < str.size(); ++i)
    {
        const char* pos = strchr(BASE58_ALPHABET, str[i]);
        if (!str[i] || !pos)
        {
            LOG_ERROR("invalid base58 character at index %lu", i);
            throw cosigner_exception(cosigner_exception::DECODING_ERROR);
        }
        uint32_t carry = (uint32_t)(pos - BASE58_ALPHABET);
        for (auto j = num.begin(); j != num.end(); ++j)
        {
            carry += (uint32_t)*j * 58;
            *j = carry & 0xff;
            carry >>= 8;
        }
        while (carry)
        {
            num.push_back(carry & 0xff);
            carry >>= 8;
        }
    }

    std::vector<uint8_t> ret(zeros, 0);
    ret.insert(ret.end(), num.rbegin(), num.rend());
    return ret;
}

void base58_decode_fixed(const std::string& str, uint8_t* out, size_t len)
{
    std::vector<uint8_t> decoded = base58_decode(str);
    if (decoded.size() != len)
    {
        OPENSSL_cleanse(decoded.data(), decoded.size());
        LOG_ERROR("decoded %lu bytes, expected %lu", decoded.size(), len);
        throw cosigner_exception(cosigner_exception::DECODING_ERROR);
    }
    memcpy(out, decoded.data(), len);
    OPENSSL_cleanse(decoded.data(), decoded.size());
}

}
}
}
