#include "cosigner/signing_session.h"
#include "cosigner/cosigner_exception.h"
#include "utils.h"
#include "logging/logging_t.h"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <algorithm>
#include <memory>

namespace solana_tss
{
namespace common
{
namespace cosigner
{

const char* to_string(signing_session_status status)
{
    switch (status)
    {
    case AWAITING_COMMIT: return "AWAITING_COMMIT";
    case AWAITING_PARTIAL: return "AWAITING_PARTIAL";
    case AGGREGATED: return "AGGREGATED";
    case EXPIRED: return "EXPIRED";
    case CANCELLED: return "CANCELLED";
    default:
        return "UNKNOWN";
    }
}

std::string signing_session_identity(const byte_vector_t& message, const std::vector<elliptic_curve_point>& keys, const elliptic_curve_point& self_key)
{
    std::vector<elliptic_curve_point> sorted(keys);
    std::sort(sorted.begin(), sorted.end());

    uint8_t hash[SHA256_DIGEST_LENGTH];
    unsigned int hash_len = 0;
    std::unique_ptr<EVP_MD_CTX, void(*)(EVP_MD_CTX*)> md_ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!md_ctx)
        throw cosigner_exception(cosigner_exception::NO_MEM);

    bool ok = EVP_DigestInit_ex(md_ctx.get(), EVP_sha256(), NULL) &&
              EVP_DigestUpdate(md_ctx.get(), message.data(), message.size());
    for (auto i = sorted.begin(); ok && i != sorted.end(); ++i)
        ok = EVP_DigestUpdate(md_ctx.get(), i->data, sizeof(ed25519_point_t));
    ok = ok && EVP_DigestUpdate(md_ctx.get(), self_key.data, sizeof(ed25519_point_t)) &&
         EVP_DigestFinal_ex(md_ctx.get(), hash, &hash_len);

    if (!ok || hash_len != sizeof(hash))
    {
        LOG_ERROR("failed to calc session identity");
        throw cosigner_exception(cosigner_exception::INTERNAL_ERROR);
    }
    return to_hex(hash, sizeof(hash));
}

}
}
}
