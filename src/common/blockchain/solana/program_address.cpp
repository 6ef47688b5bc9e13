#include "blockchain/solana/program_address.h"
#include "cosigner/cosigner_exception.h"
#include "logging/logging_t.h"

#include <openssl/evp.h>

#include <memory>

namespace solana_tss
{
namespace blockchain
{
namespace solana
{

using common::cosigner::byte_vector_t;
using common::cosigner::cosigner_exception;

static const char PDA_MARKER[] = "ProgramDerivedAddress";

static const std::unique_ptr<ed25519_algebra_ctx_t, void(*)(ed25519_algebra_ctx_t*)> _ed25519(ed25519_algebra_ctx_new(), ed25519_algebra_ctx_free);

namespace
{

class sha256_digest
{
public:
    sha256_digest() : _ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free)
    {
        if (!_ctx)
            throw cosigner_exception(cosigner_exception::NO_MEM);
        if (!EVP_DigestInit_ex(_ctx.get(), EVP_sha256(), NULL))
            failed();
    }

    void update(const uint8_t* data, size_t len)
    {
        if (len && !EVP_DigestUpdate(_ctx.get(), data, len))
            failed();
    }

    elliptic_curve_point final()
    {
        elliptic_curve_point ret;
        unsigned int len = 0;
        if (!EVP_DigestFinal_ex(_ctx.get(), ret.data, &len) || len != sizeof(ed25519_point_t))
            failed();
        return ret;
    }

private:
    [[noreturn]] static void failed()
    {
        LOG_ERROR("sha256 failed");
        throw cosigner_exception(cosigner_exception::INTERNAL_ERROR);
    }

    std::unique_ptr<EVP_MD_CTX, void(*)(EVP_MD_CTX*)> _ctx;
};

}

elliptic_curve_point create_with_seed(const elliptic_curve_point& base, const std::string& seed, const elliptic_curve_point& owner)
{
    if (seed.size() > MAX_SEED_LEN)
    {
        LOG_ERROR("seed length %lu exceeds %lu", seed.size(), MAX_SEED_LEN);
        throw cosigner_exception(cosigner_exception::INVALID_PARAMETERS);
    }

    sha256_digest digest;
    digest.update(base.data, sizeof(ed25519_point_t));
    digest.update((const uint8_t*)seed.data(), seed.size());
    digest.update(owner.data, sizeof(ed25519_point_t));
    return digest.final();
}

elliptic_curve_point find_program_address(const std::vector<byte_vector_t>& seeds, const elliptic_curve_point& program_id, uint8_t* bump)
{
    if (!_ed25519)
    {
        LOG_ERROR("Failed to create ed25519 algebra");
        throw cosigner_exception(cosigner_exception::NO_MEM);
    }
    if (seeds.size() >= MAX_SEEDS)
    {
        LOG_ERROR("got %lu seeds, the bump seed must fit in %lu", seeds.size(), MAX_SEEDS);
        throw cosigner_exception(cosigner_exception::INVALID_PARAMETERS);
    }
    for (auto i = seeds.begin(); i != seeds.end(); ++i)
    {
        if (i->size() > MAX_SEED_LEN)
        {
            LOG_ERROR("seed length %lu exceeds %lu", i->size(), MAX_SEED_LEN);
            throw cosigner_exception(cosigner_exception::INVALID_PARAMETERS);
        }
    }

    for (int candidate = 255; candidate >= 0; --candidate)
    {
        uint8_t bump_seed = (uint8_t)candidate;
        sha256_digest digest;
        for (auto i = seeds.begin(); i != seeds.end(); ++i)
            digest.update(i->data(), i->size());
        digest.update(&bump_seed, 1);
        digest.update(program_id.data, sizeof(ed25519_point_t));
        digest.update((const uint8_t*)PDA_MARKER, sizeof(PDA_MARKER) - 1);
        elliptic_curve_point address = digest.final();

        // program addresses must not have a private key
        if (ed25519_algebra_is_point_on_curve(_ed25519.get(), &address.data) != ELLIPTIC_CURVE_ALGEBRA_SUCCESS)
        {
            if (bump)
                *bump = bump_seed;
            return address;
        }
    }
    LOG_ERROR("no viable bump seed for program address");
    throw cosigner_exception(cosigner_exception::INVALID_PARAMETERS);
}

}
}
}
