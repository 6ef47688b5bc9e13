#include "cosigner/key_aggregation.h"
#include "cosigner/cosigner_exception.h"
#include "cosigner/mpc_globals.h"
#include "logging/logging_t.h"

#include <openssl/evp.h>

#include <algorithm>

namespace solana_tss
{
namespace common
{
namespace cosigner
{

static const char KEYSET_HASH_TAG[] = "solana-tss/keyagg/list";
static const char COEFFICIENT_HASH_TAG[] = "solana-tss/keyagg/coef";

const std::unique_ptr<ed25519_algebra_ctx_t, void(*)(ed25519_algebra_ctx_t*)> key_aggregation::_ed25519(ed25519_algebra_ctx_new(), ed25519_algebra_ctx_free);

key_aggregation::key_aggregation(const std::vector<elliptic_curve_point>& keys) : _keys(keys)
{
    if (!_ed25519)
    {
        LOG_ERROR("Failed to create ed25519 algebra");
        throw cosigner_exception(cosigner_exception::NO_MEM);
    }

    if (keys.size() < MIN_PARTICIPANTS || keys.size() > MAX_PARTICIPANTS)
    {
        LOG_ERROR("got %lu keys, key aggregation requires %u to %u keys", keys.size(), MIN_PARTICIPANTS, MAX_PARTICIPANTS);
        throw cosigner_exception(cosigner_exception::INVALID_KEY_SET);
    }

    std::vector<elliptic_curve_point> sorted(keys);
    std::sort(sorted.begin(), sorted.end());
    if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end())
    {
        LOG_ERROR("the key set contains duplicate keys");
        throw cosigner_exception(cosigner_exception::DUPLICATE_KEY);
    }

    for (auto i = sorted.begin(); i != sorted.end(); ++i)
        throw_cosigner_exception(ed25519_algebra_validate_public_key(_ed25519.get(), &i->data));

    _keyset_hash = calc_keyset_hash(sorted);

    bool first = true;
    for (auto i = sorted.begin(); i != sorted.end(); ++i)
    {
        elliptic_curve_scalar a = calc_coefficient(_keyset_hash, *i);
        elliptic_curve_point term;
        throw_cosigner_exception(ed25519_algebra_point_mul(_ed25519.get(), &term.data, &i->data, &a.data));
        if (first)
        {
            _aggregated_key = term;
            first = false;
        }
        else
            throw_cosigner_exception(ed25519_algebra_add_points(_ed25519.get(), &_aggregated_key.data, &_aggregated_key.data, &term.data));
        _coefficients[*i] = a;
    }

    if (ed25519_algebra_validate_public_key(_ed25519.get(), &_aggregated_key.data) != ELLIPTIC_CURVE_ALGEBRA_SUCCESS)
    {
        LOG_ERROR("aggregated public key is of small order");
        throw cosigner_exception(cosigner_exception::INTERNAL_ERROR);
    }
}

bool key_aggregation::contains(const elliptic_curve_point& key) const
{
    return _coefficients.find(key) != _coefficients.end();
}

const elliptic_curve_scalar& key_aggregation::coefficient(const elliptic_curve_point& key) const
{
    auto it = _coefficients.find(key);
    if (it == _coefficients.end())
        throw cosigner_exception(cosigner_exception::KEY_NOT_IN_KEY_SET);
    return it->second;
}

keyset_hash_t key_aggregation::calc_keyset_hash(const std::vector<elliptic_curve_point>& sorted_keys)
{
    keyset_hash_t hash;
    unsigned int hash_len = 0;
    std::unique_ptr<EVP_MD_CTX, void(*)(EVP_MD_CTX*)> md_ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!md_ctx)
        throw cosigner_exception(cosigner_exception::NO_MEM);

    bool ok = EVP_DigestInit_ex(md_ctx.get(), EVP_sha512(), NULL) &&
              EVP_DigestUpdate(md_ctx.get(), KEYSET_HASH_TAG, sizeof(KEYSET_HASH_TAG) - 1);
    for (auto i = sorted_keys.begin(); ok && i != sorted_keys.end(); ++i)
        ok = EVP_DigestUpdate(md_ctx.get(), i->data, sizeof(ed25519_point_t));
    ok = ok && EVP_DigestFinal_ex(md_ctx.get(), hash.data(), &hash_len);

    if (!ok || hash_len != hash.size())
    {
        LOG_ERROR("failed to hash key set");
        throw cosigner_exception(cosigner_exception::INTERNAL_ERROR);
    }
    return hash;
}

elliptic_curve_scalar key_aggregation::calc_coefficient(const keyset_hash_t& keyset_hash, const elliptic_curve_point& key)
{
    byte_vector_t data;
    data.reserve(sizeof(COEFFICIENT_HASH_TAG) - 1 + keyset_hash.size() + sizeof(ed25519_point_t));
    data.insert(data.end(), COEFFICIENT_HASH_TAG, COEFFICIENT_HASH_TAG + sizeof(COEFFICIENT_HASH_TAG) - 1);
    data.insert(data.end(), keyset_hash.begin(), keyset_hash.end());
    data.insert(data.end(), key.data, key.data + sizeof(ed25519_point_t));

    elliptic_curve_scalar a;
    throw_cosigner_exception(ed25519_algebra_hash_to_scalar(_ed25519.get(), &a.data, data.data(), data.size()));
    return a;
}

elliptic_curve_point aggregate_public_keys(const std::vector<elliptic_curve_point>& keys)
{
    return key_aggregation(keys).aggregated_public_key();
}

}
}
}
