#pragma once

#include "solana_tss_export.h"

#include "cosigner/types.h"

#include <array>
#include <map>
#include <memory>
#include <vector>

namespace solana_tss
{
namespace common
{
namespace cosigner
{

typedef std::array<uint8_t, 64> keyset_hash_t;

// Rogue key resistant key aggregation:
//   L = H(sorted keys), a_i = H(L || P_i), aggregated key = sum(a_i * P_i)
// The result doesn't depend on the order of the supplied keys.
class SOLANA_TSS_EXPORT key_aggregation final
{
public:
    explicit key_aggregation(const std::vector<elliptic_curve_point>& keys);

    const elliptic_curve_point& aggregated_public_key() const {return _aggregated_key;}
    const keyset_hash_t& keyset_hash() const {return _keyset_hash;}
    const std::vector<elliptic_curve_point>& keys() const {return _keys;}

    bool contains(const elliptic_curve_point& key) const;
    // throws KEY_NOT_IN_KEY_SET
    const elliptic_curve_scalar& coefficient(const elliptic_curve_point& key) const;

private:
    static keyset_hash_t calc_keyset_hash(const std::vector<elliptic_curve_point>& sorted_keys);
    static elliptic_curve_scalar calc_coefficient(const keyset_hash_t& keyset_hash, const elliptic_curve_point& key);

    std::vector<elliptic_curve_point> _keys;
    keyset_hash_t _keyset_hash;
    std::map<elliptic_curve_point, elliptic_curve_scalar> _coefficients;
    elliptic_curve_point _aggregated_key;

    static const std::unique_ptr<ed25519_algebra_ctx_t, void(*)(ed25519_algebra_ctx_t*)> _ed25519;
};

SOLANA_TSS_EXPORT elliptic_curve_point aggregate_public_keys(const std::vector<elliptic_curve_point>& keys);

}
}
}
