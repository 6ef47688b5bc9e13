#include "cosigner/cosigner_exception.h"
#include "logging/logging_t.h"

namespace solana_tss
{
namespace common
{
namespace cosigner
{

cosigner_exception::~cosigner_exception()
{
}

void throw_cosigner_exception(elliptic_curve_algebra_status status)
{
    switch (status)
    {
        case ELLIPTIC_CURVE_ALGEBRA_SUCCESS: return;
        case ELLIPTIC_CURVE_ALGEBRA_INVALID_PARAMETER: throw cosigner_exception(cosigner_exception::INVALID_PARAMETERS);
        case ELLIPTIC_CURVE_ALGEBRA_INVALID_POINT: throw cosigner_exception(cosigner_exception::DECODING_ERROR);
        case ELLIPTIC_CURVE_ALGEBRA_INVALID_SCALAR: throw cosigner_exception(cosigner_exception::DECODING_ERROR);
        case ELLIPTIC_CURVE_ALGEBRA_OUT_OF_MEMORY: throw cosigner_exception(cosigner_exception::NO_MEM);
        case ELLIPTIC_CURVE_ALGEBRA_INVALID_SIGNATURE: throw cosigner_exception(cosigner_exception::SIGNATURE_VERIFICATION_FAILED);
        case ELLIPTIC_CURVE_ALGEBRA_INSUFFICIENT_BUFFER:
        case ELLIPTIC_CURVE_ALGEBRA_UNKNOWN_ERROR:
        default:
            LOG_ERROR("ed25519 algebra failed with status %d", status);
            throw cosigner_exception(cosigner_exception::INTERNAL_ERROR);
    }
}

void throw_cosigner_exception(commitments_status status)
{
    switch (status)
    {
        case COMMITMENTS_SUCCESS: return;
        case COMMITMENTS_INVALID_PARAMETER: throw cosigner_exception(cosigner_exception::INVALID_PARAMETERS);
        case COMMITMENTS_OUT_OF_MEMORY: throw cosigner_exception(cosigner_exception::NO_MEM);
        case COMMITMENTS_INVALID_COMMITMENT: throw cosigner_exception(cosigner_exception::INVALID_COMMITMENT);
        case COMMITMENTS_INTERNAL_ERROR:
        default: throw cosigner_exception(cosigner_exception::INTERNAL_ERROR);
    }
}

}
}
}
