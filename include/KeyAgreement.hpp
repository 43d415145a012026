#pragma once

#include <cstdint>
#include <random>
#include <string_view>
#include "EccTypes.hpp"

namespace toy_ecc {

/**
 * ECDH-style key agreement on the configured curve.
 *
 * Both sides arrive at the same point because k*(d*G) == d*(k*G):
 * the sender computes k*Q, the receiver d*C1.
 *
 * Private scalars come from std::mt19937_64, which is NOT a
 * cryptographic random source. Do not reuse for real keys.
 */
class KeyAgreement {
public:
    // Uniform in [1, n-1]
    static uint64_t generatePrivateScalar(const CurveParams& params);
    static uint64_t generatePrivateScalar(const CurveParams& params, std::mt19937_64& engine);

    // Throws EccError(ScalarOutOfRange) unless 1 <= k <= n-1
    static void requireScalarInRange(const CurveParams& params, uint64_t k,
                                     std::string_view what);

    static Point derivePublicKey(const CurveParams& params, uint64_t privateScalar);

    static KeyPair generateKeyPair(const CurveParams& params);
    static KeyPair generateKeyPair(const CurveParams& params, std::mt19937_64& engine);
    static KeyPair keyPairFromScalar(const CurveParams& params, uint64_t privateScalar);

    // scalar * otherPoint; otherPoint must lie on the curve
    static Point deriveSharedSecret(const CurveParams& params, uint64_t scalar,
                                    const Point& otherPoint);

    // x mod 2^32, or 0 for the identity
    static uint32_t seedFromPoint(const Point& point);

private:
    static std::mt19937_64& defaultEngine();

    // Prevent instantiation
    KeyAgreement() = delete;
    ~KeyAgreement() = delete;
    KeyAgreement(const KeyAgreement&) = delete;
    KeyAgreement& operator=(const KeyAgreement&) = delete;
};

} // namespace toy_ecc
