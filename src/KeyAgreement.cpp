#include "KeyAgreement.hpp"
#include "Curve.hpp"
#include "Codec.hpp"
#include "Logger.hpp"
#include <string>
#include <openssl/crypto.h>

namespace toy_ecc {

KeyPair::~KeyPair() {
    OPENSSL_cleanse(&privateScalar, sizeof(privateScalar));
}

std::mt19937_64& KeyAgreement::defaultEngine() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    return engine;
}

uint64_t KeyAgreement::generatePrivateScalar(const CurveParams& params) {
    return generatePrivateScalar(params, defaultEngine());
}

uint64_t KeyAgreement::generatePrivateScalar(const CurveParams& params,
                                             std::mt19937_64& engine) {
    if (params.n < 2) {
        std::string message = "Claimed order n=" + std::to_string(params.n) +
            " leaves no valid private scalar";
        Logger::logError(ErrorCode::InvalidCurveParameters, message);
        throw EccError(ErrorCode::InvalidCurveParameters, message);
    }

    std::uniform_int_distribution<uint64_t> dist(1, params.n - 1);
    uint64_t d = dist(engine);
    Logger::logEvent(LogLevel::Security,
        "Private scalar drawn from a non-cryptographic generator");
    return d;
}

void KeyAgreement::requireScalarInRange(const CurveParams& params, uint64_t k,
                                        std::string_view what) {
    if (k >= 1 && k < params.n) {
        return;
    }
    std::string message = std::string(what) + " " + std::to_string(k) +
        " outside [1, " + std::to_string(params.n > 0 ? params.n - 1 : 0) + "]";
    Logger::logError(ErrorCode::ScalarOutOfRange, message);
    throw EccError(ErrorCode::ScalarOutOfRange, message);
}

Point KeyAgreement::derivePublicKey(const CurveParams& params, uint64_t privateScalar) {
    requireScalarInRange(params, privateScalar, "Private scalar");
    return Curve::scalarMultiply(params, privateScalar, params.generator());
}

KeyPair KeyAgreement::generateKeyPair(const CurveParams& params) {
    return generateKeyPair(params, defaultEngine());
}

KeyPair KeyAgreement::generateKeyPair(const CurveParams& params, std::mt19937_64& engine) {
    KeyPair kp = keyPairFromScalar(params, generatePrivateScalar(params, engine));
    Logger::logEvent(LogLevel::Info,
        "Generated key pair, Q = " + Codec::formatPoint(kp.publicPoint));
    return kp;
}

KeyPair KeyAgreement::keyPairFromScalar(const CurveParams& params, uint64_t privateScalar) {
    return KeyPair(privateScalar, derivePublicKey(params, privateScalar));
}

Point KeyAgreement::deriveSharedSecret(const CurveParams& params, uint64_t scalar,
                                       const Point& otherPoint) {
    requireScalarInRange(params, scalar, "Scalar");
    Curve::requireOnCurve(params, otherPoint, "Peer point");

    Point shared = Curve::scalarMultiply(params, scalar, otherPoint);
    if (isIdentity(shared)) {
        Logger::logEvent(LogLevel::Warning,
            "Shared point is the identity; keystream seed collapses to 0");
    }
    return shared;
}

uint32_t KeyAgreement::seedFromPoint(const Point& point) {
    const auto* a = std::get_if<Affine>(&point);
    if (!a) {
        return 0;
    }
    return static_cast<uint32_t>(a->x & 0xFFFFFFFFu);
}

} // namespace toy_ecc
