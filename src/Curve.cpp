#include "Curve.hpp"
#include "Codec.hpp"
#include "Field.hpp"
#include "Logger.hpp"
#include <cmath>
#include <string>
#include <openssl/bn.h>
#include <openssl/err.h>

namespace toy_ecc {

namespace {
    void handleOpenSSLError(const std::string& operation) {
        std::string error;
        while (unsigned long err = ERR_get_error()) {
            char err_buf[256];
            ERR_error_string_n(err, err_buf, sizeof(err_buf));
            if (!error.empty()) error += "; ";
            error += err_buf;
        }
        throw EccError(ErrorCode::ProcessingError, operation + " failed: " + error);
    }

    class ScopedBIGNUM {
    public:
        ScopedBIGNUM() : bn_(BN_new()) {
            if (!bn_) handleOpenSSLError("BN_new");
        }
        ~ScopedBIGNUM() { BN_free(bn_); }
        BIGNUM* get() { return bn_; }
    private:
        BIGNUM* bn_;
    };

    class ScopedBN_CTX {
    public:
        ScopedBN_CTX() : ctx_(BN_CTX_new()) {
            if (!ctx_) handleOpenSSLError("BN_CTX_new");
        }
        ~ScopedBN_CTX() { BN_CTX_free(ctx_); }
        BN_CTX* get() { return ctx_; }
    private:
        BN_CTX* ctx_;
    };

    bool isPrime(uint64_t p) {
        ScopedBIGNUM bn;
        ScopedBN_CTX ctx;
        if (!BN_set_word(bn.get(), static_cast<BN_ULONG>(p))) {
            handleOpenSSLError("BN_set_word");
        }
        int rc = BN_check_prime(bn.get(), ctx.get(), nullptr);
        if (rc < 0) {
            handleOpenSSLError("BN_check_prime");
        }
        return rc == 1;
    }

    [[noreturn]] void rejectParams(const std::string& reason) {
        Logger::logError(ErrorCode::InvalidCurveParameters, reason);
        throw EccError(ErrorCode::InvalidCurveParameters, reason);
    }
}

bool Curve::isOnCurve(const CurveParams& params, const Point& point) {
    const auto* a = std::get_if<Affine>(&point);
    if (!a) {
        return true; // Identity by convention
    }
    const uint64_t p = params.p;
    if (a->x >= p || a->y >= p) {
        return false;
    }

    FieldElement lhs = Field::multiply(a->y, a->y, p);
    FieldElement x3 = Field::multiply(Field::multiply(a->x, a->x, p), a->x, p);
    FieldElement rhs = Field::add(Field::add(x3, Field::multiply(params.a, a->x, p), p),
                                  params.b, p);
    return lhs == rhs;
}

void Curve::requireOnCurve(const CurveParams& params, const Point& point,
                           std::string_view what) {
    if (isOnCurve(params, point)) {
        return;
    }
    std::string message = std::string(what) + " " + Codec::formatPoint(point) +
        " is not on the curve";
    Logger::logError(ErrorCode::PointNotOnCurve, message);
    throw EccError(ErrorCode::PointNotOnCurve, message);
}

Point Curve::negate(const CurveParams& params, const Point& point) {
    const auto* a = std::get_if<Affine>(&point);
    if (!a) {
        return Identity{};
    }
    return Affine{a->x, Field::negate(a->y, params.p)};
}

Point Curve::add(const CurveParams& params, const Point& lhs, const Point& rhs) {
    const auto* P = std::get_if<Affine>(&lhs);
    const auto* Q = std::get_if<Affine>(&rhs);
    if (!P) return rhs;
    if (!Q) return lhs;

    const uint64_t p = params.p;

    // Mutual negatives, including doubling a point with y == 0
    if (P->x == Q->x && Field::add(P->y, Q->y, p) == 0) {
        return Identity{};
    }

    FieldElement m;
    if (!(*P == *Q)) {
        // Secant through P and Q
        m = Field::multiply(Field::subtract(Q->y, P->y, p),
                            Field::inverse(Field::subtract(Q->x, P->x, p), p), p);
    } else {
        // Tangent at P
        FieldElement num = Field::add(
            Field::multiply(3, Field::multiply(P->x, P->x, p), p), params.a, p);
        m = Field::multiply(num, Field::inverse(Field::multiply(2, P->y, p), p), p);
    }

    FieldElement x3 = Field::subtract(Field::subtract(Field::multiply(m, m, p), P->x, p), Q->x, p);
    FieldElement y3 = Field::subtract(Field::multiply(m, Field::subtract(P->x, x3, p), p), P->y, p);
    return Affine{x3, y3};
}

Point Curve::doublePoint(const CurveParams& params, const Point& point) {
    return add(params, point, point);
}

Point Curve::scalarMultiply(const CurveParams& params, uint64_t k, const Point& point) {
    Point result = Identity{};
    Point addend = point;
    while (k > 0) {
        if (k & 1) {
            result = add(params, result, addend);
        }
        addend = doublePoint(params, addend);
        k >>= 1;
    }
    return result;
}

bool Curve::verifyGroupOrder(const CurveParams& params) {
    bool ok = isIdentity(scalarMultiply(params, params.n, params.generator()));
    Logger::logEvent(ok ? LogLevel::Debug : LogLevel::Warning,
        "Claimed order n=" + std::to_string(params.n) +
        (ok ? " annihilates G" : " does not annihilate G"));
    return ok;
}

uint64_t Curve::pointOrder(const CurveParams& params, const Point& point) {
    // Hasse: #E <= p + 1 + 2*sqrt(p)
    const uint64_t bound = params.p + 2 +
        2 * static_cast<uint64_t>(std::sqrt(static_cast<double>(params.p)));

    Point acc = point;
    uint64_t m = 1;
    while (!isIdentity(acc)) {
        if (++m > bound) {
            std::string message = "No order found for " + Codec::formatPoint(point) +
                " within " + std::to_string(bound) + " steps";
            Logger::logError(ErrorCode::InvalidCurveParameters, message);
            throw EccError(ErrorCode::InvalidCurveParameters, message);
        }
        acc = add(params, acc, point);
    }
    return m;
}

void Curve::validateParams(const CurveParams& params) {
    const uint64_t p = params.p;
    if (p < 3 || p > EccLimits::MAX_PRIME) {
        rejectParams("Modulus " + std::to_string(p) + " outside [3, 2^63)");
    }
    if (!isPrime(p)) {
        rejectParams("Modulus " + std::to_string(p) + " is not prime");
    }
    if (params.a >= p || params.b >= p) {
        rejectParams("Coefficients a and b must be reduced mod p");
    }

    // 4a^3 + 27b^2 != 0 mod p
    FieldElement a3 = Field::multiply(Field::multiply(params.a, params.a, p), params.a, p);
    FieldElement b2 = Field::multiply(params.b, params.b, p);
    FieldElement disc = Field::add(Field::multiply(4, a3, p), Field::multiply(27, b2, p), p);
    if (disc == 0) {
        rejectParams("Curve is singular (4a^3 + 27b^2 == 0 mod p)");
    }

    if (!isOnCurve(params, params.generator())) {
        rejectParams("Base point " + Codec::formatPoint(params.generator()) +
                     " is not on the curve");
    }
    if (params.n < 2) {
        rejectParams("Claimed order n must be at least 2");
    }

    Logger::logEvent(LogLevel::Debug, "Curve parameters validated, p=" + std::to_string(p));
}

} // namespace toy_ecc
