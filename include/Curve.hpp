#pragma once

#include <cstdint>
#include <string_view>
#include "EccTypes.hpp"

namespace toy_ecc {

/**
 * Group law for short Weierstrass curves y^2 = x^3 + ax + b over Z/pZ.
 *
 * All operations are pure functions of their arguments. Scalar
 * multiplication is plain double-and-add and leaks the bit pattern of the
 * scalar through timing; it is for teaching only.
 */
class Curve {
public:
    static bool isOnCurve(const CurveParams& params, const Point& point);

    // Throws EccError(PointNotOnCurve) naming `what` in the message
    static void requireOnCurve(const CurveParams& params, const Point& point,
                               std::string_view what);

    static Point negate(const CurveParams& params, const Point& point);
    static Point add(const CurveParams& params, const Point& lhs, const Point& rhs);
    static Point doublePoint(const CurveParams& params, const Point& point);
    static Point scalarMultiply(const CurveParams& params, uint64_t k, const Point& point);

    // n*G == Identity. Not called by key generation.
    static bool verifyGroupOrder(const CurveParams& params);

    // Smallest m >= 1 with m*P == Identity, searched up to the Hasse bound
    static uint64_t pointOrder(const CurveParams& params, const Point& point);

    // Throws EccError(InvalidCurveParameters) unless p is prime and in range,
    // a and b are reduced, the curve is non-singular and G lies on it.
    static void validateParams(const CurveParams& params);

private:
    // Prevent instantiation
    Curve() = delete;
    ~Curve() = delete;
    Curve(const Curve&) = delete;
    Curve& operator=(const Curve&) = delete;
};

} // namespace toy_ecc
