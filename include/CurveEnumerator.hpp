#pragma once

#include <vector>
#include "EccTypes.hpp"

namespace toy_ecc {

// Brute-force listing of curve points for plotting. O(p^2); small fields only.
class CurveEnumerator {
public:
    // Every affine solution in increasing (x, y) order; the identity is omitted
    static std::vector<Point> enumeratePoints(const CurveParams& params);

    static CurveSummary summarize(const CurveParams& params);

private:
    // Prevent instantiation
    CurveEnumerator() = delete;
    ~CurveEnumerator() = delete;
    CurveEnumerator(const CurveEnumerator&) = delete;
    CurveEnumerator& operator=(const CurveEnumerator&) = delete;
};

} // namespace toy_ecc
