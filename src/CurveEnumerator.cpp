#include "CurveEnumerator.hpp"
#include "Field.hpp"
#include "Logger.hpp"
#include <string>

namespace toy_ecc {

std::vector<Point> CurveEnumerator::enumeratePoints(const CurveParams& params) {
    const uint64_t p = params.p;
    if (p < 2 || p > EccLimits::MAX_ENUMERATION_PRIME) {
        std::string message = "Refusing to enumerate points for p=" + std::to_string(p);
        Logger::logError(ErrorCode::InvalidParameter, message);
        throw EccError(ErrorCode::InvalidParameter, message);
    }

    std::vector<Point> points;
    for (FieldElement x = 0; x < p; ++x) {
        FieldElement x3 = Field::multiply(Field::multiply(x, x, p), x, p);
        FieldElement rhs = Field::add(Field::add(x3, Field::multiply(params.a, x, p), p),
                                      params.b, p);
        for (FieldElement y = 0; y < p; ++y) {
            if (Field::multiply(y, y, p) == rhs) {
                points.push_back(Affine{x, y});
            }
        }
    }

    Logger::logEvent(LogLevel::Debug, "Enumerated " + std::to_string(points.size()) +
        " affine points for p=" + std::to_string(p));
    return points;
}

CurveSummary CurveEnumerator::summarize(const CurveParams& params) {
    std::size_t count = enumeratePoints(params).size();
    return CurveSummary{count, count + 1, params.p, params.n};
}

} // namespace toy_ecc
