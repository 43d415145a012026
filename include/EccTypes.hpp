#pragma once // Ensures this header is included only once during compilation

#include <string>    // Provides the std::string type
#include <vector>    // Provides the std::vector container
#include <cstdint>   // Provides fixed-width integer types like uint64_t
#include <cstddef>   // Provides std::size_t
#include <variant>   // Provides std::variant for the point sum type
#include <stdexcept> // Provides std::runtime_error as the base of EccError

namespace toy_ecc { // Begin namespace toy_ecc to group related functionality

// Error codes for the toy ECC library
enum class ErrorCode {
    None = 0,
    PointNotOnCurve,
    MalformedHexInput,
    ScalarOutOfRange,
    InvalidCurveParameters,
    MalformedPointInput,
    MalformedScalarInput,
    InvalidParameter,
    ProcessingError
};

// Converts an ErrorCode to a human-readable string
inline const char* toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:
            return "No error"; // If no error
        case ErrorCode::PointNotOnCurve:
            return "Point Not On Curve"; // If a supplied point fails y^2 = x^3 + ax + b
        case ErrorCode::MalformedHexInput:
            return "Malformed Hex Input"; // If hex text cannot be paired into bytes
        case ErrorCode::ScalarOutOfRange:
            return "Scalar Out Of Range"; // If a scalar lies outside [1, n-1]
        case ErrorCode::InvalidCurveParameters:
            return "Invalid Curve Parameters"; // If p, a, b, G or n are unusable
        case ErrorCode::MalformedPointInput:
            return "Malformed Point Input"; // If "x,y" text cannot be parsed
        case ErrorCode::MalformedScalarInput:
            return "Malformed Scalar Input"; // If decimal scalar text cannot be parsed
        case ErrorCode::InvalidParameter:
            return "Invalid Parameter"; // If an invalid parameter was provided
        case ErrorCode::ProcessingError:
            return "Processing Error"; // If a general error happened in processing
        default:
            return "Unknown error"; // Catch-all for unhandled error codes
    }
}

// Exception carrying an ErrorCode; every recoverable failure in the library is one of these
class EccError : public std::runtime_error {
public:
    EccError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

// An integer in [0, p)
using FieldElement = uint64_t;

// The neutral element ("point at infinity"); it has no coordinates
struct Identity {
    bool operator==(const Identity&) const = default;
};

struct Affine {
    FieldElement x;
    FieldElement y;

    bool operator==(const Affine&) const = default;
};

// A curve point is either the identity or an affine pair.
// std::variant's operator== gives the point equality rule for free.
using Point = std::variant<Identity, Affine>;

inline bool isIdentity(const Point& p) {
    return std::holds_alternative<Identity>(p);
}

// Fixed configuration of the demonstration curve y^2 = x^3 + 2x + 3 mod 97
struct ToyCurve {
    static constexpr uint64_t P = 97;
    static constexpr uint64_t A = 2;
    static constexpr uint64_t B = 3;
    static constexpr FieldElement GX = 0;
    static constexpr FieldElement GY = 10;
    static constexpr uint64_t N = 50; // Asserted order of G, not derived
};

// Immutable curve configuration. n is trusted, not verified; see Curve::verifyGroupOrder.
struct CurveParams {
    uint64_t p;
    uint64_t a;
    uint64_t b;
    Affine g;
    uint64_t n;

    static constexpr CurveParams toyCurve() {
        return CurveParams{ToyCurve::P, ToyCurve::A, ToyCurve::B,
                           Affine{ToyCurve::GX, ToyCurve::GY}, ToyCurve::N};
    }

    Point generator() const { return Point{g}; }
};

// Structure for key pairs; the public point is always derived from the scalar
struct KeyPair {
    uint64_t privateScalar = 0;
    Point publicPoint;

    KeyPair() = default;
    KeyPair(uint64_t d, Point q) : privateScalar(d), publicPoint(q) {}
    KeyPair(const KeyPair&) = default;
    KeyPair& operator=(const KeyPair&) = default;
    ~KeyPair();
};

// Structure for encrypted messages; only C1 crosses the boundary, never k
struct EncryptedMessage {
    Point ephemeralPoint;
    std::vector<uint8_t> ciphertext;
};

// Statistics of a curve as shown next to the plotted points
struct CurveSummary {
    std::size_t pointCount;  // Affine points only
    std::size_t groupOrder;  // pointCount + 1 for the identity
    uint64_t prime;
    uint64_t claimedOrder;
};

// Limits for parameters accepted by the library
struct EccLimits {
    static constexpr uint64_t MAX_PRIME = (uint64_t{1} << 63) - 1;
    static constexpr uint64_t MAX_ENUMERATION_PRIME = 65536; // O(p^2) search
};

} // namespace toy_ecc
