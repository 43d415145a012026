#pragma once

#include <cstdint>
#include "EccTypes.hpp"

namespace toy_ecc {

// Modular arithmetic over Z/pZ. The modulus is passed to every call;
// results always lie in [0, p). Requires 2 <= p < 2^63.
class Field {
public:
    static FieldElement reduce(int64_t x, uint64_t p);
    static FieldElement reduce(uint64_t x, uint64_t p);

    static FieldElement add(FieldElement x, FieldElement y, uint64_t p);
    static FieldElement subtract(FieldElement x, FieldElement y, uint64_t p);
    static FieldElement multiply(FieldElement x, FieldElement y, uint64_t p);
    static FieldElement negate(FieldElement x, uint64_t p);

    // Square-and-multiply
    static FieldElement power(FieldElement base, uint64_t exponent, uint64_t p);

    // Fermat inverse x^(p-2). Only meaningful for prime p and x != 0 mod p;
    // zero is not checked and yields 0.
    static FieldElement inverse(FieldElement x, uint64_t p);

private:
    // Prevent instantiation
    Field() = delete;
    ~Field() = delete;
    Field(const Field&) = delete;
    Field& operator=(const Field&) = delete;
};

} // namespace toy_ecc
