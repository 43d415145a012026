#include "Field.hpp"

namespace toy_ecc {

FieldElement Field::reduce(int64_t x, uint64_t p) {
    const int64_t m = static_cast<int64_t>(p);
    int64_t r = x % m;
    return static_cast<FieldElement>(r >= 0 ? r : r + m);
}

FieldElement Field::reduce(uint64_t x, uint64_t p) {
    return x % p;
}

FieldElement Field::add(FieldElement x, FieldElement y, uint64_t p) {
    // p < 2^63, so the sum of two reduced values cannot wrap
    return (x % p + y % p) % p;
}

FieldElement Field::subtract(FieldElement x, FieldElement y, uint64_t p) {
    x %= p;
    y %= p;
    return x >= y ? x - y : p - (y - x);
}

FieldElement Field::multiply(FieldElement x, FieldElement y, uint64_t p) {
    unsigned __int128 wide = static_cast<unsigned __int128>(x % p) * (y % p);
    return static_cast<FieldElement>(wide % p);
}

FieldElement Field::negate(FieldElement x, uint64_t p) {
    x %= p;
    return x == 0 ? 0 : p - x;
}

FieldElement Field::power(FieldElement base, uint64_t exponent, uint64_t p) {
    FieldElement result = 1 % p;
    FieldElement b = base % p;
    while (exponent > 0) {
        if (exponent & 1) {
            result = multiply(result, b, p);
        }
        b = multiply(b, b, p);
        exponent >>= 1;
    }
    return result;
}

FieldElement Field::inverse(FieldElement x, uint64_t p) {
    return power(x, p - 2, p);
}

} // namespace toy_ecc
