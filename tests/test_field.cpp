/**
 * @file test_field.cpp
 * @brief Modular arithmetic over Z/pZ
 */

#include <gtest/gtest.h>
#include <cstdint>

#include "Field.hpp"

using namespace toy_ecc;

namespace {
constexpr uint64_t P = 97;
}

TEST(FieldTest, ReduceNormalizesNegativeValues) {
    EXPECT_EQ(Field::reduce(int64_t{-5}, P), 92u);
    EXPECT_EQ(Field::reduce(int64_t{-97}, P), 0u);
    EXPECT_EQ(Field::reduce(int64_t{-98}, P), 96u);
    EXPECT_EQ(Field::reduce(int64_t{200}, P), 6u);
    EXPECT_EQ(Field::reduce(uint64_t{97}, P), 0u);
}

TEST(FieldTest, AddAndSubtractWrap) {
    EXPECT_EQ(Field::add(90, 10, P), 3u);
    EXPECT_EQ(Field::subtract(3, 10, P), 90u);
    EXPECT_EQ(Field::subtract(10, 3, P), 7u);
    EXPECT_EQ(Field::negate(0, P), 0u);
    EXPECT_EQ(Field::negate(10, P), 87u);
}

TEST(FieldTest, InputsAreReducedFirst) {
    EXPECT_EQ(Field::add(194, 1, P), 1u);
    EXPECT_EQ(Field::multiply(98, 98, P), 1u);
}

TEST(FieldTest, MultiplyDoesNotOverflowNearTopOfRange) {
    // p = 2^61 - 1 (Mersenne prime); (p-1)^2 = 1 mod p
    const uint64_t big = (uint64_t{1} << 61) - 1;
    EXPECT_EQ(Field::multiply(big - 1, big - 1, big), 1u);
}

TEST(FieldTest, PowerBySquaring) {
    EXPECT_EQ(Field::power(2, 10, P), 54u);   // 1024 mod 97
    EXPECT_EQ(Field::power(5, 0, P), 1u);
    EXPECT_EQ(Field::power(0, 0, P), 1u);
    EXPECT_EQ(Field::power(0, 5, P), 0u);
    // Fermat: a^(p-1) = 1
    for (uint64_t a = 1; a < P; ++a) {
        EXPECT_EQ(Field::power(a, P - 1, P), 1u) << "a=" << a;
    }
}

TEST(FieldTest, InverseIsMultiplicativeInverse) {
    EXPECT_EQ(Field::inverse(3, P), 65u);
    for (uint64_t a = 1; a < P; ++a) {
        EXPECT_EQ(Field::multiply(a, Field::inverse(a, P), P), 1u) << "a=" << a;
    }
}

TEST(FieldTest, InverseOfZeroIsUncheckedGarbage) {
    // Passthrough contract: no zero check, 0^(p-2) = 0
    EXPECT_EQ(Field::inverse(0, P), 0u);
    EXPECT_EQ(Field::inverse(P, P), 0u);
}
