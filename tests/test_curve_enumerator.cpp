/**
 * @file test_curve_enumerator.cpp
 * @brief Point enumeration and curve statistics
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <utility>
#include <vector>

#include "CurveEnumerator.hpp"
#include "Curve.hpp"

using namespace toy_ecc;

TEST(CurveEnumeratorTest, ToyCurveHas99AffinePoints) {
    auto points = CurveEnumerator::enumeratePoints(CurveParams::toyCurve());
    ASSERT_EQ(points.size(), 99u);
    EXPECT_EQ(points.front(), Point(Affine{0, 10}));
    EXPECT_EQ(points[1], Point(Affine{0, 87}));
    EXPECT_EQ(points[2], Point(Affine{1, 43}));
}

TEST(CurveEnumeratorTest, OrderIsStableAndSorted) {
    const CurveParams params = CurveParams::toyCurve();
    auto first = CurveEnumerator::enumeratePoints(params);
    auto second = CurveEnumerator::enumeratePoints(params);
    EXPECT_EQ(first, second);

    auto key = [](const Point& p) {
        const Affine& a = std::get<Affine>(p);
        return std::make_pair(a.x, a.y);
    };
    EXPECT_TRUE(std::is_sorted(first.begin(), first.end(),
        [&](const Point& l, const Point& r) { return key(l) < key(r); }));
}

TEST(CurveEnumeratorTest, EveryPointIsAffineAndOnCurve) {
    const CurveParams params = CurveParams::toyCurve();
    for (const Point& p : CurveEnumerator::enumeratePoints(params)) {
        EXPECT_FALSE(isIdentity(p));
        EXPECT_TRUE(Curve::isOnCurve(params, p));
    }
}

TEST(CurveEnumeratorTest, IncludesOrderTwoPoints) {
    auto points = CurveEnumerator::enumeratePoints(CurveParams::toyCurve());
    for (const Point& p : {Point(Affine{30, 0}), Point(Affine{68, 0}), Point(Affine{96, 0})}) {
        EXPECT_NE(std::find(points.begin(), points.end(), p), points.end());
    }
}

TEST(CurveEnumeratorTest, SummaryMatchesStatisticsPanel) {
    CurveSummary summary = CurveEnumerator::summarize(CurveParams::toyCurve());
    EXPECT_EQ(summary.pointCount, 99u);
    EXPECT_EQ(summary.groupOrder, 100u);
    EXPECT_EQ(summary.prime, 97u);
    EXPECT_EQ(summary.claimedOrder, 50u);
    // Lagrange: ord(G) divides the group order
    EXPECT_EQ(summary.groupOrder % summary.claimedOrder, 0u);
}

TEST(CurveEnumeratorTest, AlternateCurve) {
    CurveParams params{17, 2, 2, Affine{5, 1}, 19};
    EXPECT_EQ(CurveEnumerator::enumeratePoints(params).size(), 18u);
}

TEST(CurveEnumeratorTest, RefusesLargeFields) {
    CurveParams params = CurveParams::toyCurve();
    params.p = 2147483647;
    try {
        CurveEnumerator::enumeratePoints(params);
        FAIL() << "expected EccError";
    } catch (const EccError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidParameter);
    }
}
