#include <cmath>
#include <easepath/ease.hpp>
#include <gtest/gtest.h>
#include <limits>

using namespace easepath;

// ─── normalize ──────────────────────────────────────────────────────────────

TEST(Normalize, MapsRangeOntoUnitInterval)
{
    EXPECT_DOUBLE_EQ(normalize(0.0, 0.0, 10.0, true), 0.0);
    EXPECT_DOUBLE_EQ(normalize(5.0, 0.0, 10.0, true), 0.5);
    EXPECT_DOUBLE_EQ(normalize(10.0, 0.0, 10.0, true), 1.0);
    EXPECT_DOUBLE_EQ(normalize(15.0, 10.0, 20.0, true), 0.5);
}

TEST(Normalize, DescendingRange)
{
    EXPECT_DOUBLE_EQ(normalize(75.0, 100.0, 0.0, true), 0.25);
    EXPECT_DOUBLE_EQ(normalize(110.0, 100.0, 0.0, true), -0.1);
}

TEST(Normalize, OvershootIsNotClamped)
{
    EXPECT_DOUBLE_EQ(normalize(12.0, 0.0, 10.0, true), 1.2);
    EXPECT_DOUBLE_EQ(normalize(-300.0, 0.0, 10.0, true), -30.0);
}

TEST(Normalize, InfinityClampedToTen)
{
    EXPECT_DOUBLE_EQ(normalize(3.0, 5.0, 5.0, true), -kInfiniteClamp);
    EXPECT_DOUBLE_EQ(normalize(7.0, 5.0, 5.0, true), kInfiniteClamp);
}

TEST(Normalize, InfinityKeptWhenClampDisabled)
{
    double lo = normalize(3.0, 5.0, 5.0, false);
    double hi = normalize(7.0, 5.0, 5.0, false);
    EXPECT_TRUE(std::isinf(lo));
    EXPECT_LT(lo, 0.0);
    EXPECT_TRUE(std::isinf(hi));
    EXPECT_GT(hi, 0.0);
}

TEST(Normalize, ZeroOverZeroIsNaN)
{
    EXPECT_TRUE(std::isnan(normalize(5.0, 5.0, 5.0, true)));
    EXPECT_TRUE(std::isnan(normalize(5.0, 5.0, 5.0, false)));
}

// ─── normalize_curve ────────────────────────────────────────────────────────

namespace
{

TweenData make_tween(double start_value, double end_value)
{
    TweenData t;
    t.start_frame     = 0.0;
    t.end_frame       = 30.0;
    t.duration_frames = 30.0;
    t.start_value     = start_value;
    t.end_value       = end_value;
    return t;
}

}   // namespace

TEST(NormalizeCurve, StandardEase)
{
    auto c = normalize_curve(make_tween(0.0, 100.0), Point(12.6, 0.0), Point(17.4, 100.0), true);
    EXPECT_NEAR(c.x1, 0.42, 1e-12);
    EXPECT_NEAR(c.y1, 0.0, 1e-12);
    EXPECT_NEAR(c.x2, 0.58, 1e-12);
    EXPECT_NEAR(c.y2, 1.0, 1e-12);
    EXPECT_EQ(c.to_string(), "0.42,0.00,0.58,1.00");
}

TEST(NormalizeCurve, FallingValueStillMapsStartToZero)
{
    auto c = normalize_curve(make_tween(100.0, 0.0), Point(15.0, 100.0), Point(15.0, 0.0), true);
    EXPECT_DOUBLE_EQ(c.y1, 0.0);
    EXPECT_DOUBLE_EQ(c.y2, 1.0);
}

TEST(NormalizeCurve, FlatSegmentYFollowsX)
{
    // Handles with slope would otherwise divide by the zero value range.
    auto c = normalize_curve(make_tween(50.0, 50.0), Point(7.5, 60.0), Point(22.5, 40.0), true);
    EXPECT_DOUBLE_EQ(c.x1, 0.25);
    EXPECT_DOUBLE_EQ(c.y1, c.x1);
    EXPECT_DOUBLE_EQ(c.x2, 0.75);
    EXPECT_DOUBLE_EQ(c.y2, c.x2);
    EXPECT_EQ(c.to_string(), "0.25,0.25,0.75,0.75");
}

TEST(NormalizeCurve, Idempotent)
{
    auto tween = make_tween(-20.0, 80.0);
    auto a     = normalize_curve(tween, Point(9.0, 10.0), Point(21.0, 95.0), true);
    auto b     = normalize_curve(tween, Point(9.0, 10.0), Point(21.0, 95.0), true);
    EXPECT_EQ(a.values(), b.values());
}

TEST(NormalizeCurve, ZeroDurationClampsOnlyWhenEnabled)
{
    TweenData t       = make_tween(0.0, 100.0);
    t.end_frame       = 0.0;
    t.duration_frames = 0.0;

    auto clamped = normalize_curve(t, Point(2.0, 0.0), Point(-2.0, 100.0), true);
    EXPECT_DOUBLE_EQ(clamped.x1, 10.0);
    EXPECT_DOUBLE_EQ(clamped.x2, -10.0);
    EXPECT_EQ(clamped.to_string(), "10.00,0.00,-10.00,1.00");

    auto raw = normalize_curve(t, Point(2.0, 0.0), Point(-2.0, 100.0), false);
    EXPECT_TRUE(std::isinf(raw.x1));
    EXPECT_EQ(raw.to_string(), "Infinity,0.00,-Infinity,1.00");
}

TEST(NormalizeCurve, CompactStyle)
{
    NormalizedCurve c{0.5, 0.0, 0.25, 1.0};
    EXPECT_EQ(c.to_string(NumberStyle::Compact), "0.5,0,0.25,1");
}
