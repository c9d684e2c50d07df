#include <cmath>
#include <gtest/gtest.h>
#include <string>
#include <vellum/easing.hpp>

using namespace vellum;

// All easing functions must satisfy: f(0) == 0, f(1) == 1

TEST(Easing, EveryNamedEasingHitsEndpoints)
{
    for (auto name : easing_names())
    {
        EasingFn fn = find_easing(name);
        ASSERT_NE(fn, nullptr) << name;
        EXPECT_NEAR(fn(0.0), 0.0, 1e-9) << name;
        EXPECT_NEAR(fn(1.0), 1.0, 1e-9) << name;
    }
}

TEST(Easing, NameTableIsComplete)
{
    // linear plus in/out/in-out for ten curve families
    EXPECT_EQ(easing_names().size(), 31u);
}

TEST(Easing, LinearMidpoint)
{
    EXPECT_DOUBLE_EQ(ease::linear(0.5), 0.5);
}

TEST(Easing, InQuadMidpoint)
{
    EXPECT_DOUBLE_EQ(ease::in_quad(0.5), 0.25);
}

TEST(Easing, OutQuadFasterStart)
{
    EXPECT_DOUBLE_EQ(ease::out_quad(0.5), 0.75);
}

TEST(Easing, InCubicSlowerStart)
{
    EXPECT_DOUBLE_EQ(ease::in_cubic(0.5), 0.125);
}

TEST(Easing, InOutSymmetry)
{
    // in_out curves should be symmetric: f(t) + f(1-t) ≈ 1
    for (EasingFn fn : {ease::in_out_quad,
                        ease::in_out_cubic,
                        ease::in_out_quart,
                        ease::in_out_quint,
                        ease::in_out_sine,
                        ease::in_out_circ})
    {
        for (double t = 0.0; t <= 1.0; t += 0.1)
        {
            EXPECT_NEAR(fn(t) + fn(1.0 - t), 1.0, 1e-9) << "at t=" << t;
        }
    }
}

TEST(Easing, BackOvershootsBelowZero)
{
    EXPECT_LT(ease::in_back(0.2), 0.0);
    EXPECT_GT(ease::out_back(0.8), 1.0);
}

TEST(Easing, BounceStaysInRange)
{
    for (double t = 0.0; t <= 1.0; t += 0.05)
    {
        EXPECT_GE(ease::out_bounce(t), -1e-9) << "at t=" << t;
        EXPECT_LE(ease::out_bounce(t), 1.0 + 1e-9) << "at t=" << t;
    }
}

TEST(Easing, ElasticClampsOutsideUnitInterval)
{
    EXPECT_DOUBLE_EQ(ease::in_elastic(-0.5), 0.0);
    EXPECT_DOUBLE_EQ(ease::out_elastic(1.5), 1.0);
}

// ─── Lookup ─────────────────────────────────────────────────────────────────

TEST(EasingLookup, FindsConventionalNames)
{
    EXPECT_EQ(find_easing("linear"), &ease::linear);
    EXPECT_EQ(find_easing("easeInQuad"), &ease::in_quad);
    EXPECT_EQ(find_easing("easeOutBounce"), &ease::out_bounce);
    EXPECT_EQ(find_easing("easeInOutElastic"), &ease::in_out_elastic);
}

TEST(EasingLookup, UnknownNameIsNull)
{
    EXPECT_EQ(find_easing("easeSideways"), nullptr);
    EXPECT_EQ(find_easing(""), nullptr);
}

TEST(EasingLookup, LookupIsCaseSensitive)
{
    EXPECT_EQ(find_easing("EASEINQUAD"), nullptr);
}

TEST(EasingLookup, ResolveFallsBackToDefault)
{
    EXPECT_EQ(resolve_easing("easeSideways"), default_easing());
    EXPECT_EQ(resolve_easing(""), default_easing());
    EXPECT_EQ(default_easing(), &ease::in_quad);
    EXPECT_EQ(find_easing(DEFAULT_EASING_NAME), default_easing());
}

TEST(EasingLookup, ResolveKeepsKnownNames)
{
    EXPECT_EQ(resolve_easing("easeOutCubic"), &ease::out_cubic);
}
