#include <gtest/gtest.h>
#include "segdist/distributions/distribution.hpp"
#include "segdist/errors.hpp"
#include <cmath>

using namespace segdist::distributions;
using segdist::InvalidParameter;

TEST(Mixture, ContainerHoldsSharedComponents) {
    Mixture<Distribution> mix;
    mix.add_component(Normal(0.0, 1.0), 0.25);
    mix.add_component(Exponential(1.0), 0.75);

    EXPECT_EQ(mix.size(), 2u);
    EXPECT_DOUBLE_EQ(mix.weight(1), 0.75);
    EXPECT_DOUBLE_EQ(mix.total_weight(), 1.0);

    Mixture<Distribution> copy = mix;
    EXPECT_EQ(&copy.component(0), &mix.component(0));

    auto heavy = mix.extract_mix(0.5);
    ASSERT_EQ(heavy.size(), 1u);
    EXPECT_EQ(heavy.component(0).display_name(), "Ex(1)");
}

TEST(Mixture, DensityIsWeightedSum) {
    const Mix m({0.3, 0.7}, {Normal(0.0, 1.0), Gamma(2.0, 1.0)});
    const Normal n(0.0, 1.0);
    const Gamma g(2.0, 1.0);
    for (double x : {-1.0, 0.0, 0.5, 2.0}) {
        EXPECT_NEAR(m.pdf(x), 0.3 * n.pdf(x) + 0.7 * g.pdf(x), 1e-15) << x;
    }
    EXPECT_EQ(m.name(), "MIX()");
}

TEST(Mixture, PiecewiseIntegratesToOne) {
    Distribution m = Mix({0.5, 0.5}, {Normal(-2.0, 1.0), Gamma(3.0, 1.0)});
    const auto& pw = m.build_piecewise();
    EXPECT_NEAR(pw.integrate(), 1.0, 1e-6);
    for (double x : {-3.0, -0.5, 1.0, 2.5, 7.0}) {
        EXPECT_NEAR(pw.density(x), m.density(x), 1e-14) << x;
    }

    const auto& segs = pw.segments();
    for (std::size_t i = 0; i + 1 < segs.size(); ++i) {
        EXPECT_EQ(segs[i].b, segs[i + 1].a);
    }
}

TEST(Mixture, KeepsComponentPoles) {
    Distribution m = Mix({0.4, 0.6}, {Beta(0.5, 0.5), Uniform(0.0, 2.0)});
    const auto& pw = m.build_piecewise();
    EXPECT_NEAR(pw.integrate(), 1.0, 1e-6);

    bool left = false;
    bool right = false;
    for (const auto& s : pw.segments()) {
        if (s.has_left_pole() && s.a == 0.0) left = true;
        if (s.has_right_pole() && s.b == 1.0) right = true;
    }
    EXPECT_TRUE(left);
    EXPECT_TRUE(right);
    EXPECT_NEAR(pw.density(1.5), 0.3, 1e-15);
}

TEST(Mixture, DiscreteAndContinuous) {
    Distribution m = Mix({0.5, 0.5}, {constant(0.0), Exponential(1.0)});
    const auto& pw = m.build_piecewise();
    EXPECT_NEAR(pw.integrate(), 1.0, 1e-8);
    EXPECT_DOUBLE_EQ(pw.point_mass(0.0), 0.5);
    EXPECT_NEAR(pw.cdf(0.0), 0.5, 1e-12);
    EXPECT_DOUBLE_EQ(pw.inverse_cdf(0.25), 0.0);
}

TEST(Mixture, ZeroWeightComponentIsSkipped) {
    Distribution m = Mix({1.0, 0.0}, {Uniform(0.0, 1.0), Normal(10.0, 1.0)});
    const auto& pw = m.build_piecewise();
    ASSERT_EQ(pw.segments().size(), 1u);
    EXPECT_NEAR(pw.integrate(), 1.0, 1e-15);
}

TEST(Mixture, NestedMixtures) {
    Distribution inner = Mix({0.5, 0.5}, {Normal(0.0, 1.0), Normal(3.0, 1.0)});
    Distribution outer = Mix({0.5, 0.5}, {inner, Exponential(2.0)});
    EXPECT_NEAR(outer.build_piecewise().integrate(), 1.0, 1e-6);
    EXPECT_TRUE(inner.is_built());
}

TEST(Mixture, Validation) {
    EXPECT_THROW(Mix({}, {}), InvalidParameter);
    EXPECT_THROW(Mix({1.0}, {Normal(), Normal()}), InvalidParameter);
    EXPECT_THROW(Mix({1.5, -0.5}, {Normal(), Normal()}), InvalidParameter);
    EXPECT_THROW(Mix({0.5, 0.4}, {Normal(), Normal()}), InvalidParameter);
}
