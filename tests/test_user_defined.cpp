#include <gtest/gtest.h>
#include "segdist/distributions/distribution.hpp"
#include "segdist/errors.hpp"
#include <cmath>
#include <limits>

using namespace segdist::distributions;
using segdist::InvalidParameter;
using segdist::piecewise::Segment;

namespace {
const double kInf = std::numeric_limits<double>::infinity();
}

TEST(UserDefined, FunctionLawWithPole) {
    // 1 / (2 sqrt(x)) on [0, 1]
    Distribution d = FunctionDistr([](double x) { return 0.5 / std::sqrt(x); }, {0.0, 1.0}, {true});
    EXPECT_EQ(d.display_name(), "USER_FUN(0,1)");
    EXPECT_DOUBLE_EQ(d.density(2.0), 0.0);
    EXPECT_DOUBLE_EQ(d.density(-1.0), 0.0);
    EXPECT_DOUBLE_EQ(d.density(0.25), 1.0);

    const auto& pw = d.build_piecewise();
    EXPECT_TRUE(pw.segments()[0].has_left_pole());
    EXPECT_NEAR(pw.integrate(), 1.0, 1e-8);
}

TEST(UserDefined, FunctionLawWithTail) {
    Distribution d = FunctionDistr([](double x) { return std::exp(-x); }, {0.0, 1.0, kInf});
    EXPECT_NEAR(d.build_piecewise().integrate(), 1.0, 1e-8);
    EXPECT_EQ(d.build_piecewise().segments().back().kind, segdist::piecewise::SegmentKind::plus_inf);
}

TEST(UserDefined, FunctionLawSamplesByInversion) {
    Distribution d = FunctionDistr([](double x) { return 2.0 * x; }, {0.0, 1.0});
    segdist::Rng rng(11);
    const Eigen::VectorXd s = d.draw_samples(300, rng);
    for (Eigen::Index i = 0; i < s.size(); ++i) {
        EXPECT_GE(s(i), 0.0);
        EXPECT_LE(s(i), 1.0);
    }
    EXPECT_NEAR(s.mean(), 2.0 / 3.0, 0.06);
}

TEST(UserDefined, FunctionLawValidation) {
    auto f = [](double) { return 1.0; };
    EXPECT_THROW(FunctionDistr(f, {0.0}), InvalidParameter);
    EXPECT_THROW(FunctionDistr(f, {1.0, 0.0}), InvalidParameter);
    EXPECT_THROW(FunctionDistr(f, {0.0, 1.0, 2.0}, {true, false, true, false}), InvalidParameter);
    EXPECT_THROW(FunctionDistr(segdist::piecewise::DensityFn{}, {0.0, 1.0}), InvalidParameter);
}

TEST(UserDefined, SegmentLaw) {
    Distribution d = SegmentDistr({
        Segment::constant(0.0, 1.0, 0.5),
        Segment::constant(1.0, 2.0, 0.25),
        Segment::dirac(3.0, 0.25),
    });
    EXPECT_EQ(d.display_name(), "USER_PDISTR(3)");
    EXPECT_DOUBLE_EQ(d.density(0.5), 0.5);
    EXPECT_DOUBLE_EQ(d.density(1.5), 0.25);
    EXPECT_DOUBLE_EQ(d.density(3.0), 0.25);
    EXPECT_NEAR(d.build_piecewise().integrate(), 1.0, 1e-15);

    segdist::Rng rng(3);
    const Eigen::VectorXd s = d.draw_samples(100, rng);
    for (Eigen::Index i = 0; i < s.size(); ++i) {
        EXPECT_TRUE((s(i) >= 0.0 && s(i) <= 2.0) || s(i) == 3.0) << s(i);
    }
}

TEST(UserDefined, SegmentLawRejectsGaps) {
    EXPECT_THROW(SegmentDistr({Segment::constant(0.0, 1.0, 0.5), Segment::constant(2.0, 3.0, 0.5)}),
                 std::invalid_argument);
    EXPECT_THROW(SegmentDistr(std::vector<Segment>{}), InvalidParameter);
}
