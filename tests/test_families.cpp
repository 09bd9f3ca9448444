#include <gtest/gtest.h>
#include "segdist/distributions/distribution.hpp"
#include <cmath>
#include <limits>
#include <thread>
#include <vector>

using namespace segdist::distributions;
using segdist::piecewise::PoleSide;
using segdist::piecewise::SegmentKind;

namespace {

const double kInf = std::numeric_limits<double>::infinity();

void expect_contiguous(const segdist::piecewise::PiecewiseDistribution& pw) {
    const auto& segs = pw.segments();
    for (std::size_t i = 0; i < segs.size(); ++i) {
        EXPECT_LT(segs[i].a, segs[i].b);
        if (i + 1 < segs.size()) EXPECT_EQ(segs[i].b, segs[i + 1].a);
    }
}

} // namespace

TEST(Families, NormalBreaks) {
    auto pw = Normal(1.0, 2.0).build_piecewise();
    auto br = pw.breaks();
    ASSERT_EQ(br.size(), 4u);
    EXPECT_EQ(br[0], -kInf);
    EXPECT_DOUBLE_EQ(br[1], -1.0);
    EXPECT_DOUBLE_EQ(br[2], 3.0);
    EXPECT_EQ(br[3], kInf);
    expect_contiguous(pw);
}

TEST(Families, LaplaceSplitsAtLocation) {
    auto br = Laplace(0.5, 2.0).build_piecewise().breaks();
    ASSERT_EQ(br.size(), 5u);
    EXPECT_DOUBLE_EQ(br[1], 1.0);
    EXPECT_DOUBLE_EQ(br[2], 2.0);
    EXPECT_DOUBLE_EQ(br[3], 3.0);
}

TEST(Families, UniformIsOneConstantPiece) {
    auto pw = Uniform(2.0, 6.0).build_piecewise();
    ASSERT_EQ(pw.segments().size(), 1u);
    EXPECT_EQ(pw.segments()[0].kind, SegmentKind::constant);
    EXPECT_DOUBLE_EQ(pw.segments()[0].value, 0.25);
}

TEST(Families, ChiSquareBreaks) {
    auto one = ChiSquare(1.0).build_piecewise();
    auto br = one.breaks();
    ASSERT_EQ(br.size(), 4u);
    EXPECT_DOUBLE_EQ(br[1], 0.5);
    EXPECT_DOUBLE_EQ(br[2], 2.0);
    EXPECT_TRUE(one.segments()[0].has_left_pole());

    auto four = ChiSquare(4.0).build_piecewise();
    EXPECT_EQ(four.segments()[0].pole, PoleSide::none);

    auto big = ChiSquare(30.0).build_piecewise().breaks();
    EXPECT_DOUBLE_EQ(big[1], 22.5);
    EXPECT_DOUBLE_EQ(big[2], 40.0);
}

TEST(Families, GammaBranches) {
    auto pole = Gamma(0.5, 2.0).build_piecewise();
    ASSERT_EQ(pole.segments().size(), 2u);
    EXPECT_TRUE(pole.segments()[0].has_left_pole());
    EXPECT_DOUBLE_EQ(pole.segments()[0].b, 1.0);

    auto exp_like = Gamma(1.0, 2.0).build_piecewise();
    ASSERT_EQ(exp_like.segments().size(), 2u);
    EXPECT_EQ(exp_like.segments()[0].pole, PoleSide::none);

    auto shaped = Gamma(3.0, 2.0).build_piecewise().breaks();
    ASSERT_EQ(shaped.size(), 5u);
    EXPECT_DOUBLE_EQ(shaped[1], 2.0);
    EXPECT_DOUBLE_EQ(shaped[2], 4.0);
    EXPECT_DOUBLE_EQ(shaped[3], 8.0);
}

TEST(Families, BetaSplitsAtMidpoint) {
    auto both = Beta(0.5, 0.5).build_piecewise();
    ASSERT_EQ(both.segments().size(), 2u);
    EXPECT_DOUBLE_EQ(both.segments()[0].b, 0.5);
    EXPECT_TRUE(both.segments()[0].has_left_pole());
    EXPECT_TRUE(both.segments()[1].has_right_pole());

    auto flat = Beta(1.0, 1.0).build_piecewise();
    EXPECT_EQ(flat.segments()[0].pole, PoleSide::none);
    EXPECT_EQ(flat.segments()[1].pole, PoleSide::none);

    EXPECT_DOUBLE_EQ(Beta(2.0, 5.0).analytic_mode(), 0.2);
    EXPECT_DOUBLE_EQ(Beta(2.0, 5.0).build_piecewise().segments()[0].b, 0.5);
}

TEST(Families, BetaPoleToleranceIsConfigurable) {
    const Beta strict(1.005, 1.005, 0.0);
    EXPECT_TRUE(strict.edge_poles().left);
    EXPECT_TRUE(strict.edge_poles().right);

    const Beta loose(1.005, 1.005);
    EXPECT_FALSE(loose.edge_poles().left);
}

TEST(Families, HeavyTailBreaks) {
    auto p = Pareto(2.0, 3.0).build_piecewise().breaks();
    ASSERT_EQ(p.size(), 3u);
    EXPECT_DOUBLE_EQ(p[0], 3.0);
    EXPECT_DOUBLE_EQ(p[1], 4.0);

    auto l = Levy(2.0, 1.0).build_piecewise().breaks();
    EXPECT_DOUBLE_EQ(l[0], 1.0);
    EXPECT_DOUBLE_EQ(l[1], 3.0);
}

TEST(Families, FBranches) {
    auto low = FDistr(1.0, 3.0).build_piecewise();
    ASSERT_EQ(low.segments().size(), 2u);
    EXPECT_TRUE(low.segments()[0].has_left_pole());
    EXPECT_DOUBLE_EQ(low.segments()[0].b, 1.0);

    auto two = FDistr(2.0, 3.0).build_piecewise();
    EXPECT_EQ(two.segments()[0].pole, PoleSide::none);

    auto high = FDistr(4.0, 6.0).build_piecewise();
    ASSERT_EQ(high.segments().size(), 3u);
    const double mode = (2.0 / 4.0) * (6.0 / 8.0);
    EXPECT_DOUBLE_EQ(high.segments()[0].b, mode);
    EXPECT_DOUBLE_EQ(high.segments()[1].b, mode + 1.0);
    EXPECT_TRUE(high.segments()[0].has_left_pole());
}

TEST(Families, WeibullBranches) {
    auto low = Weibull(0.5, 1.0).build_piecewise();
    EXPECT_DOUBLE_EQ(low.segments()[0].b, 0.5);
    EXPECT_TRUE(low.segments()[0].has_left_pole());

    auto integer = Weibull(2.0, 1.0).build_piecewise();
    EXPECT_DOUBLE_EQ(integer.segments()[0].b, std::sqrt(0.5));
    EXPECT_EQ(integer.segments()[0].pole, PoleSide::none);

    auto fractional = Weibull(2.5, 1.0).build_piecewise();
    EXPECT_TRUE(fractional.segments()[0].has_left_pole());
}

TEST(Families, SemicirclePoles) {
    auto pw = Semicircle(2.0).build_piecewise();
    ASSERT_EQ(pw.segments().size(), 3u);
    EXPECT_DOUBLE_EQ(pw.segments()[0].a, -2.0);
    EXPECT_DOUBLE_EQ(pw.segments()[0].b, -1.0);
    EXPECT_TRUE(pw.segments()[0].has_left_pole());
    EXPECT_TRUE(pw.segments()[2].has_right_pole());
    EXPECT_DOUBLE_EQ(pw.segments()[2].b, 2.0);

    const Semicircle s(1.0);
    EXPECT_DOUBLE_EQ(s.pdf(1.5), 0.0);
    EXPECT_DOUBLE_EQ(s.pdf(-1.5), 0.0);
    EXPECT_GT(s.pdf(0.99), 0.0);
}

TEST(Families, ChiSquareTwoMatchesExponentialHalf) {
    const ChiSquare chi(2.0);
    const Exponential ex(0.5);
    for (double x : {0.0, 1e-8, 0.3, 1.0, 4.0, 25.0}) {
        EXPECT_NEAR(chi.pdf(x), ex.pdf(x), 1e-15 + 1e-13 * ex.pdf(x)) << x;
    }
}

TEST(Families, StudentTApproachesNormal) {
    const StudentT t(1e6);
    const Normal n(0.0, 1.0);
    for (double x : {-3.0, -1.0, 0.0, 0.5, 2.0}) {
        EXPECT_NEAR(t.pdf(x), n.pdf(x), 1e-5) << x;
    }
}

TEST(Families, BetaOneOneMatchesUniform) {
    const Beta b(1.0, 1.0);
    const Uniform u(0.0, 1.0);
    for (double x : {-0.5, 0.0, 0.1, 0.5, 0.9, 1.0, 1.5}) {
        EXPECT_DOUBLE_EQ(b.pdf(x), u.pdf(x)) << x;
    }
}

TEST(Families, DisplayNames) {
    EXPECT_EQ(Distribution(Normal(0.0, 1.0)).display_name(), "N(0,1)");
    EXPECT_EQ(Distribution(Gamma(2.0, 2.0)).display_name(), "Gamma(2,2)");
    EXPECT_EQ(Distribution(ChiSquare(1.0)).display_name(), "Chi2(1)");
    EXPECT_EQ(Distribution(Beta(0.5, 0.5)).display_name(), "Beta(0.5,0.5)");
    EXPECT_EQ(Distribution(Uniform(0.0, 1.0)).display_name(), "U(0,1)");
    EXPECT_EQ(Distribution(Exponential(2.0)).display_name(), "Ex(2)");
    EXPECT_EQ(Distribution(Semicircle(1.0)).display_name(), "Semicircle(1)");
    EXPECT_EQ(Distribution(FDistr(1.0, 4.0)).display_name(), "F(1,4)");
}

TEST(Families, LazyBuildIsSharedBetweenCopies) {
    Distribution d = Gamma(2.0, 2.0);
    Distribution copy = d;
    EXPECT_FALSE(d.is_built());
    const auto& pw = copy.build_piecewise();
    EXPECT_TRUE(d.is_built());
    EXPECT_EQ(&pw, &d.piecewise());
    EXPECT_EQ(&pw, &d.build_piecewise());
}

TEST(Families, ConcurrentFirstAccessBuildsOnce) {
    const Distribution d = Beta(0.5, 0.5);
    constexpr int kThreads = 8;
    std::vector<Distribution> copies(kThreads, d);
    std::vector<const segdist::piecewise::PiecewiseDistribution*> seen(kThreads, nullptr);

    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&copies, &seen, t] { seen[t] = &copies[t].build_piecewise(); });
    }
    for (auto& w : workers) w.join();

    EXPECT_TRUE(d.is_built());
    for (int t = 0; t < kThreads; ++t) {
        EXPECT_TRUE(copies[t].is_built());
        EXPECT_EQ(seen[t], seen[0]);
    }
    EXPECT_EQ(seen[0], &d.piecewise());
}

TEST(Families, FamilyAccess) {
    Distribution d = Weibull(2.0, 3.0);
    ASSERT_NE(d.get_if<Weibull>(), nullptr);
    EXPECT_DOUBLE_EQ(d.get_if<Weibull>()->lambda(), 3.0);
    EXPECT_EQ(d.get_if<Gamma>(), nullptr);
}
