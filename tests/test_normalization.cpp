#include <gtest/gtest.h>
#include "segdist/distributions/distribution.hpp"
#include <cmath>
#include <numbers>
#include <vector>

using namespace segdist::distributions;

namespace {

struct NormalizationCase {
    const char* label;
    Distribution dist;
};

std::vector<NormalizationCase> cases() {
    return {
        {"normal", Normal(0.0, 1.0)},
        {"normal_shifted", Normal(-3.0, 0.25)},
        {"uniform", Uniform(-2.0, 5.0)},
        {"cauchy", Cauchy(1.0, 0.0)},
        {"chi2_1", ChiSquare(1.0)},
        {"chi2_2", ChiSquare(2.0)},
        {"chi2_7", ChiSquare(7.0)},
        {"chi2_40", ChiSquare(40.0)},
        {"exponential", Exponential(1.5)},
        {"gamma_pole", Gamma(0.5, 2.0)},
        {"gamma_one", Gamma(1.0, 2.0)},
        {"gamma_shaped", Gamma(4.0, 0.5)},
        {"beta_arcsine", Beta(0.5, 0.5)},
        {"beta_left", Beta(0.7, 3.0)},
        {"beta_smooth", Beta(2.0, 5.0)},
        {"beta_flat", Beta(1.0, 1.0)},
        {"pareto", Pareto(2.0, 1.0)},
        {"levy", Levy(1.0, 0.0)},
        {"laplace", Laplace(1.0, 0.0)},
        {"laplace_scaled", Laplace(0.3, 2.0)},
        {"student_t", StudentT(3.0)},
        {"semicircle", Semicircle(1.0)},
        {"f_pole", FDistr(1.0, 5.0)},
        {"f_two", FDistr(2.0, 5.0)},
        {"f_shaped", FDistr(6.0, 9.0)},
        {"weibull_pole", Weibull(0.5, 1.0)},
        {"weibull_one", Weibull(1.0, 2.0)},
        {"weibull_integer", Weibull(3.0, 1.0)},
        {"weibull_fractional", Weibull(1.5, 2.0)},
    };
}

} // namespace

TEST(Normalization, EveryFamilyIntegratesToOne) {
    for (const auto& c : cases()) {
        EXPECT_NEAR(c.dist.build_piecewise().integrate(), 1.0, 1e-6) << c.label;
    }
}

TEST(Normalization, SegmentsAreOrderedAndContiguous) {
    for (const auto& c : cases()) {
        const auto& segs = c.dist.build_piecewise().segments();
        ASSERT_FALSE(segs.empty()) << c.label;
        for (std::size_t i = 0; i < segs.size(); ++i) {
            EXPECT_LT(segs[i].a, segs[i].b) << c.label;
            if (i + 1 < segs.size()) EXPECT_EQ(segs[i].b, segs[i + 1].a) << c.label;
        }
    }
}

TEST(Normalization, PiecewiseDensityMatchesFamily) {
    for (const auto& c : cases()) {
        const auto& pw = c.dist.build_piecewise();
        for (double x : {-1.5, -0.2, 0.3, 0.8, 1.7, 4.0}) {
            EXPECT_DOUBLE_EQ(pw.density(x), c.dist.density(x)) << c.label << " at " << x;
        }
    }
}

TEST(Normalization, InverseCdfInvertsCdf) {
    for (const auto& c : cases()) {
        const auto& pw = c.dist.build_piecewise();
        for (double p : {0.05, 0.3, 0.5, 0.8, 0.95}) {
            const double x = pw.inverse_cdf(p);
            EXPECT_NEAR(pw.cdf(x), p, 1e-6) << c.label << " p=" << p;
        }
    }
}

TEST(Normalization, ArcsineQuantilesNearPoles) {
    const Distribution d = Beta(0.5, 0.5);
    const auto& pw = d.build_piecewise();
    // F(x) = (2 / pi) asin(sqrt(x)), so F^-1(p) = sin(pi p / 2)^2.
    for (double p : {1e-6, 0.2, 0.8, 1.0 - 1e-6}) {
        const double expected = std::pow(std::sin(0.5 * std::numbers::pi * p), 2);
        EXPECT_NEAR(pw.inverse_cdf(p), expected, 1e-7) << "p=" << p;
    }
    EXPECT_NEAR(pw.cdf(0.25), 1.0 / 3.0, 1e-8);

    const double tiny = pw.cdf(1e-310);
    EXPECT_TRUE(std::isfinite(tiny));
    EXPECT_GE(tiny, 0.0);
    EXPECT_LT(tiny, 1e-6);
    EXPECT_NEAR(pw.cdf(std::nextafter(1.0, 0.0)), 1.0, 1e-6);
}
