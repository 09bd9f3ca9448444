#include <gtest/gtest.h>
#include "segdist/distributions/pole.hpp"
#include <cmath>

using namespace segdist::distributions;

TEST(PoleClassifier, ChiSquareAtZero) {
    EXPECT_TRUE(chi_square_at_zero(1.0).is_pole());
    EXPECT_TRUE(std::isinf(chi_square_at_zero(1.5).value));

    auto two = chi_square_at_zero(2.0);
    EXPECT_EQ(two.behavior, BoundaryBehavior::finite);
    EXPECT_DOUBLE_EQ(two.value, 0.5);

    auto three = chi_square_at_zero(3.0);
    EXPECT_EQ(three.behavior, BoundaryBehavior::zero);
    EXPECT_DOUBLE_EQ(three.value, 0.0);
}

TEST(PoleClassifier, GammaAtZero) {
    EXPECT_TRUE(gamma_at_zero(0.5, 2.0).is_pole());

    auto k1 = gamma_at_zero(1.0, 2.0);
    EXPECT_EQ(k1.behavior, BoundaryBehavior::finite);
    EXPECT_DOUBLE_EQ(k1.value, 0.5);

    EXPECT_EQ(gamma_at_zero(3.0, 2.0).behavior, BoundaryBehavior::zero);
}

TEST(PoleClassifier, WeibullAtZero) {
    EXPECT_TRUE(weibull_at_zero(0.7, 1.0).is_pole());
    EXPECT_DOUBLE_EQ(weibull_at_zero(1.0, 1.0).value, 1.0);
    EXPECT_DOUBLE_EQ(weibull_at_zero(1.0, 4.0).value, 0.25);
    EXPECT_EQ(weibull_at_zero(2.0, 1.0).behavior, BoundaryBehavior::zero);
}

TEST(PoleClassifier, WeibullMarksNonIntegerShapes) {
    EXPECT_TRUE(weibull_marks_pole(0.5));
    EXPECT_TRUE(weibull_marks_pole(1.0));
    EXPECT_TRUE(weibull_marks_pole(2.5));
    EXPECT_FALSE(weibull_marks_pole(2.0));
    EXPECT_FALSE(weibull_marks_pole(3.0));
}

TEST(PoleClassifier, FAtZero) {
    EXPECT_TRUE(f_at_zero(1.0).is_pole());
    EXPECT_DOUBLE_EQ(f_at_zero(2.0).value, 1.0);
    EXPECT_EQ(f_at_zero(5.0).behavior, BoundaryBehavior::zero);

    EXPECT_TRUE(f_marks_pole(1.0));
    EXPECT_FALSE(f_marks_pole(2.0));
    EXPECT_TRUE(f_marks_pole(5.0));
}

TEST(PoleClassifier, BetaEdges) {
    auto both = beta_edge_poles(0.5, 0.5, 1e-2);
    EXPECT_TRUE(both.left);
    EXPECT_TRUE(both.right);

    auto left_only = beta_edge_poles(0.5, 3.0, 1e-2);
    EXPECT_TRUE(left_only.left);
    EXPECT_FALSE(left_only.right);

    auto none = beta_edge_poles(1.0, 1.0, 1e-2);
    EXPECT_FALSE(none.left);
    EXPECT_FALSE(none.right);

    // Shapes just off 1 stay unflagged inside the tolerance.
    auto near_one = beta_edge_poles(1.005, 0.995, 1e-2);
    EXPECT_FALSE(near_one.left);
    EXPECT_FALSE(near_one.right);

    // Shapes in (1, 2) have a derivative singularity and are flagged.
    EXPECT_TRUE(beta_edge_poles(1.5, 3.0, 1e-2).left);
}

TEST(PoleClassifier, BetaEdgeLimits) {
    EXPECT_TRUE(beta_edge(0.5, 1.0).is_pole());
    EXPECT_DOUBLE_EQ(beta_edge(1.0, 3.0).value, 3.0);
    EXPECT_DOUBLE_EQ(beta_edge(2.0, 3.0).value, 0.0);
}
