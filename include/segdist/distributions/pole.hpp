#pragma once

namespace segdist::distributions {

/// Analytic behaviour of a density at a support boundary.
enum class BoundaryBehavior { zero, finite, pole };

/// Classified limit of the density at one boundary.
/// `value` is +inf for a pole, the finite limit, or 0.
struct BoundaryLimit {
    BoundaryBehavior behavior = BoundaryBehavior::zero;
    double value = 0.0;

    [[nodiscard]] bool is_pole() const { return behavior == BoundaryBehavior::pole; }

    [[nodiscard]] static BoundaryLimit pole();
    [[nodiscard]] static BoundaryLimit finite(double value);
    [[nodiscard]] static BoundaryLimit zero();

    /// Limit of coefficient * t^exponent as t -> 0+.
    [[nodiscard]] static BoundaryLimit power_law(double exponent, double coefficient);
};

/// Chi-square(df) at x = 0: pole for df < 2, 0.5 for df = 2, zero above.
[[nodiscard]] BoundaryLimit chi_square_at_zero(double df);

/// Gamma(k, theta) at x = 0: pole for k < 1, 1/theta for k = 1, zero above.
[[nodiscard]] BoundaryLimit gamma_at_zero(double k, double theta);

/// Weibull(k, lambda) at x = 0: pole for k < 1, k/lambda for k = 1, zero above.
[[nodiscard]] BoundaryLimit weibull_at_zero(double k, double lambda);

/// F(df1, df2) at x = 0: pole for df1 < 2, 1 for df1 = 2, zero above.
[[nodiscard]] BoundaryLimit f_at_zero(double df1);

/// Beta(alpha, beta) at x = 0 (use alpha) or x = 1 (use beta).
/// `norm` is 1/B(alpha, beta).
[[nodiscard]] BoundaryLimit beta_edge(double exponent_param, double norm);

/// Which Beta edges are decomposed as poles.
/// An edge is flagged when its shape is below 2 and |shape - 1| exceeds
/// `max_pole_exponent`, so near-singular shapes are treated as singular too.
struct EdgePoles {
    bool left = false;
    bool right = false;
};

[[nodiscard]] EdgePoles beta_edge_poles(double alpha, double beta, double max_pole_exponent);

/// Weibull marks its boundary-adjacent segment as a pole for k <= 1, and for
/// non-integer k > 1 where the density near 0 behaves like a fractional power.
[[nodiscard]] bool weibull_marks_pole(double k);

/// F marks [0, 1] (df1 < 2) or [0, mode] (df1 > 2) as a pole segment.
[[nodiscard]] bool f_marks_pole(double df1);

} // namespace segdist::distributions
