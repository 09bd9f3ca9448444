#include "segdist/distributions/pole.hpp"
#include <cmath>
#include <limits>

namespace segdist::distributions {

BoundaryLimit BoundaryLimit::pole() {
    return {BoundaryBehavior::pole, std::numeric_limits<double>::infinity()};
}

BoundaryLimit BoundaryLimit::finite(double value) {
    return {BoundaryBehavior::finite, value};
}

BoundaryLimit BoundaryLimit::zero() {
    return {BoundaryBehavior::zero, 0.0};
}

BoundaryLimit BoundaryLimit::power_law(double exponent, double coefficient) {
    if (exponent < 0.0) return pole();
    if (exponent == 0.0) return finite(coefficient);
    return zero();
}

BoundaryLimit chi_square_at_zero(double df) {
    // density ~ x^(df/2 - 1) / (2^(df/2) Gamma(df/2)); equals 1/2 at df = 2
    return BoundaryLimit::power_law(df / 2.0 - 1.0, 0.5);
}

BoundaryLimit gamma_at_zero(double k, double theta) {
    return BoundaryLimit::power_law(k - 1.0, 1.0 / theta);
}

BoundaryLimit weibull_at_zero(double k, double lambda) {
    return BoundaryLimit::power_law(k - 1.0, k / lambda);
}

BoundaryLimit f_at_zero(double df1) {
    return BoundaryLimit::power_law(df1 / 2.0 - 1.0, 1.0);
}

BoundaryLimit beta_edge(double exponent_param, double norm) {
    return BoundaryLimit::power_law(exponent_param - 1.0, norm);
}

EdgePoles beta_edge_poles(double alpha, double beta, double max_pole_exponent) {
    EdgePoles poles;
    poles.left = alpha < 2.0 && std::abs(alpha - 1.0) > max_pole_exponent;
    poles.right = beta < 2.0 && std::abs(beta - 1.0) > max_pole_exponent;
    return poles;
}

bool weibull_marks_pole(double k) {
    if (k <= 1.0) return true;
    return k != std::floor(k);
}

bool f_marks_pole(double df1) {
    return df1 != 2.0;
}

} // namespace segdist::distributions
