#pragma once

#include "segdist/distributions/pole.hpp"
#include "segdist/piecewise/piecewise_distribution.hpp"
#include "segdist/random.hpp"
#include <Eigen/Dense>
#include <string>

namespace segdist::distributions {

/// Beta(alpha, beta) on [0, 1].
///
/// The support is always split at 0.5. Edge segments are flagged as poles
/// according to beta_edge_poles(); the tolerance defaults to the global
/// pole-detection option.
class Beta {
public:
    Beta(double alpha = 1.0, double beta = 1.0);
    Beta(double alpha, double beta, double max_pole_exponent);

    [[nodiscard]] double alpha() const { return alpha_; }
    [[nodiscard]] double beta() const { return beta_; }
    [[nodiscard]] double max_pole_exponent() const { return max_pole_exponent_; }
    [[nodiscard]] EdgePoles edge_poles() const { return poles_; }

    /// Analytic mode (alpha - 1) / (alpha + beta - 2), or NaN where it is not
    /// unique. Not used as a break point.
    [[nodiscard]] double analytic_mode() const;

    [[nodiscard]] double log_pdf(double x) const;
    [[nodiscard]] double pdf(double x) const;
    [[nodiscard]] Eigen::ArrayXd pdf(const Eigen::ArrayXd& x) const;
    [[nodiscard]] piecewise::PiecewiseDistribution build_piecewise() const;
    [[nodiscard]] Eigen::VectorXd sample(Eigen::Index n, Rng& rng) const;
    [[nodiscard]] std::string name() const;

private:
    double alpha_;
    double beta_;
    double max_pole_exponent_;
    double log_norm_;
    BoundaryLimit at_zero_;
    BoundaryLimit at_one_;
    EdgePoles poles_;
};

/// Wigner semicircle of radius R on [-R, R].
class Semicircle {
public:
    explicit Semicircle(double radius = 1.0);

    [[nodiscard]] double radius() const { return radius_; }

    [[nodiscard]] double log_pdf(double x) const;
    [[nodiscard]] double pdf(double x) const;
    [[nodiscard]] Eigen::ArrayXd pdf(const Eigen::ArrayXd& x) const;
    [[nodiscard]] piecewise::PiecewiseDistribution build_piecewise() const;
    [[nodiscard]] Eigen::VectorXd sample(Eigen::Index n, Rng& rng) const;
    [[nodiscard]] std::string name() const;

private:
    double radius_;
    double log_norm_;
};

} // namespace segdist::distributions
