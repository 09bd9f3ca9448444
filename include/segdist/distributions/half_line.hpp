#pragma once

#include "segdist/distributions/pole.hpp"
#include "segdist/piecewise/piecewise_distribution.hpp"
#include "segdist/random.hpp"
#include <Eigen/Dense>
#include <string>

namespace segdist::distributions {

// Families supported on [0, +inf). Densities are evaluated in the log
// domain strictly inside the support; the value at 0 is the analytic limit
// from the boundary classifier.

/// Chi-square with df degrees of freedom. df in (0, 1) is rejected with
/// UnsupportedParameterRange: the decomposition has no branch for it.
class ChiSquare {
public:
    explicit ChiSquare(double df = 1.0);

    [[nodiscard]] double df() const { return df_; }
    [[nodiscard]] BoundaryLimit at_zero() const { return at_zero_; }

    [[nodiscard]] double log_pdf(double x) const;
    [[nodiscard]] double pdf(double x) const;
    [[nodiscard]] Eigen::ArrayXd pdf(const Eigen::ArrayXd& x) const;
    [[nodiscard]] piecewise::PiecewiseDistribution build_piecewise() const;
    [[nodiscard]] Eigen::VectorXd sample(Eigen::Index n, Rng& rng) const;
    [[nodiscard]] std::string name() const;

private:
    double df_;
    double lg_norm_;
    BoundaryLimit at_zero_;
};

/// Exponential with rate lambda.
class Exponential {
public:
    explicit Exponential(double lambda = 1.0);

    [[nodiscard]] double lambda() const { return lambda_; }

    [[nodiscard]] double log_pdf(double x) const;
    [[nodiscard]] double pdf(double x) const;
    [[nodiscard]] Eigen::ArrayXd pdf(const Eigen::ArrayXd& x) const;
    [[nodiscard]] piecewise::PiecewiseDistribution build_piecewise() const;
    [[nodiscard]] Eigen::VectorXd sample(Eigen::Index n, Rng& rng) const;
    [[nodiscard]] std::string name() const;

private:
    double lambda_;
    double log_lambda_;
};

/// Gamma with shape k and scale theta.
class Gamma {
public:
    Gamma(double k = 2.0, double theta = 2.0);

    [[nodiscard]] double k() const { return k_; }
    [[nodiscard]] double theta() const { return theta_; }
    [[nodiscard]] BoundaryLimit at_zero() const { return at_zero_; }

    [[nodiscard]] double log_pdf(double x) const;
    [[nodiscard]] double pdf(double x) const;
    [[nodiscard]] Eigen::ArrayXd pdf(const Eigen::ArrayXd& x) const;
    [[nodiscard]] piecewise::PiecewiseDistribution build_piecewise() const;
    [[nodiscard]] Eigen::VectorXd sample(Eigen::Index n, Rng& rng) const;
    [[nodiscard]] std::string name() const;

private:
    double k_;
    double theta_;
    double lg_norm_;
    BoundaryLimit at_zero_;
};

/// Fisher-Snedecor F(df1, df2).
class FDistr {
public:
    FDistr(double df1 = 1.0, double df2 = 1.0);

    [[nodiscard]] double df1() const { return df1_; }
    [[nodiscard]] double df2() const { return df2_; }
    [[nodiscard]] BoundaryLimit at_zero() const { return at_zero_; }

    [[nodiscard]] double log_pdf(double x) const;
    [[nodiscard]] double pdf(double x) const;
    [[nodiscard]] Eigen::ArrayXd pdf(const Eigen::ArrayXd& x) const;
    [[nodiscard]] piecewise::PiecewiseDistribution build_piecewise() const;
    [[nodiscard]] Eigen::VectorXd sample(Eigen::Index n, Rng& rng) const;
    [[nodiscard]] std::string name() const;

private:
    double df1_;
    double df2_;
    double lg_norm_;
    BoundaryLimit at_zero_;
};

/// Weibull with shape k and scale lambda.
class Weibull {
public:
    Weibull(double k = 3.0, double lambda = 1.0);

    [[nodiscard]] double k() const { return k_; }
    [[nodiscard]] double lambda() const { return lambda_; }
    [[nodiscard]] BoundaryLimit at_zero() const { return at_zero_; }

    [[nodiscard]] double log_pdf(double x) const;
    [[nodiscard]] double pdf(double x) const;
    [[nodiscard]] Eigen::ArrayXd pdf(const Eigen::ArrayXd& x) const;
    [[nodiscard]] piecewise::PiecewiseDistribution build_piecewise() const;
    [[nodiscard]] Eigen::VectorXd sample(Eigen::Index n, Rng& rng) const;
    [[nodiscard]] std::string name() const;

private:
    double k_;
    double lambda_;
    double log_nrm_;
    BoundaryLimit at_zero_;
};

} // namespace segdist::distributions
