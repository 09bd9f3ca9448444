#pragma once

#include "segdist/piecewise/piecewise_distribution.hpp"
#include "segdist/random.hpp"
#include <Eigen/Dense>
#include <string>

namespace segdist::distributions {

/// Pareto with index alpha on [xmin, +inf).
class Pareto {
public:
    Pareto(double alpha = 1.0, double xmin = 1.0);

    [[nodiscard]] double alpha() const { return alpha_; }
    [[nodiscard]] double xmin() const { return xmin_; }

    [[nodiscard]] double log_pdf(double x) const;
    [[nodiscard]] double pdf(double x) const;
    [[nodiscard]] Eigen::ArrayXd pdf(const Eigen::ArrayXd& x) const;
    [[nodiscard]] piecewise::PiecewiseDistribution build_piecewise() const;
    [[nodiscard]] Eigen::VectorXd sample(Eigen::Index n, Rng& rng) const;
    [[nodiscard]] std::string name() const;

private:
    double alpha_;
    double xmin_;
    double log_nrm_;
};

/// Levy with scale c on [xmin, +inf). The density vanishes at xmin.
class Levy {
public:
    Levy(double c = 1.0, double xmin = 0.0);

    [[nodiscard]] double c() const { return c_; }
    [[nodiscard]] double xmin() const { return xmin_; }

    [[nodiscard]] double log_pdf(double x) const;
    [[nodiscard]] double pdf(double x) const;
    [[nodiscard]] Eigen::ArrayXd pdf(const Eigen::ArrayXd& x) const;
    [[nodiscard]] piecewise::PiecewiseDistribution build_piecewise() const;
    [[nodiscard]] Eigen::VectorXd sample(Eigen::Index n, Rng& rng) const;
    [[nodiscard]] std::string name() const;

private:
    double c_;
    double xmin_;
    double log_nrm_;
};

} // namespace segdist::distributions
