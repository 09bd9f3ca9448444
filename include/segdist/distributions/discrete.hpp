#pragma once

#include "segdist/piecewise/piecewise_distribution.hpp"
#include "segdist/random.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace segdist::distributions {

class Discrete;
[[nodiscard]] Discrete constant(double c, double p);

/// Discrete law on finitely many points.
///
/// Support values are sorted at construction and equal values are merged.
/// The piecewise form carries one point mass per value plus zero-density
/// constant pieces between neighbours.
class Discrete {
public:
    Discrete();
    Discrete(std::vector<double> xi, std::vector<double> pi);

    [[nodiscard]] const std::vector<double>& xi() const { return xi_; }
    [[nodiscard]] const std::vector<double>& pi() const { return pi_; }
    [[nodiscard]] std::size_t size() const { return xi_.size(); }
    [[nodiscard]] double mass() const { return mass_; }

    /// Probability at x if x is a support value, 0 otherwise.
    [[nodiscard]] double pdf(double x) const;
    [[nodiscard]] Eigen::ArrayXd pdf(const Eigen::ArrayXd& x) const;
    [[nodiscard]] piecewise::PiecewiseDistribution build_piecewise() const;
    [[nodiscard]] Eigen::VectorXd sample(Eigen::Index n, Rng& rng) const;

    /// "Di(n)", or the value itself for a one-point law.
    [[nodiscard]] std::string name() const;

private:
    friend Discrete constant(double c, double p);
    Discrete(std::vector<double> xi, std::vector<double> pi, bool unit_mass);

    std::vector<double> xi_;
    std::vector<double> pi_;
    double mass_ = 0.0;
};

/// One-point law at c carrying mass p in [0, 1]. p < 1 gives a defective
/// law, used as a weight when scaling other laws.
[[nodiscard]] Discrete constant(double c, double p = 1.0);
[[nodiscard]] Discrete one();
[[nodiscard]] Discrete zero();

} // namespace segdist::distributions
