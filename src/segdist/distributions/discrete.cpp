#include "segdist/distributions/discrete.hpp"
#include "segdist/distributions/stable_eval.hpp"
#include "segdist/errors.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace segdist::distributions {

using piecewise::PiecewiseDistribution;
using piecewise::Segment;

namespace {

constexpr double kSumTolerance = 1e-9;

} // anonymous namespace

Discrete::Discrete() : Discrete({0.0, 1.0}, {0.5, 0.5}) {}

Discrete::Discrete(std::vector<double> xi, std::vector<double> pi)
    : Discrete(std::move(xi), std::move(pi), true) {}

Discrete::Discrete(std::vector<double> xi, std::vector<double> pi, bool unit_mass) {
    if (xi.empty()) {
        throw InvalidParameter("Discrete: support is empty");
    }
    if (xi.size() != pi.size()) {
        throw InvalidParameter(fmt::format(
            "Discrete: {} support values but {} probabilities", xi.size(), pi.size()));
    }
    for (std::size_t i = 0; i < xi.size(); ++i) {
        segdist::detail::require_finite(xi[i], "Discrete", "support value");
        if (!(pi[i] >= 0.0) || !std::isfinite(pi[i])) {
            throw InvalidParameter(fmt::format("Discrete: probability {} at {} is invalid", pi[i], xi[i]));
        }
    }

    std::vector<std::size_t> order(xi.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::sort(order.begin(), order.end(), [&xi](std::size_t l, std::size_t r) { return xi[l] < xi[r]; });

    for (std::size_t i : order) {
        if (!xi_.empty() && xi_.back() == xi[i]) {
            pi_.back() += pi[i];
        } else {
            xi_.push_back(xi[i]);
            pi_.push_back(pi[i]);
        }
    }

    mass_ = std::accumulate(pi_.begin(), pi_.end(), 0.0);
    if (unit_mass && std::abs(mass_ - 1.0) > kSumTolerance) {
        throw InvalidParameter(fmt::format("Discrete: probabilities sum to {}, not 1", mass_));
    }
}

double Discrete::pdf(double x) const {
    if (std::isnan(x)) return x;
    const auto it = std::lower_bound(xi_.begin(), xi_.end(), x);
    if (it == xi_.end() || *it != x) return 0.0;
    return pi_[static_cast<std::size_t>(it - xi_.begin())];
}

Eigen::ArrayXd Discrete::pdf(const Eigen::ArrayXd& x) const {
    return detail::eval_everywhere(x, [this](double v) { return pdf(v); });
}

PiecewiseDistribution Discrete::build_piecewise() const {
    std::vector<Segment> segs;
    segs.reserve(2 * xi_.size());
    for (std::size_t i = 0; i < xi_.size(); ++i) {
        segs.push_back(Segment::dirac(xi_[i], pi_[i]));
        if (i + 1 < xi_.size()) {
            segs.push_back(Segment::constant(xi_[i], xi_[i + 1], 0.0));
        }
    }
    return PiecewiseDistribution(std::move(segs));
}

Eigen::VectorXd Discrete::sample(Eigen::Index n, Rng& rng) const {
    if (!(mass_ > 0.0)) {
        throw std::logic_error("Discrete::sample: law carries no mass");
    }
    // Weights need not sum to 1; a defective law is sampled conditionally.
    const Eigen::ArrayXi idx = Eigen::Rand::discrete<Eigen::ArrayXi>(n, 1, rng, pi_.begin(), pi_.end());
    Eigen::VectorXd out(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        out(i) = xi_[static_cast<std::size_t>(idx(i))];
    }
    return out;
}

std::string Discrete::name() const {
    if (xi_.size() == 1) return fmt::format("{}", xi_.front());
    return fmt::format("Di({})", xi_.size());
}

Discrete constant(double c, double p) {
    if (p > 1.0 + kSumTolerance) {
        throw InvalidParameter(fmt::format("constant: mass {} exceeds 1", p));
    }
    return Discrete({c}, {p}, false);
}

Discrete one() { return constant(1.0); }

Discrete zero() { return constant(0.0); }

} // namespace segdist::distributions
