#include "segdist/distributions/bounded.hpp"
#include "segdist/config.hpp"
#include "segdist/distributions/stable_eval.hpp"
#include "segdist/errors.hpp"
#include <fmt/core.h>
#include <cmath>
#include <limits>
#include <numbers>

namespace segdist::distributions {

using piecewise::PiecewiseDistribution;
using piecewise::PoleSide;
using piecewise::Segment;

// ---- Beta ----

Beta::Beta(double alpha, double beta)
    : Beta(alpha, beta, params().pole_detection.max_pole_exponent) {}

Beta::Beta(double alpha, double beta, double max_pole_exponent)
    : alpha_(alpha), beta_(beta), max_pole_exponent_(max_pole_exponent) {
    segdist::detail::require_positive(alpha, "Beta", "alpha");
    segdist::detail::require_positive(beta, "Beta", "beta");
    if (!(max_pole_exponent >= 0.0)) {
        throw InvalidParameter(fmt::format(
            "Beta: max_pole_exponent must be non-negative, got {}", max_pole_exponent));
    }
    log_norm_ = std::lgamma(alpha_ + beta_) - std::lgamma(alpha_) - std::lgamma(beta_);
    const double norm = std::exp(log_norm_);
    at_zero_ = beta_edge(alpha_, norm);
    at_one_ = beta_edge(beta_, norm);
    poles_ = beta_edge_poles(alpha_, beta_, max_pole_exponent_);
}

double Beta::analytic_mode() const {
    if (alpha_ > 1.0 && beta_ > 1.0) return (alpha_ - 1.0) / (alpha_ + beta_ - 2.0);
    if (alpha_ <= 1.0 && beta_ > 1.0) return 0.0;
    if (alpha_ > 1.0 && beta_ <= 1.0) return 1.0;
    return std::numeric_limits<double>::quiet_NaN();
}

double Beta::log_pdf(double x) const {
    return log_norm_ + (alpha_ - 1.0) * std::log(x) + (beta_ - 1.0) * std::log1p(-x);
}

double Beta::pdf(double x) const {
    return detail::eval_bounded(x, 0.0, 1.0, at_zero_.value, at_one_.value,
                                [this](double v) { return log_pdf(v); });
}

Eigen::ArrayXd Beta::pdf(const Eigen::ArrayXd& x) const {
    return detail::eval_bounded(x, 0.0, 1.0, at_zero_.value, at_one_.value,
                                [this](double v) { return log_pdf(v); });
}

PiecewiseDistribution Beta::build_piecewise() const {
    constexpr double split = 0.5;
    auto f = [self = *this](double x) { return self.pdf(x); };
    return PiecewiseDistribution({
        poles_.left ? Segment::with_pole(0.0, split, f, PoleSide::left) : Segment::finite(0.0, split, f),
        poles_.right ? Segment::with_pole(split, 1.0, f, PoleSide::right) : Segment::finite(split, 1.0, f),
    });
}

Eigen::VectorXd Beta::sample(Eigen::Index n, Rng& rng) const {
    return Eigen::Rand::beta<Eigen::VectorXd>(n, 1, rng, alpha_, beta_);
}

std::string Beta::name() const { return fmt::format("Beta({},{})", alpha_, beta_); }

// ---- Semicircle ----

Semicircle::Semicircle(double radius) : radius_(radius) {
    segdist::detail::require_positive(radius, "Semicircle", "R");
    log_norm_ = std::log(2.0 / (std::numbers::pi * radius_ * radius_));
}

double Semicircle::log_pdf(double x) const {
    return log_norm_ + 0.5 * (std::log(radius_ - x) + std::log(radius_ + x));
}

double Semicircle::pdf(double x) const {
    return detail::eval_bounded(x, -radius_, radius_, 0.0, 0.0,
                                [this](double v) { return log_pdf(v); });
}

Eigen::ArrayXd Semicircle::pdf(const Eigen::ArrayXd& x) const {
    return detail::eval_bounded(x, -radius_, radius_, 0.0, 0.0,
                                [this](double v) { return log_pdf(v); });
}

PiecewiseDistribution Semicircle::build_piecewise() const {
    // The square-root edges have unbounded derivative; integrate them as poles.
    auto f = [self = *this](double x) { return self.pdf(x); };
    const double h = 0.5 * radius_;
    return PiecewiseDistribution({
        Segment::with_pole(-radius_, -h, f, PoleSide::left),
        Segment::finite(-h, h, f),
        Segment::with_pole(h, radius_, f, PoleSide::right),
    });
}

Eigen::VectorXd Semicircle::sample(Eigen::Index n, Rng& rng) const {
    Eigen::ArrayXd u = Eigen::Rand::uniformReal<Eigen::ArrayXd>(n, 1, rng);
    Eigen::ArrayXd v = Eigen::Rand::uniformReal<Eigen::ArrayXd>(n, 1, rng);
    return (radius_ * u.sqrt() * (std::numbers::pi * v).cos()).matrix();
}

std::string Semicircle::name() const { return fmt::format("Semicircle({})", radius_); }

} // namespace segdist::distributions
