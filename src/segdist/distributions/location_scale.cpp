#include "segdist/distributions/location_scale.hpp"
#include "segdist/distributions/stable_eval.hpp"
#include "segdist/errors.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>

namespace segdist::distributions {

using piecewise::PiecewiseDistribution;
using piecewise::Segment;

// ---- Normal ----

Normal::Normal(double mu, double sigma) : mu_(mu), sigma_(sigma) {
    segdist::detail::require_finite(mu, "Normal", "mu");
    segdist::detail::require_positive(sigma, "Normal", "sigma");
    one_over_twosigma2_ = 0.5 / (sigma_ * sigma_);
    nrm_ = 1.0 / (sigma_ * std::sqrt(2.0 * std::numbers::pi));
}

double Normal::pdf(double x) const {
    const double d = x - mu_;
    return nrm_ * std::exp(-d * d * one_over_twosigma2_);
}

Eigen::ArrayXd Normal::pdf(const Eigen::ArrayXd& x) const {
    return detail::eval_everywhere(x, [this](double v) { return pdf(v); });
}

PiecewiseDistribution Normal::build_piecewise() const {
    auto f = [self = *this](double x) { return self.pdf(x); };
    return PiecewiseDistribution({
        Segment::minus_inf(mu_ - sigma_, f),
        Segment::finite(mu_ - sigma_, mu_ + sigma_, f),
        Segment::plus_inf(mu_ + sigma_, f),
    });
}

Eigen::VectorXd Normal::sample(Eigen::Index n, Rng& rng) const {
    return Eigen::Rand::normal<Eigen::VectorXd>(n, 1, rng, mu_, sigma_);
}

std::string Normal::name() const { return fmt::format("N({},{})", mu_, sigma_); }

// ---- Uniform ----

Uniform::Uniform(double a, double b) : a_(a), b_(b) {
    segdist::detail::require_finite(a, "Uniform", "a");
    segdist::detail::require_finite(b, "Uniform", "b");
    if (!(a < b)) {
        throw InvalidParameter(fmt::format("Uniform: need a < b, got [{}, {}]", a, b));
    }
    p_ = 1.0 / (b_ - a_);
}

double Uniform::pdf(double x) const {
    if (std::isnan(x)) return x;
    return (x >= a_ && x <= b_) ? p_ : 0.0;
}

Eigen::ArrayXd Uniform::pdf(const Eigen::ArrayXd& x) const {
    return detail::eval_everywhere(x, [this](double v) { return pdf(v); });
}

PiecewiseDistribution Uniform::build_piecewise() const {
    return PiecewiseDistribution({Segment::constant(a_, b_, p_)});
}

Eigen::VectorXd Uniform::sample(Eigen::Index n, Rng& rng) const {
    Eigen::VectorXd u = Eigen::Rand::uniformReal<Eigen::VectorXd>(n, 1, rng);
    return (a_ + (b_ - a_) * u.array()).matrix();
}

std::string Uniform::name() const { return fmt::format("U({},{})", a_, b_); }

// ---- Cauchy ----

Cauchy::Cauchy(double gamma, double center) : gamma_(gamma), center_(center) {
    segdist::detail::require_positive(gamma, "Cauchy", "gamma");
    segdist::detail::require_finite(center, "Cauchy", "center");
}

double Cauchy::pdf(double x) const {
    const double d = x - center_;
    return gamma_ / (std::numbers::pi * (gamma_ * gamma_ + d * d));
}

Eigen::ArrayXd Cauchy::pdf(const Eigen::ArrayXd& x) const {
    return detail::eval_everywhere(x, [this](double v) { return pdf(v); });
}

PiecewiseDistribution Cauchy::build_piecewise() const {
    auto f = [self = *this](double x) { return self.pdf(x); };
    return PiecewiseDistribution({
        Segment::minus_inf(center_ - gamma_, f),
        Segment::finite(center_ - gamma_, center_ + gamma_, f),
        Segment::plus_inf(center_ + gamma_, f),
    });
}

Eigen::VectorXd Cauchy::sample(Eigen::Index n, Rng& rng) const {
    return Eigen::Rand::cauchy<Eigen::VectorXd>(n, 1, rng, center_, gamma_);
}

std::string Cauchy::name() const { return fmt::format("Cauchy({},{})", center_, gamma_); }

// ---- Laplace ----

Laplace::Laplace(double lambda, double mu) : lambda_(lambda), mu_(mu) {
    segdist::detail::require_positive(lambda, "Laplace", "lambda");
    segdist::detail::require_finite(mu, "Laplace", "mu");
    nrm_ = 0.5 / lambda_;
}

double Laplace::pdf(double x) const {
    return nrm_ * std::exp(-std::abs(x - mu_) / lambda_);
}

Eigen::ArrayXd Laplace::pdf(const Eigen::ArrayXd& x) const {
    return detail::eval_everywhere(x, [this](double v) { return pdf(v); });
}

PiecewiseDistribution Laplace::build_piecewise() const {
    auto f = [self = *this](double x) { return self.pdf(x); };
    const double lo = mu_ - 2.0 * lambda_;
    const double hi = mu_ + 2.0 * lambda_;
    return PiecewiseDistribution({
        Segment::minus_inf(lo, f),
        Segment::finite(lo, mu_, f),
        Segment::finite(mu_, hi, f),
        Segment::plus_inf(hi, f),
    });
}

Eigen::VectorXd Laplace::sample(Eigen::Index n, Rng& rng) const {
    Eigen::VectorXd u = Eigen::Rand::uniformReal<Eigen::VectorXd>(n, 1, rng);
    Eigen::VectorXd out(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const double v = u(i) - 0.5;
        const double t = std::max(1.0 - 2.0 * std::abs(v), std::numeric_limits<double>::min());
        out(i) = mu_ - lambda_ * std::copysign(1.0, v) * std::log(t);
    }
    return out;
}

std::string Laplace::name() const { return fmt::format("Laplace({},{})", lambda_, mu_); }

// ---- StudentT ----

StudentT::StudentT(double df) : df_(df) {
    segdist::detail::require_positive(df, "StudentT", "df");
    lg_norm_ = std::lgamma(0.5 * (df_ + 1.0)) - std::lgamma(0.5 * df_)
             - 0.5 * (std::log(df_) + std::log(std::numbers::pi));
}

double StudentT::log_pdf(double x) const {
    return lg_norm_ - 0.5 * (df_ + 1.0) * std::log1p(x * x / df_);
}

double StudentT::pdf(double x) const { return std::exp(log_pdf(x)); }

Eigen::ArrayXd StudentT::pdf(const Eigen::ArrayXd& x) const {
    return detail::eval_everywhere(x, [this](double v) { return pdf(v); });
}

PiecewiseDistribution StudentT::build_piecewise() const {
    auto f = [self = *this](double x) { return self.pdf(x); };
    const double c = std::sqrt(df_ / (df_ + 2.0));
    return PiecewiseDistribution({
        Segment::minus_inf(-c, f),
        Segment::finite(-c, c, f),
        Segment::plus_inf(c, f),
    });
}

Eigen::VectorXd StudentT::sample(Eigen::Index n, Rng& rng) const {
    return Eigen::Rand::studentT<Eigen::VectorXd>(n, 1, rng, df_);
}

std::string StudentT::name() const { return fmt::format("StudentT({})", df_); }

} // namespace segdist::distributions
