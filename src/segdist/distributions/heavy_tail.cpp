#include "segdist/distributions/heavy_tail.hpp"
#include "segdist/distributions/stable_eval.hpp"
#include "segdist/errors.hpp"
#include <fmt/core.h>
#include <cmath>
#include <numbers>

namespace segdist::distributions {

using piecewise::PiecewiseDistribution;
using piecewise::Segment;

// ---- Pareto ----

Pareto::Pareto(double alpha, double xmin) : alpha_(alpha), xmin_(xmin) {
    segdist::detail::require_positive(alpha, "Pareto", "alpha");
    segdist::detail::require_positive(xmin, "Pareto", "xmin");
    log_nrm_ = std::log(alpha_) + alpha_ * std::log(xmin_);
}

double Pareto::log_pdf(double x) const {
    return log_nrm_ - (alpha_ + 1.0) * std::log(x);
}

double Pareto::pdf(double x) const {
    return detail::eval_lower_bounded(x, xmin_, alpha_ / xmin_, [this](double v) { return log_pdf(v); });
}

Eigen::ArrayXd Pareto::pdf(const Eigen::ArrayXd& x) const {
    return detail::eval_lower_bounded(x, xmin_, alpha_ / xmin_, [this](double v) { return log_pdf(v); });
}

PiecewiseDistribution Pareto::build_piecewise() const {
    auto f = [self = *this](double x) { return self.pdf(x); };
    return PiecewiseDistribution({
        Segment::finite(xmin_, xmin_ + 1.0, f),
        Segment::plus_inf(xmin_ + 1.0, f),
    });
}

Eigen::VectorXd Pareto::sample(Eigen::Index n, Rng& rng) const {
    Eigen::VectorXd u = Eigen::Rand::uniformReal<Eigen::VectorXd>(n, 1, rng);
    // 1 - u lies in (0, 1], so the power stays finite.
    return (xmin_ * (1.0 - u.array()).pow(-1.0 / alpha_)).matrix();
}

std::string Pareto::name() const { return fmt::format("Pareto({},{})", alpha_, xmin_); }

// ---- Levy ----

Levy::Levy(double c, double xmin) : c_(c), xmin_(xmin) {
    segdist::detail::require_positive(c, "Levy", "c");
    segdist::detail::require_finite(xmin, "Levy", "xmin");
    log_nrm_ = 0.5 * std::log(c_ / (2.0 * std::numbers::pi));
}

double Levy::log_pdf(double x) const {
    const double t = x - xmin_;
    return log_nrm_ - 1.5 * std::log(t) - 0.5 * c_ / t;
}

double Levy::pdf(double x) const {
    return detail::eval_lower_bounded(x, xmin_, 0.0, [this](double v) { return log_pdf(v); });
}

Eigen::ArrayXd Levy::pdf(const Eigen::ArrayXd& x) const {
    return detail::eval_lower_bounded(x, xmin_, 0.0, [this](double v) { return log_pdf(v); });
}

PiecewiseDistribution Levy::build_piecewise() const {
    auto f = [self = *this](double x) { return self.pdf(x); };
    return PiecewiseDistribution({
        Segment::finite(xmin_, xmin_ + c_, f),
        Segment::plus_inf(xmin_ + c_, f),
    });
}

Eigen::VectorXd Levy::sample(Eigen::Index n, Rng& rng) const {
    Eigen::VectorXd z = Eigen::Rand::normal<Eigen::VectorXd>(n, 1, rng);
    return (xmin_ + c_ / z.array().square()).matrix();
}

std::string Levy::name() const { return fmt::format("Levy({},{})", c_, xmin_); }

} // namespace segdist::distributions
