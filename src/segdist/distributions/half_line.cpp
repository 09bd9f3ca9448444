#include "segdist/distributions/half_line.hpp"
#include "segdist/distributions/stable_eval.hpp"
#include "segdist/errors.hpp"
#include <fmt/core.h>
#include <cmath>
#include <limits>
#include <vector>

namespace segdist::distributions {

using piecewise::PiecewiseDistribution;
using piecewise::PoleSide;
using piecewise::Segment;

namespace {

/// [0, a) with an optional left pole, then [a, +inf).
PiecewiseDistribution head_and_tail(const piecewise::DensityFn& f, double a, bool left_pole) {
    return PiecewiseDistribution({
        left_pole ? Segment::with_pole(0.0, a, f, PoleSide::left) : Segment::finite(0.0, a, f),
        Segment::plus_inf(a, f),
    });
}

} // anonymous namespace

// ---- ChiSquare ----

ChiSquare::ChiSquare(double df) : df_(df) {
    segdist::detail::require_positive(df, "ChiSquare", "df");
    if (df < 1.0) {
        throw UnsupportedParameterRange(
            fmt::format("ChiSquare: df = {} is below 1, no decomposition available", df));
    }
    lg_norm_ = std::lgamma(0.5 * df_) + 0.5 * df_ * std::log(2.0);
    at_zero_ = chi_square_at_zero(df_);
}

double ChiSquare::log_pdf(double x) const {
    return (0.5 * df_ - 1.0) * std::log(x) - 0.5 * x - lg_norm_;
}

double ChiSquare::pdf(double x) const {
    return detail::eval_lower_bounded(x, 0.0, at_zero_.value, [this](double v) { return log_pdf(v); });
}

Eigen::ArrayXd ChiSquare::pdf(const Eigen::ArrayXd& x) const {
    return detail::eval_lower_bounded(x, 0.0, at_zero_.value, [this](double v) { return log_pdf(v); });
}

PiecewiseDistribution ChiSquare::build_piecewise() const {
    auto f = [self = *this](double x) { return self.pdf(x); };
    const double inf = std::numeric_limits<double>::infinity();
    const std::vector<double> breaks = df_ <= 20.0
        ? std::vector<double>{0.0, 0.5 * df_, 2.0 * df_, inf}
        : std::vector<double>{0.0, 0.75 * df_, 4.0 / 3.0 * df_, inf};
    return PiecewiseDistribution::from_breakpoints(f, breaks, {at_zero_.is_pole(), false, false});
}

Eigen::VectorXd ChiSquare::sample(Eigen::Index n, Rng& rng) const {
    return Eigen::Rand::chiSquared<Eigen::VectorXd>(n, 1, rng, df_);
}

std::string ChiSquare::name() const { return fmt::format("Chi2({})", df_); }

// ---- Exponential ----

Exponential::Exponential(double lambda) : lambda_(lambda) {
    segdist::detail::require_positive(lambda, "Exponential", "lambda");
    log_lambda_ = std::log(lambda_);
}

double Exponential::log_pdf(double x) const { return log_lambda_ - lambda_ * x; }

double Exponential::pdf(double x) const {
    return detail::eval_lower_bounded(x, 0.0, lambda_, [this](double v) { return log_pdf(v); });
}

Eigen::ArrayXd Exponential::pdf(const Eigen::ArrayXd& x) const {
    return detail::eval_lower_bounded(x, 0.0, lambda_, [this](double v) { return log_pdf(v); });
}

PiecewiseDistribution Exponential::build_piecewise() const {
    auto f = [self = *this](double x) { return self.pdf(x); };
    return head_and_tail(f, 1.0, false);
}

Eigen::VectorXd Exponential::sample(Eigen::Index n, Rng& rng) const {
    return Eigen::Rand::exponential<Eigen::VectorXd>(n, 1, rng, lambda_);
}

std::string Exponential::name() const { return fmt::format("Ex({})", lambda_); }

// ---- Gamma ----

Gamma::Gamma(double k, double theta) : k_(k), theta_(theta) {
    segdist::detail::require_positive(k, "Gamma", "k");
    segdist::detail::require_positive(theta, "Gamma", "theta");
    lg_norm_ = std::lgamma(k_) + k_ * std::log(theta_);
    at_zero_ = gamma_at_zero(k_, theta_);
}

double Gamma::log_pdf(double x) const {
    return (k_ - 1.0) * std::log(x) - x / theta_ - lg_norm_;
}

double Gamma::pdf(double x) const {
    return detail::eval_lower_bounded(x, 0.0, at_zero_.value, [this](double v) { return log_pdf(v); });
}

Eigen::ArrayXd Gamma::pdf(const Eigen::ArrayXd& x) const {
    return detail::eval_lower_bounded(x, 0.0, at_zero_.value, [this](double v) { return log_pdf(v); });
}

PiecewiseDistribution Gamma::build_piecewise() const {
    auto f = [self = *this](double x) { return self.pdf(x); };
    if (k_ <= 1.0) {
        return head_and_tail(f, 1.0, at_zero_.is_pole());
    }
    const double mode = (k_ - 1.0) * theta_;
    return PiecewiseDistribution({
        Segment::finite(0.0, 0.5 * mode, f),
        Segment::finite(0.5 * mode, mode, f),
        Segment::finite(mode, 2.0 * mode, f),
        Segment::plus_inf(2.0 * mode, f),
    });
}

Eigen::VectorXd Gamma::sample(Eigen::Index n, Rng& rng) const {
    return Eigen::Rand::gamma<Eigen::VectorXd>(n, 1, rng, k_, theta_);
}

std::string Gamma::name() const { return fmt::format("Gamma({},{})", k_, theta_); }

// ---- FDistr ----

FDistr::FDistr(double df1, double df2) : df1_(df1), df2_(df2) {
    segdist::detail::require_positive(df1, "FDistr", "df1");
    segdist::detail::require_positive(df2, "FDistr", "df2");
    lg_norm_ = 0.5 * df2_ * std::log(df2_) + std::lgamma(0.5 * (df1_ + df2_))
             - std::lgamma(0.5 * df1_) - std::lgamma(0.5 * df2_);
    at_zero_ = f_at_zero(df1_);
}

double FDistr::log_pdf(double x) const {
    return lg_norm_
         + 0.5 * (df1_ * std::log(df1_ * x) - (df1_ + df2_) * std::log(df1_ * x + df2_))
         - std::log(x);
}

double FDistr::pdf(double x) const {
    return detail::eval_lower_bounded(x, 0.0, at_zero_.value, [this](double v) { return log_pdf(v); });
}

Eigen::ArrayXd FDistr::pdf(const Eigen::ArrayXd& x) const {
    return detail::eval_lower_bounded(x, 0.0, at_zero_.value, [this](double v) { return log_pdf(v); });
}

PiecewiseDistribution FDistr::build_piecewise() const {
    auto f = [self = *this](double x) { return self.pdf(x); };
    const bool pole = f_marks_pole(df1_);
    if (df1_ <= 2.0) {
        return head_and_tail(f, 1.0, pole);
    }
    const double mode = (df1_ - 2.0) / df1_ * df2_ / (df2_ + 2.0);
    return PiecewiseDistribution({
        pole ? Segment::with_pole(0.0, mode, f, PoleSide::left) : Segment::finite(0.0, mode, f),
        Segment::finite(mode, mode + 1.0, f),
        Segment::plus_inf(mode + 1.0, f),
    });
}

Eigen::VectorXd FDistr::sample(Eigen::Index n, Rng& rng) const {
    return Eigen::Rand::fisherF<Eigen::VectorXd>(n, 1, rng, df1_, df2_);
}

std::string FDistr::name() const { return fmt::format("F({},{})", df1_, df2_); }

// ---- Weibull ----

Weibull::Weibull(double k, double lambda) : k_(k), lambda_(lambda) {
    segdist::detail::require_positive(k, "Weibull", "k");
    segdist::detail::require_positive(lambda, "Weibull", "lambda");
    log_nrm_ = std::log(k_ / lambda_);
    at_zero_ = weibull_at_zero(k_, lambda_);
}

double Weibull::log_pdf(double x) const {
    const double t = x / lambda_;
    return log_nrm_ + (k_ - 1.0) * std::log(t) - std::pow(t, k_);
}

double Weibull::pdf(double x) const {
    return detail::eval_lower_bounded(x, 0.0, at_zero_.value, [this](double v) { return log_pdf(v); });
}

Eigen::ArrayXd Weibull::pdf(const Eigen::ArrayXd& x) const {
    return detail::eval_lower_bounded(x, 0.0, at_zero_.value, [this](double v) { return log_pdf(v); });
}

PiecewiseDistribution Weibull::build_piecewise() const {
    auto f = [self = *this](double x) { return self.pdf(x); };
    if (k_ <= 1.0) {
        return head_and_tail(f, k_, true);
    }
    const double mode = lambda_ * std::pow((k_ - 1.0) / k_, 1.0 / k_);
    return head_and_tail(f, mode, weibull_marks_pole(k_));
}

Eigen::VectorXd Weibull::sample(Eigen::Index n, Rng& rng) const {
    return Eigen::Rand::weibull<Eigen::VectorXd>(n, 1, rng, k_, lambda_);
}

std::string Weibull::name() const { return fmt::format("Weibull({},{})", k_, lambda_); }

} // namespace segdist::distributions
