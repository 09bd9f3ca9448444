#include "segdist/distributions/user_defined.hpp"
#include "segdist/distributions/stable_eval.hpp"
#include "segdist/errors.hpp"
#include <fmt/core.h>
#include <cmath>
#include <utility>

namespace segdist::distributions {

using piecewise::PiecewiseDistribution;

// ---- FunctionDistr ----

FunctionDistr::FunctionDistr(piecewise::DensityFn f, std::vector<double> breaks,
                             std::vector<bool> left_poles, std::vector<bool> right_poles)
    : f_(std::move(f)),
      breaks_(std::move(breaks)),
      left_poles_(std::move(left_poles)),
      right_poles_(std::move(right_poles)) {
    if (!f_) {
        throw InvalidParameter("FunctionDistr: density function is empty");
    }
    if (breaks_.size() < 2) {
        throw InvalidParameter("FunctionDistr: need at least two break points");
    }
    for (std::size_t i = 1; i < breaks_.size(); ++i) {
        if (std::isnan(breaks_[i - 1]) || !(breaks_[i - 1] < breaks_[i])) {
            throw InvalidParameter(fmt::format(
                "FunctionDistr: break points must be strictly increasing ({} then {})",
                breaks_[i - 1], breaks_[i]));
        }
    }
    const std::size_t pieces = breaks_.size() - 1;
    for (const auto* flags : {&left_poles_, &right_poles_}) {
        if (!flags->empty() && flags->size() != pieces && flags->size() != pieces + 1) {
            throw InvalidParameter(fmt::format(
                "FunctionDistr: {} pole flags for {} pieces", flags->size(), pieces));
        }
    }
}

double FunctionDistr::pdf(double x) const {
    if (std::isnan(x)) return x;
    if (x < breaks_.front() || x > breaks_.back()) return 0.0;
    return f_(x);
}

Eigen::ArrayXd FunctionDistr::pdf(const Eigen::ArrayXd& x) const {
    return detail::eval_everywhere(x, [this](double v) { return pdf(v); });
}

PiecewiseDistribution FunctionDistr::build_piecewise() const {
    return PiecewiseDistribution::from_breakpoints(f_, breaks_, left_poles_, right_poles_);
}

std::string FunctionDistr::name() const {
    return fmt::format("USER_FUN({},{})", breaks_.front(), breaks_.back());
}

// ---- SegmentDistr ----

SegmentDistr::SegmentDistr(std::vector<piecewise::Segment> segments)
    : SegmentDistr(PiecewiseDistribution(std::move(segments))) {}

SegmentDistr::SegmentDistr(PiecewiseDistribution pw) {
    if (pw.empty()) {
        throw InvalidParameter("SegmentDistr: no segments");
    }
    pw_ = std::make_shared<const PiecewiseDistribution>(std::move(pw));
}

double SegmentDistr::pdf(double x) const {
    if (std::isnan(x)) return x;
    return pw_->density(x) + pw_->point_mass(x);
}

Eigen::ArrayXd SegmentDistr::pdf(const Eigen::ArrayXd& x) const {
    return detail::eval_everywhere(x, [this](double v) { return pdf(v); });
}

PiecewiseDistribution SegmentDistr::build_piecewise() const { return *pw_; }

std::string SegmentDistr::name() const { return fmt::format("USER_PDISTR({})", pw_->size()); }

} // namespace segdist::distributions
