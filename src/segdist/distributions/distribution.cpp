#include "segdist/distributions/distribution.hpp"
#include "segdist/distributions/stable_eval.hpp"
#include "segdist/errors.hpp"
#include "segdist/log.hpp"
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace segdist::distributions {

using piecewise::PiecewiseDistribution;

namespace {

constexpr double kWeightTolerance = 1e-9;

/// Detects a closed-form `sample(n, rng)` member.
template <typename U, typename = void>
struct has_sample_ : std::false_type {};

template <typename U>
struct has_sample_<U, std::void_t<decltype(std::declval<const U&>().sample(
                          std::declval<Eigen::Index>(), std::declval<Rng&>()))>>
    : std::true_type {};

} // anonymous namespace

// ---- Mix ----

Mix::Mix(std::vector<double> weights, std::vector<Distribution> components) {
    if (components.empty()) {
        throw InvalidParameter("Mix: no components");
    }
    if (weights.size() != components.size()) {
        throw InvalidParameter(fmt::format(
            "Mix: {} weights for {} components", weights.size(), components.size()));
    }
    double total = 0.0;
    for (double w : weights) {
        if (!(w >= 0.0) || !std::isfinite(w)) {
            throw InvalidParameter(fmt::format("Mix: weight {} is invalid", w));
        }
        total += w;
    }
    if (std::abs(total - 1.0) > kWeightTolerance) {
        throw InvalidParameter(fmt::format("Mix: weights sum to {}, not 1", total));
    }
    for (std::size_t i = 0; i < components.size(); ++i) {
        mixture_.add_component(std::move(components[i]), weights[i]);
    }
}

double Mix::pdf(double x) const {
    if (std::isnan(x)) return x;
    double y = 0.0;
    for (std::size_t i = 0; i < mixture_.size(); ++i) {
        y += mixture_.weight(i) * mixture_.component(i).density(x);
    }
    return y;
}

Eigen::ArrayXd Mix::pdf(const Eigen::ArrayXd& x) const {
    return detail::eval_everywhere(x, [this](double v) { return pdf(v); });
}

PiecewiseDistribution Mix::build_piecewise() const {
    // Zero-weight components contribute nothing.
    const Mixture<Distribution> active = mixture_.extract_mix(std::numeric_limits<double>::min());
    PiecewiseDistribution sum = active.component(0).piecewise().scaled(active.weight(0));
    for (std::size_t i = 1; i < active.size(); ++i) {
        sum = sum + active.component(i).piecewise().scaled(active.weight(i));
    }
    return sum;
}

std::string Mix::name() const { return "MIX()"; }

// ---- Distribution ----

double Distribution::density(double x) const {
    return std::visit([x](const auto& d) { return d.pdf(x); }, family_);
}

Eigen::ArrayXd Distribution::density(const Eigen::ArrayXd& x) const {
    return std::visit([&x](const auto& d) -> Eigen::ArrayXd { return d.pdf(x); }, family_);
}

const PiecewiseDistribution& Distribution::build_piecewise() const {
    std::call_once(lazy_->once, [this] {
        auto pw = std::visit([](const auto& d) { return d.build_piecewise(); }, family_);
        log::logger()->debug("{}: {} pieces, breaks {}", display_name(), pw.size(), pw.breaks());
        lazy_->value = std::make_unique<const PiecewiseDistribution>(std::move(pw));
        lazy_->built.store(true, std::memory_order_release);
    });
    return *lazy_->value;
}

Eigen::VectorXd Distribution::draw_samples(Eigen::Index n, Rng& rng) const {
    if (n < 0) {
        throw std::invalid_argument(fmt::format("draw_samples: negative count {}", n));
    }
    return std::visit([&](const auto& d) -> Eigen::VectorXd {
        using T = std::decay_t<decltype(d)>;
        if constexpr (has_sample_<T>::value) {
            return d.sample(n, rng);
        } else {
            return build_piecewise().sample_inverse_cdf(n, rng);
        }
    }, family_);
}

double Distribution::draw_sample(Rng& rng) const { return draw_samples(1, rng)(0); }

std::string Distribution::display_name() const {
    return std::visit([](const auto& d) { return d.name(); }, family_);
}

} // namespace segdist::distributions
