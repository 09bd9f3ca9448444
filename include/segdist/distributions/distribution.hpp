#pragma once

#include "segdist/distributions/bounded.hpp"
#include "segdist/distributions/discrete.hpp"
#include "segdist/distributions/half_line.hpp"
#include "segdist/distributions/heavy_tail.hpp"
#include "segdist/distributions/location_scale.hpp"
#include "segdist/distributions/mixture.hpp"
#include "segdist/distributions/user_defined.hpp"
#include "segdist/piecewise/piecewise_distribution.hpp"
#include "segdist/random.hpp"
#include <Eigen/Dense>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace segdist::distributions {

class Distribution;

/// Weighted mixture of arbitrary laws. The piecewise form is the sum of the
/// components' piecewise forms, each scaled by its weight.
class Mix {
public:
    /// Weights must be non-negative, one per component, summing to 1.
    Mix(std::vector<double> weights, std::vector<Distribution> components);

    [[nodiscard]] const Mixture<Distribution>& mixture() const { return mixture_; }

    [[nodiscard]] double pdf(double x) const;
    [[nodiscard]] Eigen::ArrayXd pdf(const Eigen::ArrayXd& x) const;
    [[nodiscard]] piecewise::PiecewiseDistribution build_piecewise() const;
    [[nodiscard]] std::string name() const;

private:
    Mixture<Distribution> mixture_;
};

/// Handle over one law of any family.
///
/// Every family provides pdf (scalar and batch), build_piecewise and name;
/// those with a closed-form generator also provide sample, the rest are
/// sampled by inverting the CDF of the piecewise form. The piecewise form is
/// built at most once and shared between copies of the handle.
class Distribution {
public:
    using Family = std::variant<Normal, Uniform, Cauchy, ChiSquare, Exponential, Gamma, Beta,
                                Pareto, Levy, Laplace, StudentT, Semicircle, FDistr, Weibull,
                                Discrete, FunctionDistr, SegmentDistr, Mix>;

    template <typename T,
              typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, Distribution> &&
                                          std::is_constructible_v<Family, T&&>>>
    Distribution(T&& family)
        : family_(std::forward<T>(family)), lazy_(std::make_shared<LazyPiecewise>()) {}

    // ---- Evaluation ----

    [[nodiscard]] double density(double x) const;
    [[nodiscard]] Eigen::ArrayXd density(const Eigen::ArrayXd& x) const;

    // ---- Piecewise form ----

    /// Builds the piecewise form on first call; later calls return the same
    /// object. A failed build leaves the handle unbuilt.
    const piecewise::PiecewiseDistribution& build_piecewise() const;

    /// Same as build_piecewise(); the accessor mixtures combine through.
    [[nodiscard]] const piecewise::PiecewiseDistribution& piecewise() const { return build_piecewise(); }

    [[nodiscard]] bool is_built() const { return lazy_->built.load(std::memory_order_acquire); }

    // ---- Sampling ----

    [[nodiscard]] Eigen::VectorXd draw_samples(Eigen::Index n, Rng& rng) const;
    [[nodiscard]] double draw_sample(Rng& rng) const;

    // ---- Identity ----

    [[nodiscard]] std::string display_name() const;
    [[nodiscard]] const Family& family() const { return family_; }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&family_); }

private:
    struct LazyPiecewise {
        std::once_flag once;
        std::atomic<bool> built{false};
        std::unique_ptr<const piecewise::PiecewiseDistribution> value;
    };

    Family family_;
    std::shared_ptr<LazyPiecewise> lazy_;
};

} // namespace segdist::distributions
