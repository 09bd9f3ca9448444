#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

namespace segdist::distributions::detail {

/// Region of one evaluation point relative to the support [lo, hi].
enum class Region : std::uint8_t { outside, at_lo, at_hi, interior, nan };

inline Region classify(double x, double lo, double hi) {
    if (std::isnan(x)) return Region::nan;
    if (x == lo) return Region::at_lo;
    if (x == hi) return Region::at_hi;
    if (x > lo && x < hi) return Region::interior;
    return Region::outside;
}

/// Density on [lo, hi] computed as exp(log_pdf(x)) strictly inside, the
/// precomputed limits exactly at the ends and 0 outside. `log_pdf` is never
/// called at or beyond a boundary. `hi` may be +inf.
template <typename LogPdf>
double eval_bounded(double x, double lo, double hi, double at_lo, double at_hi,
                    const LogPdf& log_pdf) {
    switch (classify(x, lo, hi)) {
        case Region::nan: return x;
        case Region::at_lo: return at_lo;
        case Region::at_hi: return at_hi;
        case Region::interior: return std::exp(log_pdf(x));
        case Region::outside: break;
    }
    return 0.0;
}

/// Batch form of eval_bounded: the input is partitioned into disjoint masks
/// and each mask is filled on its own, so boundary and out-of-support points
/// never reach the interior formula.
template <typename LogPdf>
Eigen::ArrayXd eval_bounded(const Eigen::ArrayXd& x, double lo, double hi,
                            double at_lo, double at_hi, const LogPdf& log_pdf) {
    const Eigen::Index n = x.size();
    std::vector<Region> mask(static_cast<std::size_t>(n));
    for (Eigen::Index i = 0; i < n; ++i) mask[i] = classify(x(i), lo, hi);

    Eigen::ArrayXd y = Eigen::ArrayXd::Zero(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        if (mask[i] == Region::interior) y(i) = std::exp(log_pdf(x(i)));
    }
    for (Eigen::Index i = 0; i < n; ++i) {
        if (mask[i] == Region::at_lo) y(i) = at_lo;
        else if (mask[i] == Region::at_hi) y(i) = at_hi;
        else if (mask[i] == Region::nan) y(i) = x(i);
    }
    return y;
}

/// Density on [lo, +inf).
template <typename LogPdf>
double eval_lower_bounded(double x, double lo, double at_lo, const LogPdf& log_pdf) {
    return eval_bounded(x, lo, std::numeric_limits<double>::infinity(), at_lo, 0.0, log_pdf);
}

template <typename LogPdf>
Eigen::ArrayXd eval_lower_bounded(const Eigen::ArrayXd& x, double lo, double at_lo,
                                  const LogPdf& log_pdf) {
    return eval_bounded(x, lo, std::numeric_limits<double>::infinity(), at_lo, 0.0, log_pdf);
}

/// Unbounded support: every finite point is interior.
template <typename Pdf>
Eigen::ArrayXd eval_everywhere(const Eigen::ArrayXd& x, const Pdf& pdf) {
    Eigen::ArrayXd y(x.size());
    for (Eigen::Index i = 0; i < x.size(); ++i) y(i) = pdf(x(i));
    return y;
}

} // namespace segdist::distributions::detail
