#pragma once

#include "segdist/config.hpp"
#include "segdist/piecewise/segment.hpp"
#include "segdist/random.hpp"
#include <Eigen/Dense>
#include <cstddef>
#include <vector>

namespace segdist::piecewise {

/// Ordered, non-overlapping collection of segments describing one density.
///
/// Continuous segments must be contiguous (segment[i].b == segment[i+1].a);
/// point masses may sit anywhere. The container integrates each segment once
/// at construction: double-exponential quadrature on segments with a pole,
/// adaptive Gauss-Kronrod on ordinary finite segments and exp-sinh on tails.
/// Instances are immutable after construction.
class PiecewiseDistribution {
public:
    PiecewiseDistribution() = default;

    /// Build from an explicit list of segments (any order).
    /// Throws std::invalid_argument on gaps or overlaps.
    explicit PiecewiseDistribution(std::vector<Segment> segments);

    /// Build from a density, its break points and per-piece pole flags.
    /// `left_poles` / `right_poles` are empty or hold one flag per piece; a
    /// trailing extra entry (one per break point) is accepted and ignored.
    /// Infinite first/last break points produce tail segments.
    [[nodiscard]] static PiecewiseDistribution from_breakpoints(
        DensityFn f,
        const std::vector<double>& breaks,
        const std::vector<bool>& left_poles = {},
        const std::vector<bool>& right_poles = {});

    // ---- Structure ----

    [[nodiscard]] const std::vector<Segment>& segments() const { return segments_; }
    [[nodiscard]] const std::vector<Segment>& point_masses() const { return point_masses_; }
    [[nodiscard]] const std::vector<double>& segment_masses() const { return segment_masses_; }
    [[nodiscard]] std::size_t size() const { return segments_.size() + point_masses_.size(); }
    [[nodiscard]] bool empty() const { return size() == 0; }

    /// Boundaries of the continuous part (including +-inf for tails), or the
    /// point-mass locations when there is no continuous part.
    [[nodiscard]] std::vector<double> breaks() const;

    [[nodiscard]] double support_lower() const;
    [[nodiscard]] double support_upper() const;

    // ---- Evaluation ----

    /// Density of the continuous part. Zero outside every segment.
    [[nodiscard]] double density(double x) const;
    [[nodiscard]] Eigen::ArrayXd density(const Eigen::ArrayXd& x) const;

    /// Probability carried by a point mass at exactly x (0 if none).
    [[nodiscard]] double point_mass(double x) const;

    /// Total mass (continuous integral plus point masses).
    [[nodiscard]] double integrate() const;

    /// Mass on [a, b], point masses at both ends included.
    [[nodiscard]] double integrate(double a, double b) const;

    /// Unnormalized cumulative mass up to and including x.
    [[nodiscard]] double cdf(double x) const;

    /// Quantile of the normalized distribution. Throws std::domain_error
    /// for p outside [0, 1] and std::logic_error on an empty container.
    [[nodiscard]] double inverse_cdf(double p) const;

    /// Inverse-CDF sampling, used when no closed-form generator exists.
    [[nodiscard]] Eigen::VectorXd sample_inverse_cdf(Eigen::Index n, Rng& rng) const;

    // ---- Combination ----

    /// Every density and point mass multiplied by w (w >= 0).
    [[nodiscard]] PiecewiseDistribution scaled(double w) const;

    /// Pointwise sum. Break points are merged; pole flags are kept on the
    /// sides that touch a pole; point masses at equal locations add.
    friend PiecewiseDistribution operator+(const PiecewiseDistribution& lhs,
                                           const PiecewiseDistribution& rhs);

private:
    /// Mass of segment idx on [lo, hi] (clipped to the segment).
    [[nodiscard]] double partial_mass(std::size_t idx, double lo, double hi) const;
    [[nodiscard]] double quadrature(const Segment& s, double lo, double hi) const;
    [[nodiscard]] double solve_in_segment(std::size_t idx, double target) const;

    std::vector<Segment> segments_;
    std::vector<Segment> point_masses_;
    std::vector<double> segment_masses_;
    IntegrationOptions integration_;
    InverseCdfOptions inverse_cdf_;
};

} // namespace segdist::piecewise
