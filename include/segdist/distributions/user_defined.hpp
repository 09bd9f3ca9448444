#pragma once

#include "segdist/piecewise/piecewise_distribution.hpp"
#include "segdist/piecewise/segment.hpp"
#include <Eigen/Dense>
#include <memory>
#include <string>
#include <vector>

namespace segdist::distributions {

/// Law given by a caller-supplied density and its break points.
/// The density must already be normalized; it is not checked.
class FunctionDistr {
public:
    FunctionDistr(piecewise::DensityFn f, std::vector<double> breaks,
                  std::vector<bool> left_poles = {}, std::vector<bool> right_poles = {});

    [[nodiscard]] const std::vector<double>& breaks() const { return breaks_; }
    [[nodiscard]] const std::vector<bool>& left_poles() const { return left_poles_; }
    [[nodiscard]] const std::vector<bool>& right_poles() const { return right_poles_; }

    [[nodiscard]] double pdf(double x) const;
    [[nodiscard]] Eigen::ArrayXd pdf(const Eigen::ArrayXd& x) const;
    [[nodiscard]] piecewise::PiecewiseDistribution build_piecewise() const;
    [[nodiscard]] std::string name() const;

private:
    piecewise::DensityFn f_;
    std::vector<double> breaks_;
    std::vector<bool> left_poles_;
    std::vector<bool> right_poles_;
};

/// Law given directly by its segments.
class SegmentDistr {
public:
    explicit SegmentDistr(std::vector<piecewise::Segment> segments);
    explicit SegmentDistr(piecewise::PiecewiseDistribution pw);

    /// Continuous density plus the point mass at x.
    [[nodiscard]] double pdf(double x) const;
    [[nodiscard]] Eigen::ArrayXd pdf(const Eigen::ArrayXd& x) const;
    [[nodiscard]] piecewise::PiecewiseDistribution build_piecewise() const;
    [[nodiscard]] std::string name() const;

private:
    std::shared_ptr<const piecewise::PiecewiseDistribution> pw_;
};

} // namespace segdist::distributions
