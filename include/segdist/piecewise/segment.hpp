#pragma once

#include <functional>
#include <string_view>

namespace segdist::piecewise {

/// Pointwise density restricted to one segment.
using DensityFn = std::function<double(double)>;

enum class SegmentKind {
    finite,      ///< [a, b) with both ends finite
    minus_inf,   ///< (-inf, b)
    plus_inf,    ///< [a, +inf)
    constant,    ///< [a, b) with constant density
    dirac        ///< point mass at a == b
};

/// Side of a segment on which the density is (or is treated as) singular.
enum class PoleSide { none, left, right };

[[nodiscard]] std::string_view kind_name(SegmentKind kind);
[[nodiscard]] std::string_view pole_name(PoleSide side);

/// One piece of a piecewise density.
/// Use the named factories; they validate the interval.
struct Segment {
    double a = 0.0;
    double b = 0.0;
    SegmentKind kind = SegmentKind::finite;
    PoleSide pole = PoleSide::none;
    DensityFn f;
    double value = 0.0;  ///< Constant density, or probability for a dirac

    [[nodiscard]] static Segment finite(double a, double b, DensityFn f);
    [[nodiscard]] static Segment with_pole(double a, double b, DensityFn f, PoleSide side);
    [[nodiscard]] static Segment minus_inf(double b, DensityFn f);
    [[nodiscard]] static Segment plus_inf(double a, DensityFn f);
    [[nodiscard]] static Segment constant(double a, double b, double density);
    [[nodiscard]] static Segment dirac(double x, double probability);

    [[nodiscard]] bool is_dirac() const { return kind == SegmentKind::dirac; }
    [[nodiscard]] bool has_left_pole() const { return pole == PoleSide::left; }
    [[nodiscard]] bool has_right_pole() const { return pole == PoleSide::right; }

    /// Density inside the segment. Not meaningful for dirac segments.
    [[nodiscard]] double operator()(double x) const;
};

} // namespace segdist::piecewise
