#include "segdist/piecewise/segment.hpp"
#include <fmt/core.h>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace segdist::piecewise {

namespace {

void require_interval(double a, double b, const char* who) {
    if (!(a < b)) {
        throw std::invalid_argument(fmt::format("{}: need a < b, got [{}, {}]", who, a, b));
    }
}

void require_density(const DensityFn& f, const char* who) {
    if (!f) {
        throw std::invalid_argument(fmt::format("{}: density function is empty", who));
    }
}

} // anonymous namespace

std::string_view kind_name(SegmentKind kind) {
    switch (kind) {
        case SegmentKind::finite: return "finite";
        case SegmentKind::minus_inf: return "minus_inf";
        case SegmentKind::plus_inf: return "plus_inf";
        case SegmentKind::constant: return "constant";
        case SegmentKind::dirac: return "dirac";
    }
    return "unknown";
}

std::string_view pole_name(PoleSide side) {
    switch (side) {
        case PoleSide::none: return "none";
        case PoleSide::left: return "left";
        case PoleSide::right: return "right";
    }
    return "unknown";
}

Segment Segment::finite(double a, double b, DensityFn f) {
    require_interval(a, b, "Segment::finite");
    if (!std::isfinite(a) || !std::isfinite(b)) {
        throw std::invalid_argument("Segment::finite: both ends must be finite");
    }
    require_density(f, "Segment::finite");
    Segment s;
    s.a = a;
    s.b = b;
    s.kind = SegmentKind::finite;
    s.f = std::move(f);
    return s;
}

Segment Segment::with_pole(double a, double b, DensityFn f, PoleSide side) {
    Segment s = finite(a, b, std::move(f));
    s.pole = side;
    return s;
}

Segment Segment::minus_inf(double b, DensityFn f) {
    if (!std::isfinite(b)) {
        throw std::invalid_argument("Segment::minus_inf: right end must be finite");
    }
    require_density(f, "Segment::minus_inf");
    Segment s;
    s.a = -std::numeric_limits<double>::infinity();
    s.b = b;
    s.kind = SegmentKind::minus_inf;
    s.f = std::move(f);
    return s;
}

Segment Segment::plus_inf(double a, DensityFn f) {
    if (!std::isfinite(a)) {
        throw std::invalid_argument("Segment::plus_inf: left end must be finite");
    }
    require_density(f, "Segment::plus_inf");
    Segment s;
    s.a = a;
    s.b = std::numeric_limits<double>::infinity();
    s.kind = SegmentKind::plus_inf;
    s.f = std::move(f);
    return s;
}

Segment Segment::constant(double a, double b, double density) {
    require_interval(a, b, "Segment::constant");
    if (!std::isfinite(a) || !std::isfinite(b)) {
        throw std::invalid_argument("Segment::constant: both ends must be finite");
    }
    if (!(density >= 0.0) || !std::isfinite(density)) {
        throw std::invalid_argument(fmt::format("Segment::constant: bad density {}", density));
    }
    Segment s;
    s.a = a;
    s.b = b;
    s.kind = SegmentKind::constant;
    s.value = density;
    s.f = [density](double) { return density; };
    return s;
}

Segment Segment::dirac(double x, double probability) {
    if (!std::isfinite(x)) {
        throw std::invalid_argument("Segment::dirac: location must be finite");
    }
    if (!(probability >= 0.0) || !std::isfinite(probability)) {
        throw std::invalid_argument(fmt::format("Segment::dirac: bad probability {}", probability));
    }
    Segment s;
    s.a = x;
    s.b = x;
    s.kind = SegmentKind::dirac;
    s.value = probability;
    return s;
}

double Segment::operator()(double x) const {
    if (kind == SegmentKind::constant) return value;
    if (kind == SegmentKind::dirac) return 0.0;
    return f(x);
}

} // namespace segdist::piecewise
