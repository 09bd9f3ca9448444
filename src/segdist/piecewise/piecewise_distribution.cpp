#include "segdist/piecewise/piecewise_distribution.hpp"
#include "segdist/log.hpp"
#include <boost/math/quadrature/exp_sinh.hpp>
#include <boost/math/quadrature/gauss_kronrod.hpp>
#include <boost/math/quadrature/tanh_sinh.hpp>
#include <boost/math/tools/toms748_solve.hpp>
#include <fmt/core.h>
#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <utility>

namespace segdist::piecewise {

namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();
constexpr double kNarrowRange = 1e-8;

/// True when hi is within four representable doubles of lo.
bool spans_few_ulps(double lo, double hi) {
    double edge = lo;
    for (int k = 0; k < 4; ++k) edge = std::nextafter(edge, hi);
    return hi <= edge;
}

/// Segment of `segs` that covers the elementary interval [u, v), or nullptr.
const Segment* covering(const std::vector<Segment>& segs, double u, double v) {
    for (const auto& s : segs) {
        if (s.a <= u && v <= s.b) return &s;
    }
    return nullptr;
}

void append_sum_piece(std::vector<Segment>& out, double u, double v,
                      const Segment* lhs, const Segment* rhs) {
    if (lhs == nullptr && rhs == nullptr) {
        out.push_back(Segment::constant(u, v, 0.0));
        return;
    }

    const bool lhs_const = lhs == nullptr || lhs->kind == SegmentKind::constant;
    const bool rhs_const = rhs == nullptr || rhs->kind == SegmentKind::constant;
    if (lhs_const && rhs_const && std::isfinite(u) && std::isfinite(v)) {
        const double c = (lhs ? lhs->value : 0.0) + (rhs ? rhs->value : 0.0);
        out.push_back(Segment::constant(u, v, c));
        return;
    }

    DensityFn f;
    if (lhs != nullptr && rhs != nullptr) {
        f = [l = *lhs, r = *rhs](double x) { return l(x) + r(x); };
    } else {
        f = [s = lhs ? *lhs : *rhs](double x) { return s(x); };
    }

    const auto left_pole_at = [u](const Segment* s) {
        return s != nullptr && s->has_left_pole() && s->a == u;
    };
    const auto right_pole_at = [v](const Segment* s) {
        return s != nullptr && s->has_right_pole() && s->b == v;
    };
    const bool left = left_pole_at(lhs) || left_pole_at(rhs);
    const bool right = right_pole_at(lhs) || right_pole_at(rhs);

    if (std::isinf(u)) {
        out.push_back(Segment::minus_inf(v, std::move(f)));
    } else if (std::isinf(v)) {
        out.push_back(Segment::plus_inf(u, std::move(f)));
    } else if (left && right) {
        // A segment carries at most one pole: split so each side gets its own.
        const double m = 0.5 * (u + v);
        out.push_back(Segment::with_pole(u, m, f, PoleSide::left));
        out.push_back(Segment::with_pole(m, v, std::move(f), PoleSide::right));
    } else if (left) {
        out.push_back(Segment::with_pole(u, v, std::move(f), PoleSide::left));
    } else if (right) {
        out.push_back(Segment::with_pole(u, v, std::move(f), PoleSide::right));
    } else {
        out.push_back(Segment::finite(u, v, std::move(f)));
    }
}

} // anonymous namespace

PiecewiseDistribution::PiecewiseDistribution(std::vector<Segment> segments) {
    const Params p = params();
    integration_ = p.integration;
    inverse_cdf_ = p.inverse_cdf;

    for (auto& s : segments) {
        if (s.is_dirac()) {
            point_masses_.push_back(std::move(s));
        } else {
            if (!(s.a < s.b)) {
                throw std::invalid_argument(fmt::format(
                    "PiecewiseDistribution: empty segment [{}, {})", s.a, s.b));
            }
            if (s.kind != SegmentKind::constant && !s.f) {
                throw std::invalid_argument("PiecewiseDistribution: segment without density");
            }
            segments_.push_back(std::move(s));
        }
    }

    std::sort(segments_.begin(), segments_.end(),
              [](const Segment& l, const Segment& r) { return l.a < r.a; });
    for (std::size_t i = 1; i < segments_.size(); ++i) {
        const auto& prev = segments_[i - 1];
        const auto& next = segments_[i];
        if (prev.b != next.a) {
            throw std::invalid_argument(fmt::format(
                "PiecewiseDistribution: segments [{}, {}) and [{}, {}) leave a gap or overlap",
                prev.a, prev.b, next.a, next.b));
        }
    }

    std::sort(point_masses_.begin(), point_masses_.end(),
              [](const Segment& l, const Segment& r) { return l.a < r.a; });
    std::vector<Segment> merged;
    for (auto& pm : point_masses_) {
        if (!merged.empty() && merged.back().a == pm.a) {
            merged.back().value += pm.value;
        } else {
            merged.push_back(std::move(pm));
        }
    }
    point_masses_ = std::move(merged);

    segment_masses_.reserve(segments_.size());
    for (const auto& s : segments_) {
        segment_masses_.push_back(quadrature(s, s.a, s.b));
    }

    log::logger()->debug("PiecewiseDistribution: {} segments, {} point masses, total mass {}",
               segments_.size(), point_masses_.size(), integrate());
}

PiecewiseDistribution PiecewiseDistribution::from_breakpoints(
    DensityFn f,
    const std::vector<double>& breaks,
    const std::vector<bool>& left_poles,
    const std::vector<bool>& right_poles) {

    if (!f) {
        throw std::invalid_argument("from_breakpoints: density function is empty");
    }
    if (breaks.size() < 2) {
        throw std::invalid_argument("from_breakpoints: need at least two break points");
    }
    for (std::size_t i = 1; i < breaks.size(); ++i) {
        if (!(breaks[i - 1] < breaks[i])) {
            throw std::invalid_argument(fmt::format(
                "from_breakpoints: break points must be strictly increasing ({} then {})",
                breaks[i - 1], breaks[i]));
        }
    }

    const std::size_t pieces = breaks.size() - 1;
    const auto check_flags = [pieces](const std::vector<bool>& flags, const char* name) {
        if (!flags.empty() && flags.size() != pieces && flags.size() != pieces + 1) {
            throw std::invalid_argument(fmt::format(
                "from_breakpoints: {} has {} entries for {} pieces", name, flags.size(), pieces));
        }
    };
    check_flags(left_poles, "left_poles");
    check_flags(right_poles, "right_poles");

    std::vector<Segment> segs;
    segs.reserve(pieces);
    for (std::size_t i = 0; i < pieces; ++i) {
        const double a = breaks[i];
        const double b = breaks[i + 1];
        const bool lp = !left_poles.empty() && left_poles[i];
        const bool rp = !right_poles.empty() && right_poles[i];

        if (std::isinf(a) || std::isinf(b)) {
            if (lp && std::isfinite(a)) {
                throw std::invalid_argument("from_breakpoints: a tail segment cannot carry a pole");
            }
            if (rp && std::isfinite(b)) {
                throw std::invalid_argument("from_breakpoints: a tail segment cannot carry a pole");
            }
            if (std::isinf(a) && std::isinf(b)) {
                throw std::invalid_argument("from_breakpoints: add a finite break point between the tails");
            }
            segs.push_back(std::isinf(a) ? Segment::minus_inf(b, f) : Segment::plus_inf(a, f));
        } else if (lp && rp) {
            throw std::invalid_argument(fmt::format(
                "from_breakpoints: piece [{}, {}] has poles on both sides; add a break point", a, b));
        } else if (lp) {
            segs.push_back(Segment::with_pole(a, b, f, PoleSide::left));
        } else if (rp) {
            segs.push_back(Segment::with_pole(a, b, f, PoleSide::right));
        } else {
            segs.push_back(Segment::finite(a, b, f));
        }
    }
    return PiecewiseDistribution(std::move(segs));
}

std::vector<double> PiecewiseDistribution::breaks() const {
    std::vector<double> out;
    if (!segments_.empty()) {
        out.reserve(segments_.size() + 1);
        out.push_back(segments_.front().a);
        for (const auto& s : segments_) out.push_back(s.b);
    } else {
        for (const auto& pm : point_masses_) out.push_back(pm.a);
    }
    return out;
}

double PiecewiseDistribution::support_lower() const {
    if (empty()) throw std::logic_error("PiecewiseDistribution: empty");
    double lo = kInf;
    if (!segments_.empty()) lo = segments_.front().a;
    if (!point_masses_.empty()) lo = std::min(lo, point_masses_.front().a);
    return lo;
}

double PiecewiseDistribution::support_upper() const {
    if (empty()) throw std::logic_error("PiecewiseDistribution: empty");
    double hi = -kInf;
    if (!segments_.empty()) hi = segments_.back().b;
    if (!point_masses_.empty()) hi = std::max(hi, point_masses_.back().a);
    return hi;
}

double PiecewiseDistribution::density(double x) const {
    if (std::isnan(x)) return std::numeric_limits<double>::quiet_NaN();
    auto it = std::upper_bound(segments_.begin(), segments_.end(), x,
                               [](double v, const Segment& s) { return v < s.a; });
    if (it == segments_.begin()) return 0.0;
    const auto owner = std::prev(it);
    if (x < owner->b) return (*owner)(x);
    // The last finite segment is closed on the right.
    if (std::next(owner) == segments_.end() && x == owner->b) return (*owner)(x);
    return 0.0;
}

Eigen::ArrayXd PiecewiseDistribution::density(const Eigen::ArrayXd& x) const {
    Eigen::ArrayXd y(x.size());
    for (Eigen::Index i = 0; i < x.size(); ++i) {
        y(i) = density(x(i));
    }
    return y;
}

double PiecewiseDistribution::point_mass(double x) const {
    auto it = std::lower_bound(point_masses_.begin(), point_masses_.end(), x,
                               [](const Segment& s, double v) { return s.a < v; });
    if (it != point_masses_.end() && it->a == x) return it->value;
    return 0.0;
}

double PiecewiseDistribution::integrate() const {
    double total = 0.0;
    for (double m : segment_masses_) total += m;
    for (const auto& pm : point_masses_) total += pm.value;
    return total;
}

double PiecewiseDistribution::integrate(double a, double b) const {
    if (!(a <= b)) return 0.0;
    double total = 0.0;
    for (std::size_t i = 0; i < segments_.size(); ++i) {
        total += partial_mass(i, a, b);
    }
    for (const auto& pm : point_masses_) {
        if (a <= pm.a && pm.a <= b) total += pm.value;
    }
    return total;
}

double PiecewiseDistribution::cdf(double x) const {
    if (std::isnan(x)) return std::numeric_limits<double>::quiet_NaN();
    double total = 0.0;
    for (std::size_t i = 0; i < segments_.size(); ++i) {
        const auto& s = segments_[i];
        if (s.b <= x) {
            total += segment_masses_[i];
        } else {
            if (s.a < x) total += partial_mass(i, s.a, x);
            break;
        }
    }
    for (const auto& pm : point_masses_) {
        if (pm.a > x) break;
        total += pm.value;
    }
    return total;
}

double PiecewiseDistribution::inverse_cdf(double p) const {
    if (!(p >= 0.0 && p <= 1.0)) {
        throw std::domain_error(fmt::format("inverse_cdf: p must be in [0, 1], got {}", p));
    }
    if (empty()) throw std::logic_error("inverse_cdf: empty distribution");
    const double total = integrate();
    if (!(total > 0.0)) throw std::logic_error("inverse_cdf: distribution has no mass");

    if (p == 0.0) return support_lower();
    if (p == 1.0) return support_upper();
    double target = p * total;

    for (const auto& pm : point_masses_) {
        const double at = cdf(pm.a);
        if (target > at - pm.value && target <= at) return pm.a;
    }

    std::size_t last_positive = segments_.size();
    for (std::size_t i = 0; i < segments_.size(); ++i) {
        if (!(segment_masses_[i] > 0.0)) continue;
        last_positive = i;
        const auto& s = segments_[i];
        if (target > cdf(s.a) && target <= cdf(s.b)) return solve_in_segment(i, target);
    }

    // Rounding can leave the target a hair above the reachable mass.
    if (last_positive == segments_.size()) return support_upper();
    target = std::min(target, cdf(segments_[last_positive].b));
    return solve_in_segment(last_positive, target);
}

double PiecewiseDistribution::solve_in_segment(std::size_t idx, double target) const {
    const Segment& s = segments_[idx];
    const auto g = [this, target](double x) { return cdf(x) - target; };

    double lo = s.a;
    double hi = s.b;
    if (std::isinf(lo)) {
        double step = std::max(1.0, std::abs(hi));
        lo = hi - step;
        for (int guard = 0; guard < 1024 && g(lo) >= 0.0 && std::isfinite(lo); ++guard) {
            step *= 2.0;
            lo = hi - step;
        }
        if (!std::isfinite(lo)) return lo;
    }
    if (std::isinf(hi)) {
        double step = std::max(1.0, std::abs(lo));
        hi = lo + step;
        for (int guard = 0; guard < 1024 && g(hi) < 0.0 && std::isfinite(hi); ++guard) {
            step *= 2.0;
            hi = lo + step;
        }
        if (!std::isfinite(hi)) return hi;
    }

    const double glo = g(lo);
    const double ghi = g(hi);
    if (glo >= 0.0) return lo;
    if (ghi <= 0.0) return hi;

    boost::math::tools::eps_tolerance<double> tol(inverse_cdf_.tolerance_bits);
    std::uintmax_t iterations = inverse_cdf_.max_iterations;
    const auto root = boost::math::tools::toms748_solve(g, lo, hi, glo, ghi, tol, iterations);
    if (iterations >= inverse_cdf_.max_iterations) {
        log::logger()->warn("inverse_cdf: no convergence in [{}, {}] after {} iterations",
                  lo, hi, iterations);
    }
    return 0.5 * (root.first + root.second);
}

Eigen::VectorXd PiecewiseDistribution::sample_inverse_cdf(Eigen::Index n, Rng& rng) const {
    const Eigen::VectorXd u = Eigen::Rand::uniformReal<Eigen::VectorXd>(n, 1, rng);
    Eigen::VectorXd out(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        // uniformReal draws from [0, 1); p == 0 would return an infinite lower bound.
        out(i) = inverse_cdf(std::max(u(i), std::numeric_limits<double>::min()));
    }
    return out;
}

double PiecewiseDistribution::partial_mass(std::size_t idx, double lo, double hi) const {
    const Segment& s = segments_[idx];
    lo = std::max(lo, s.a);
    hi = std::min(hi, s.b);
    if (!(lo < hi)) return 0.0;
    if (lo == s.a && hi == s.b) return segment_masses_[idx];
    if (spans_few_ulps(lo, hi)) return 0.0;

    // A range that ends on the pole is the segment mass minus the regular remainder.
    if (s.has_left_pole() && lo == s.a) {
        return std::max(0.0, segment_masses_[idx] - quadrature(s, hi, s.b));
    }
    if (s.has_right_pole() && hi == s.b) {
        return std::max(0.0, segment_masses_[idx] - quadrature(s, s.a, lo));
    }
    return quadrature(s, lo, hi);
}

double PiecewiseDistribution::quadrature(const Segment& s, double lo, double hi) const {
    if (s.kind == SegmentKind::dirac) return 0.0;
    if (s.kind == SegmentKind::constant) return s.value * (hi - lo);

    double error = 0.0;
    double q = 0.0;
    if (std::isinf(lo) || std::isinf(hi)) {
        const auto f = [&s](double x) { return s(x); };
        boost::math::quadrature::exp_sinh<double> integrator(integration_.max_refinements);
        q = integrator.integrate(f, lo, hi, integration_.tolerance, &error);
    } else if (s.pole != PoleSide::none) {
        // Two-argument form: abscissae never land on an end by construction.
        // One that still rounds onto the pole is moved one ulp inside.
        const auto f = [&s](double x, double /*xc*/) {
            if (s.has_left_pole() && x <= s.a) x = std::nextafter(s.a, s.b);
            if (s.has_right_pole() && x >= s.b) x = std::nextafter(s.b, s.a);
            return s(x);
        };
        boost::math::quadrature::tanh_sinh<double> integrator(integration_.max_refinements);
        q = integrator.integrate(f, lo, hi, integration_.tolerance, &error);
    } else {
        const auto f = [&s](double x) { return s(x); };
        q = boost::math::quadrature::gauss_kronrod<double, 61>::integrate(
            f, lo, hi, integration_.max_refinements, integration_.tolerance, &error);
    }

    if (error > 1e3 * integration_.tolerance * std::max(1.0, std::abs(q))) {
        const double scale = std::max({1.0, std::abs(lo), std::abs(hi)});
        // Estimates on ranges this narrow are not meaningful.
        const auto lvl = (hi - lo) < kNarrowRange * scale ? spdlog::level::debug : spdlog::level::warn;
        log::logger()->log(lvl, "integrate: {} segment [{}, {}] error estimate {} for value {}",
                           kind_name(s.kind), lo, hi, error, q);
    }
    return q;
}

PiecewiseDistribution PiecewiseDistribution::scaled(double w) const {
    if (!(w >= 0.0) || !std::isfinite(w)) {
        throw std::invalid_argument(fmt::format("PiecewiseDistribution::scaled: bad weight {}", w));
    }
    std::vector<Segment> out;
    out.reserve(size());
    for (const auto& s : segments_) {
        if (s.kind == SegmentKind::constant) {
            out.push_back(Segment::constant(s.a, s.b, w * s.value));
        } else {
            Segment t = s;
            t.f = [f = s.f, w](double x) { return w * f(x); };
            out.push_back(std::move(t));
        }
    }
    for (const auto& pm : point_masses_) {
        out.push_back(Segment::dirac(pm.a, w * pm.value));
    }
    return PiecewiseDistribution(std::move(out));
}

PiecewiseDistribution operator+(const PiecewiseDistribution& lhs, const PiecewiseDistribution& rhs) {
    std::vector<Segment> out;

    if (!lhs.segments_.empty() || !rhs.segments_.empty()) {
        std::vector<double> pts;
        for (const auto* segs : {&lhs.segments_, &rhs.segments_}) {
            for (const auto& s : *segs) {
                pts.push_back(s.a);
                pts.push_back(s.b);
            }
        }
        std::sort(pts.begin(), pts.end());
        pts.erase(std::unique(pts.begin(), pts.end()), pts.end());

        for (std::size_t i = 0; i + 1 < pts.size(); ++i) {
            const double u = pts[i];
            const double v = pts[i + 1];
            append_sum_piece(out, u, v, covering(lhs.segments_, u, v), covering(rhs.segments_, u, v));
        }
    }

    for (const auto* masses : {&lhs.point_masses_, &rhs.point_masses_}) {
        for (const auto& pm : *masses) out.push_back(pm);
    }
    return PiecewiseDistribution(std::move(out));
}

} // namespace segdist::piecewise
