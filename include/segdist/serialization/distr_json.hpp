#pragma once

#include <nlohmann/json.hpp>
#include <Eigen/Dense>

#include "segdist/distributions/distribution.hpp"
#include "segdist/piecewise/piecewise_distribution.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace segdist::serialization {

using json = nlohmann::json;

// ============================================================
// Eigen helpers
// ============================================================

inline json vector_to_json(const Eigen::VectorXd& v) {
    json arr = json::array();
    for (Eigen::Index i = 0; i < v.size(); ++i) {
        arr.push_back(v(i));
    }
    return arr;
}

// ============================================================
// Parametric families
// ============================================================

inline json to_json(const distributions::Normal& d) {
    return {{"family", "normal"}, {"mu", d.mu()}, {"sigma", d.sigma()}};
}

inline json to_json(const distributions::Uniform& d) {
    return {{"family", "uniform"}, {"a", d.a()}, {"b", d.b()}};
}

inline json to_json(const distributions::Cauchy& d) {
    return {{"family", "cauchy"}, {"gamma", d.gamma()}, {"center", d.center()}};
}

inline json to_json(const distributions::ChiSquare& d) {
    return {{"family", "chi_square"}, {"df", d.df()}};
}

inline json to_json(const distributions::Exponential& d) {
    return {{"family", "exponential"}, {"lambda", d.lambda()}};
}

inline json to_json(const distributions::Gamma& d) {
    return {{"family", "gamma"}, {"k", d.k()}, {"theta", d.theta()}};
}

inline json to_json(const distributions::Beta& d) {
    return {{"family", "beta"}, {"alpha", d.alpha()}, {"beta", d.beta()},
            {"max_pole_exponent", d.max_pole_exponent()}};
}

inline json to_json(const distributions::Pareto& d) {
    return {{"family", "pareto"}, {"alpha", d.alpha()}, {"xmin", d.xmin()}};
}

inline json to_json(const distributions::Levy& d) {
    return {{"family", "levy"}, {"c", d.c()}, {"xmin", d.xmin()}};
}

inline json to_json(const distributions::Laplace& d) {
    return {{"family", "laplace"}, {"lambda", d.lambda()}, {"mu", d.mu()}};
}

inline json to_json(const distributions::StudentT& d) {
    return {{"family", "student_t"}, {"df", d.df()}};
}

inline json to_json(const distributions::Semicircle& d) {
    return {{"family", "semicircle"}, {"R", d.radius()}};
}

inline json to_json(const distributions::FDistr& d) {
    return {{"family", "f"}, {"df1", d.df1()}, {"df2", d.df2()}};
}

inline json to_json(const distributions::Weibull& d) {
    return {{"family", "weibull"}, {"k", d.k()}, {"lambda", d.lambda()}};
}

inline json to_json(const distributions::Discrete& d) {
    json j;
    j["family"] = "discrete";
    j["xi"] = d.xi();
    j["pi"] = d.pi();
    return j;
}

// ============================================================
// Laws defined by code cannot be written out
// ============================================================

inline json to_json(const distributions::FunctionDistr& d) {
    throw std::invalid_argument("to_json: " + d.name() + " is defined by a function");
}

inline json to_json(const distributions::SegmentDistr& d) {
    throw std::invalid_argument("to_json: " + d.name() + " is defined by segment functions");
}

// ============================================================
// Distribution handle and mixtures
// ============================================================

inline json to_json(const distributions::Mix& m);

inline json to_json(const distributions::Distribution& d) {
    return std::visit([](const auto& f) { return to_json(f); }, d.family());
}

inline json to_json(const distributions::Mix& m) {
    const auto& mix = m.mixture();
    json j;
    j["family"] = "mixture";
    j["weights"] = vector_to_json(mix.weights());
    json comps = json::array();
    for (std::size_t i = 0; i < mix.size(); ++i) {
        comps.push_back(to_json(mix.component(i)));
    }
    j["components"] = std::move(comps);
    return j;
}

inline distributions::Distribution distribution_from_json(const json& j) {
    namespace d = distributions;
    const auto family = j.at("family").get<std::string>();
    const auto num = [&j](const char* key) { return j.at(key).get<double>(); };

    if (family == "normal") return d::Normal(num("mu"), num("sigma"));
    if (family == "uniform") return d::Uniform(num("a"), num("b"));
    if (family == "cauchy") return d::Cauchy(num("gamma"), num("center"));
    if (family == "chi_square") return d::ChiSquare(num("df"));
    if (family == "exponential") return d::Exponential(num("lambda"));
    if (family == "gamma") return d::Gamma(num("k"), num("theta"));
    if (family == "beta") {
        if (j.contains("max_pole_exponent")) {
            return d::Beta(num("alpha"), num("beta"), num("max_pole_exponent"));
        }
        return d::Beta(num("alpha"), num("beta"));
    }
    if (family == "pareto") return d::Pareto(num("alpha"), num("xmin"));
    if (family == "levy") return d::Levy(num("c"), num("xmin"));
    if (family == "laplace") return d::Laplace(num("lambda"), num("mu"));
    if (family == "student_t") return d::StudentT(num("df"));
    if (family == "semicircle") return d::Semicircle(num("R"));
    if (family == "f") return d::FDistr(num("df1"), num("df2"));
    if (family == "weibull") return d::Weibull(num("k"), num("lambda"));
    if (family == "discrete") {
        auto xi = j.at("xi").get<std::vector<double>>();
        auto pi = j.at("pi").get<std::vector<double>>();
        if (xi.size() == 1 && pi.size() == 1) return d::constant(xi[0], pi[0]);
        return d::Discrete(std::move(xi), std::move(pi));
    }
    if (family == "mixture") {
        auto weights = j.at("weights").get<std::vector<double>>();
        std::vector<d::Distribution> comps;
        for (const auto& c : j.at("components")) {
            comps.push_back(distribution_from_json(c));
        }
        return d::Mix(std::move(weights), std::move(comps));
    }
    throw std::invalid_argument("distribution_from_json: unknown family '" + family + "'");
}

// ============================================================
// Piecewise form (one-way, for diagnostics)
// ============================================================

/// One entry per piece: lo, hi, kind, pole and the probability it carries.
/// Infinite ends are stored as doubles and dump as null.
inline json piecewise_to_json(const piecewise::PiecewiseDistribution& pw) {
    json pieces = json::array();
    const auto& segs = pw.segments();
    const auto& masses = pw.segment_masses();
    for (std::size_t i = 0; i < segs.size(); ++i) {
        json piece = {{"lo", segs[i].a},
                      {"hi", segs[i].b},
                      {"kind", std::string(piecewise::kind_name(segs[i].kind))},
                      {"pole", std::string(piecewise::pole_name(segs[i].pole))},
                      {"mass", masses[i]}};
        pieces.push_back(std::move(piece));
    }
    for (const auto& pm : pw.point_masses()) {
        json piece = {{"lo", pm.a},
                      {"hi", pm.b},
                      {"kind", std::string(piecewise::kind_name(pm.kind))},
                      {"pole", std::string(piecewise::pole_name(pm.pole))},
                      {"mass", pm.value}};
        pieces.push_back(std::move(piece));
    }
    json j;
    j["pieces"] = std::move(pieces);
    j["total_mass"] = pw.integrate();
    return j;
}

} // namespace segdist::serialization
