#include "segdist/config.hpp"
#include <fstream>
#include <mutex>
#include <stdexcept>

namespace segdist {

namespace {

std::mutex g_params_mutex;
Params g_params;

template <typename T>
void read_number(const nlohmann::json& obj, const char* key, T& out) {
    if (!obj.contains(key)) return;
    const auto& v = obj.at(key);
    if (!v.is_number()) {
        throw std::invalid_argument(std::string("params: '") + key + "' must be a number");
    }
    out = v.get<T>();
}

const nlohmann::json* section(const nlohmann::json& j, const char* key) {
    if (!j.contains(key)) return nullptr;
    const auto& s = j.at(key);
    if (!s.is_object()) {
        throw std::invalid_argument(std::string("params: '") + key + "' must be an object");
    }
    return &s;
}

} // anonymous namespace

Params params() {
    std::lock_guard<std::mutex> lock(g_params_mutex);
    return g_params;
}

void set_params(const Params& p) {
    {
        std::lock_guard<std::mutex> lock(g_params_mutex);
        g_params = p;
    }
    log::set_level(p.log_level);
}

Params params_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("params: top-level JSON value must be an object");
    }
    Params p;
    if (const auto* s = section(j, "pole_detection")) {
        read_number(*s, "max_pole_exponent", p.pole_detection.max_pole_exponent);
    }
    if (const auto* s = section(j, "integration")) {
        read_number(*s, "tolerance", p.integration.tolerance);
        read_number(*s, "max_refinements", p.integration.max_refinements);
    }
    if (const auto* s = section(j, "inverse_cdf")) {
        read_number(*s, "tolerance_bits", p.inverse_cdf.tolerance_bits);
        read_number(*s, "max_iterations", p.inverse_cdf.max_iterations);
    }
    if (j.contains("log_level")) {
        const auto& v = j.at("log_level");
        if (!v.is_string()) {
            throw std::invalid_argument("params: 'log_level' must be a string");
        }
        p.log_level = log::level_from_string(v.get<std::string>());
    }

    if (!(p.integration.tolerance > 0.0)) {
        throw std::invalid_argument("params: integration.tolerance must be positive");
    }
    if (p.inverse_cdf.tolerance_bits <= 0) {
        throw std::invalid_argument("params: inverse_cdf.tolerance_bits must be positive");
    }
    return p;
}

nlohmann::json params_to_json(const Params& p) {
    nlohmann::json j;
    j["pole_detection"]["max_pole_exponent"] = p.pole_detection.max_pole_exponent;
    j["integration"]["tolerance"] = p.integration.tolerance;
    j["integration"]["max_refinements"] = p.integration.max_refinements;
    j["inverse_cdf"]["tolerance_bits"] = p.inverse_cdf.tolerance_bits;
    j["inverse_cdf"]["max_iterations"] = p.inverse_cdf.max_iterations;
    j["log_level"] = log::level_name(p.log_level);
    return j;
}

Params load_params(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("load_params: cannot open " + path);
    }
    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("load_params: " + path + ": " + e.what());
    }
    set_params(params_from_json(j));
    return params();
}

} // namespace segdist
