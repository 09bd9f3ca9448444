#pragma once

#include "segdist/log.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace segdist {

/// Threshold used by pole detection for shapes whose edge exponent is close
/// to, but not exactly at, a singular value.
struct PoleDetectionOptions {
    double max_pole_exponent = 1e-2;  ///< |exponent| above this (with exponent < 1) is flagged as a pole
};

/// Quadrature settings used by the piecewise container.
struct IntegrationOptions {
    double tolerance = 1e-10;         ///< Relative tolerance per segment
    unsigned max_refinements = 15;    ///< Gauss-Kronrod depth / double-exponential levels
};

/// Root-finding settings used by inverse-CDF evaluation.
struct InverseCdfOptions {
    int tolerance_bits = 50;          ///< Bits of agreement required by toms748
    std::uintmax_t max_iterations = 200;
};

/// Library-wide numerical settings.
struct Params {
    PoleDetectionOptions pole_detection;
    IntegrationOptions integration;
    InverseCdfOptions inverse_cdf;
    spdlog::level::level_enum log_level = spdlog::level::warn;
};

/// Process-wide defaults. Distributions copy what they need at construction.
[[nodiscard]] Params params();

/// Replace the process-wide defaults (also applies log_level).
void set_params(const Params& p);

/// Build Params from a JSON object, starting from the built-in defaults.
/// Unknown keys are ignored; a key with the wrong type throws std::invalid_argument.
[[nodiscard]] Params params_from_json(const nlohmann::json& j);

[[nodiscard]] nlohmann::json params_to_json(const Params& p);

/// Read a JSON file and install it with set_params().
/// Throws std::runtime_error if the file cannot be opened or parsed.
Params load_params(const std::string& path);

} // namespace segdist
