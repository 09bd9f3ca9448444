#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace segdist::log {

/// Library logger named "segdist", writing to stderr. Starts at warn.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

[[nodiscard]] spdlog::level::level_enum level();
void set_level(spdlog::level::level_enum lvl);

/// Parse a level name accepted by spdlog ("trace" .. "critical", "off").
/// Throws std::invalid_argument on anything else.
[[nodiscard]] spdlog::level::level_enum level_from_string(const std::string& name);

[[nodiscard]] std::string level_name(spdlog::level::level_enum lvl);

} // namespace segdist::log
