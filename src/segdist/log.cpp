#include "segdist/log.hpp"
#include <spdlog/sinks/stdout_sinks.h>
#include <fmt/core.h>
#include <stdexcept>

namespace segdist::log {

std::shared_ptr<spdlog::logger> logger() {
    static const std::shared_ptr<spdlog::logger> instance = [] {
        auto l = std::make_shared<spdlog::logger>(
            "segdist", std::make_shared<spdlog::sinks::stderr_sink_mt>());
        l->set_level(spdlog::level::warn);
        l->set_pattern("[%n] [%l] %v");
        return l;
    }();
    return instance;
}

spdlog::level::level_enum level() { return logger()->level(); }

void set_level(spdlog::level::level_enum lvl) { logger()->set_level(lvl); }

spdlog::level::level_enum level_from_string(const std::string& name) {
    // from_str maps unknown names to off.
    const auto lvl = spdlog::level::from_str(name);
    if (lvl == spdlog::level::off && name != "off") {
        throw std::invalid_argument(fmt::format("log level: unknown name '{}'", name));
    }
    return lvl;
}

std::string level_name(spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return std::string(sv.data(), sv.size());
}

} // namespace segdist::log
