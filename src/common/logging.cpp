#include <chartdl/common/logging.h>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdlib>
#include <string>

namespace chartdl::logging {

std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view name) {
    std::string v;
    v.reserve(name.size());
    for (unsigned char c : name)
        v.push_back(static_cast<char>(std::tolower(c)));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none")
        return spdlog::level::off;
    return std::nullopt;
}

void initLogging(std::string_view level) {
    if (!spdlog::get("chartdl")) {
        auto logger = spdlog::stderr_color_mt("chartdl");
        spdlog::set_default_logger(logger);
    }
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    auto lvl = parseLogLevel(level);
    if (const char* env = std::getenv("CHARTDL_LOG_LEVEL"); env && *env) {
        if (auto fromEnv = parseLogLevel(env))
            lvl = fromEnv;
    }
    if (!lvl) {
        spdlog::warn("Unknown log level '{}', using info", level);
        lvl = spdlog::level::info;
    }
    spdlog::set_level(*lvl);
}

} // namespace chartdl::logging
