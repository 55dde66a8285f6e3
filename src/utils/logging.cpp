#include "logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <array>
#include <stdexcept>
#include <string>

#include "string_utils.hpp"

namespace logging {
    namespace {
        constexpr std::array<const char*, 4> MODULES = {SERVER, DISPATCH, UPSTREAM, CONFIG};
        constexpr const char* PATTERN = "%Y-%m-%d %H:%M:%S.%e [%^%l%$] [%n] %v";
    }  // namespace

    spdlog::level::level_enum parse_level(std::string_view name) {
        const std::string lowered = string_utils::to_lower(string_utils::trim(std::string(name)));

        if (lowered == "trace") {
            return spdlog::level::trace;
        }
        if (lowered == "debug") {
            return spdlog::level::debug;
        }
        if (lowered == "info") {
            return spdlog::level::info;
        }
        if (lowered == "warning" || lowered == "warn") {
            return spdlog::level::warn;
        }
        if (lowered == "error") {
            return spdlog::level::err;
        }
        if (lowered == "critical") {
            return spdlog::level::critical;
        }
        if (lowered == "off") {
            return spdlog::level::off;
        }
        throw std::invalid_argument("Unknown log level: " + std::string(name));
    }

    void configure(const std::string& root_level, const std::string& module_levels) {
        const auto level = parse_level(root_level);

        spdlog::set_pattern(PATTERN);
        spdlog::set_level(level);

        for (const char* module : MODULES) {
            auto logger = spdlog::get(module);
            if (!logger) {
                logger = spdlog::stdout_color_mt(module);
            }
            logger->set_level(level);
            logger->set_pattern(PATTERN);
        }

        for (const auto& pair : string_utils::split_comma_delimited_string(module_levels)) {
            const auto pos = pair.find(':');
            if (pos == std::string::npos) {
                throw std::invalid_argument("Invalid module log level entry: " + pair);
            }

            const std::string module = string_utils::trim(pair.substr(0, pos));
            auto logger = spdlog::get(module);
            if (!logger) {
                logger = spdlog::stdout_color_mt(module);
                logger->set_pattern(PATTERN);
            }
            logger->set_level(parse_level(pair.substr(pos + 1)));
        }
    }

    std::shared_ptr<spdlog::logger> get(const char* name) {
        auto logger = spdlog::get(name);
        return logger ? logger : spdlog::default_logger();
    }
}  // namespace logging
