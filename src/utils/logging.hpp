#ifndef NEXUS_BRIDGE_LOGGING_HPP
#define NEXUS_BRIDGE_LOGGING_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <string_view>

namespace logging {
    inline constexpr const char* SERVER = "server";
    inline constexpr const char* DISPATCH = "dispatch";
    inline constexpr const char* UPSTREAM = "upstream";
    inline constexpr const char* CONFIG = "config";

    // Parses "debug", "INFO", "warning", ... Throws std::invalid_argument on anything else.
    spdlog::level::level_enum parse_level(std::string_view name);

    // Creates the named loggers, sets the root level and applies "module:level,module:level" overrides.
    void configure(const std::string& root_level, const std::string& module_levels);

    // Returns the named logger, or the default logger when configure() has not registered it.
    std::shared_ptr<spdlog::logger> get(const char* name);
}  // namespace logging

#endif
