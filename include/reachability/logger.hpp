#pragma once

#include <concepts>
#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

namespace reachability {

enum class log_level : std::uint8_t {
    trace,
    debug,
    info,
    warning,
    error,
    critical
};

// Structured context attached to a record, in the order it is printed
using log_fields = std::vector<std::pair<std::string_view, std::string_view>>;

inline auto level_name(log_level level) -> std::string_view {
    switch (level) {
        case log_level::trace:    return "TRACE";
        case log_level::debug:    return "DEBUG";
        case log_level::info:     return "INFO";
        case log_level::warning:  return "WARNING";
        case log_level::error:    return "ERROR";
        case log_level::critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

/**
 * Sink for the checker's diagnostics. Probe units log from executor threads,
 * so an implementation must accept calls from several threads at once.
 * Only the levels the library itself emits are required as shorthands.
 */
template<typename L>
concept diagnostic_logger = requires(L logger, log_level level, std::string_view message, log_fields fields) {
    { logger.log(level, message) } -> std::same_as<void>;
    { logger.log(level, message, fields) } -> std::same_as<void>;
    { logger.debug(message) } -> std::same_as<void>;
    { logger.info(message) } -> std::same_as<void>;
    { logger.warning(message) } -> std::same_as<void>;
    { logger.error(message) } -> std::same_as<void>;
};

} // namespace reachability
