#pragma once

#include <reachability/logger.hpp>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace reachability {

// Thread-safe console logger. Probe units log from executor threads, so every
// write is serialised through a single mutex. Error and critical records go to
// the error stream, everything else to the output stream.
class console_logger {
public:
    explicit console_logger(log_level min_level = log_level::info)
        : console_logger("reachability", min_level) {}

    console_logger(std::string component, log_level min_level)
        : console_logger(std::move(component), min_level, std::cout, std::cerr) {}

    // Streams must outlive the logger
    console_logger(std::string component, log_level min_level, std::ostream& out, std::ostream& err)
        : _component(std::move(component))
        , _min_level(min_level)
        , _out(&out)
        , _err(&err) {}

    console_logger(console_logger&& other) noexcept
        : _component(std::move(other._component))
        , _min_level(other._min_level)
        , _out(other._out)
        , _err(other._err) {}

    console_logger& operator=(console_logger&& other) noexcept {
        if (this != &other) {
            _component = std::move(other._component);
            _min_level = other._min_level;
            _out = other._out;
            _err = other._err;
        }
        return *this;
    }

    console_logger(const console_logger&) = delete;
    console_logger& operator=(const console_logger&) = delete;

    auto log(log_level level, std::string_view message) -> void {
        log(level, message, {});
    }

    auto log(
        log_level level,
        std::string_view message,
        const log_fields& key_value_pairs
    ) -> void {
        std::lock_guard<std::mutex> lock(_mutex);
        if (level < _min_level) {
            return;
        }

        auto& stream = get_stream(level);
        stream << format_timestamp() << " "
               << level_name(level) << " [" << _component << "] "
               << message;
        for (const auto& [key, value] : key_value_pairs) {
            stream << " [" << key << "=" << value << "]";
        }
        stream << "\n";
        stream.flush();
    }

    auto trace(std::string_view message) -> void { log(log_level::trace, message); }
    auto debug(std::string_view message) -> void { log(log_level::debug, message); }
    auto info(std::string_view message) -> void { log(log_level::info, message); }
    auto warning(std::string_view message) -> void { log(log_level::warning, message); }
    auto error(std::string_view message) -> void { log(log_level::error, message); }
    auto critical(std::string_view message) -> void { log(log_level::critical, message); }

    auto set_min_level(log_level level) -> void {
        std::lock_guard<std::mutex> lock(_mutex);
        _min_level = level;
    }

    [[nodiscard]] auto get_min_level() const -> log_level {
        std::lock_guard<std::mutex> lock(_mutex);
        return _min_level;
    }

    [[nodiscard]] auto component() const -> const std::string& {
        return _component;
    }

private:
    std::string _component;
    log_level _min_level;
    std::ostream* _out;
    std::ostream* _err;
    mutable std::mutex _mutex;

    [[nodiscard]] auto get_stream(log_level level) const -> std::ostream& {
        if (level >= log_level::error) {
            return *_err;
        }
        return *_out;
    }

    [[nodiscard]] static auto format_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()
        ) % 1000;

        std::tm local_tm{};
        localtime_r(&time_t_now, &local_tm);

        std::ostringstream oss;
        oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }
};

static_assert(diagnostic_logger<console_logger>,
    "console_logger must satisfy diagnostic_logger concept");

} // namespace reachability
