#pragma once

#include <reachability/console_logger.hpp>
#include <reachability/endpoint.hpp>
#include <reachability/exceptions.hpp>
#include <reachability/expectation.hpp>
#include <reachability/logger.hpp>
#include <reachability/outcome_matcher.hpp>
#include <reachability/probe_dispatcher.hpp>
#include <reachability/unactivated_registry.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace reachability {

/**
 * @brief Checker configuration
 *
 * protocol, check_snat, retries_disabled and reverse_direction may be changed
 * between registrations; reset_expectations() clears check_snat and
 * retries_disabled again.
 */
struct checker_config {
    // Transport used when a target does not name its own
    std::string protocol{protocol_tcp};

    bool check_snat{false};

    // Forced on by packet-loss expectations
    bool retries_disabled{false};

    // Swap source and target roles at registration time
    bool reverse_direction{false};

    std::chrono::milliseconds default_timeout{10000};

    // check_connectivity_with_timeout rejects anything at or below this
    std::chrono::milliseconds minimum_timeout{100};

    // Attempts made before giving up, regardless of the timeout
    std::size_t minimum_attempts{2};

    // Probe threads per round; 0 runs every probe of a round at once
    std::size_t max_concurrency{0};

    // Called with the report instead of throwing connectivity_check_failed
    std::function<void(const std::string&)> on_fail;

    auto is_valid() const -> bool {
        return default_timeout >= std::chrono::milliseconds{0} &&
               minimum_timeout >= std::chrono::milliseconds{0} &&
               minimum_attempts > 0;
    }
};

/**
 * @brief Records connectivity expectations and verifies them against probes
 *
 * Typical use:
 *
 *     checker<> cc;
 *     cc.expect_none(w[2], w[0], 1234);
 *     cc.expect_some(w[1], w[0], 5678);
 *     cc.check_connectivity();
 *
 * A check probes every expectation concurrently and compares the outcomes to
 * what was declared. A round with any mismatch is repeated until the timeout
 * expires. At least minimum_attempts rounds always run, so one slow first
 * round cannot cause a false failure. Once retries are exhausted, a report of
 * actual against expected is delivered to on_fail, or thrown as
 * connectivity_check_failed when no callback is set.
 *
 * Registration is not thread-safe. A checker registers its own address in the
 * unactivated registry, so it can be neither copied nor moved. Destroying a
 * checker that never ran logs a warning and removes it from the registry.
 *
 * @tparam Logger Diagnostic logger type
 */
template<diagnostic_logger Logger = console_logger>
class checker {
public:
    using clock = std::chrono::steady_clock;

    explicit checker(checker_config config = {}, Logger logger = Logger{})
        : _config(std::move(config))
        , _logger(std::move(logger)) {
        if (!_config.is_valid()) {
            throw configuration_exception("Invalid checker configuration");
        }
    }

    // Registry entries never outlive their checker. One that never ran is reported.
    ~checker() {
        if (!unactivated_checkers().contains(this)) {
            return;
        }
        const auto pending = std::to_string(_expectations.size());
        _logger.log(log_level::warning, "Checker destroyed without running a check", {
            {"expectations", pending}
        });
        unactivated_checkers().discard(this);
    }

    checker(const checker&) = delete;
    checker& operator=(const checker&) = delete;
    checker(checker&&) = delete;
    checker& operator=(checker&&) = delete;

    template<typename From, typename To>
    auto expect_some(const From& from, const To& to,
                     std::optional<port_number> explicit_port = std::nullopt) -> void {
        expect(true, from, to, explicit_port);
    }

    // Reachable, and the server must see the connection coming from src_ip
    template<typename From, typename To>
    auto expect_snat(const From& from, const std::string& src_ip, const To& to,
                     std::optional<port_number> explicit_port = std::nullopt) -> void {
        _config.check_snat = true;
        expect(true, from, to, explicit_port, with_source_ips(src_ip));
    }

    template<typename From, typename To>
    auto expect_none(const From& from, const To& to,
                     std::optional<port_number> explicit_port = std::nullopt) -> void {
        expect(false, from, to, explicit_port);
    }

    // Superset of expect_some with options applied in order; last one wins
    template<typename From, typename To, typename... Options>
    requires (std::invocable<Options&, expectation&> && ...)
    auto expect_connectivity(const From& from, const To& to,
                             std::optional<port_number> explicit_port,
                             Options&&... options) -> void {
        expect(true, from, to, explicit_port, std::forward<Options>(options)...);
    }

    // A loss measurement is a single timed run, so it also disables retries
    template<typename From, typename To>
    auto expect_loss(const From& from, const To& to, std::chrono::seconds duration,
                     double max_loss_percent, int max_loss_count,
                     std::optional<port_number> explicit_port = std::nullopt) -> void {
        auto loss = with_loss(duration, max_loss_percent, max_loss_count);
        _config.retries_disabled = true;
        expect(true, from, to, explicit_port, std::move(loss));
    }

    auto reset_expectations() -> void {
        _expectations.clear();
        _config.check_snat = false;
        _config.retries_disabled = false;
    }

    /**
     * @brief Probe every expectation once
     *
     * Marks the checker as activated. The outcome and summary vectors both
     * follow registration order.
     */
    auto actual_connectivity() -> dispatch_result {
        unactivated_checkers().discard(this);
        probe_dispatcher<Logger> dispatcher(_logger, _config.max_concurrency);
        return dispatcher.dispatch(_expectations, _config.protocol, _config.check_snat);
    }

    // One line per expectation, in the format of the actual summaries
    auto expected_connectivity_pretty() const -> std::vector<std::string> {
        std::vector<std::string> lines;
        lines.reserve(_expectations.size());
        for (const auto& exp : _expectations) {
            lines.push_back(describe_expected(exp, _config.check_snat));
        }
        return lines;
    }

    auto check_connectivity(const std::string& description = {}) -> void {
        check_connectivity_with_timeout_offset(2, _config.default_timeout, description);
    }

    auto check_connectivity_offset(int offset, const std::string& description = {}) -> void {
        check_connectivity_with_timeout_offset(offset + 2, _config.default_timeout, description);
    }

    // No timeout: loss expectations disable retries, so only the floor applies
    auto check_connectivity_packet_loss(const std::string& description = {}) -> void {
        check_connectivity_with_timeout_offset(2, std::chrono::milliseconds{0}, description);
    }

    auto check_connectivity_with_timeout(std::chrono::milliseconds timeout,
                                         const std::string& description = {}) -> void {
        if (timeout <= _config.minimum_timeout) {
            throw configuration_exception(
                "Very low timeout (" + std::to_string(timeout.count()) +
                "ms), did you mean to use a larger unit?");
        }
        check_connectivity_with_timeout_offset(2, timeout, description);
    }

    /**
     * @brief Retry loop
     *
     * Another round runs while
     * (retries enabled and elapsed < timeout) or completed < minimum_attempts.
     * Elapsed time is sampled each time the condition is evaluated, which is
     * after a failed round has been counted. A round where everything matches
     * returns at once.
     *
     * @param caller_skip Stack frames between the failure and the test code
     * @param timeout Retry deadline measured from entry
     * @param description Prepended to the failure report when not empty
     */
    auto check_connectivity_with_timeout_offset(int caller_skip,
                                                std::chrono::milliseconds timeout,
                                                const std::string& description = {}) -> void {
        const auto start = clock::now();
        std::size_t completed_attempts = 0;
        _last_attempt_count = 0;

        dispatch_result actual;
        std::vector<std::string> expected;

        while ((!_config.retries_disabled && clock::now() - start < timeout) ||
               completed_attempts < _config.minimum_attempts) {
            actual = actual_connectivity();
            expected = expected_connectivity_pretty();
            ++_last_attempt_count;

            bool failed = false;
            for (std::size_t i = 0; i < _expectations.size(); ++i) {
                if (!matches(_expectations[i], actual.outcomes[i], _config.check_snat)) {
                    failed = true;
                    actual.summaries[i] += " <---- WRONG";
                    expected[i] += " <---- EXPECTED";
                }
            }

            if (!failed) {
                _logger.log(log_level::info, "Connectivity matched", {
                    {"expectations", std::to_string(_expectations.size())},
                    {"attempts", std::to_string(_last_attempt_count)}
                });
                return;
            }

            ++completed_attempts;
            _logger.log(log_level::debug, "Connectivity mismatch, retrying", {
                {"attempt", std::to_string(completed_attempts)}
            });
        }

        report_failure(caller_skip, description, actual.summaries, expected);
    }

    [[nodiscard]] auto expectations() const -> const std::vector<expectation>& {
        return _expectations;
    }

    [[nodiscard]] auto config() -> checker_config& { return _config; }
    [[nodiscard]] auto config() const -> const checker_config& { return _config; }

    // Probe rounds run by the most recent check
    [[nodiscard]] auto last_attempt_count() const -> std::size_t {
        return _last_attempt_count;
    }

    [[nodiscard]] auto logger() -> Logger& { return _logger; }

private:
    checker_config _config;
    Logger _logger;
    std::vector<expectation> _expectations;
    std::size_t _last_attempt_count{0};

    template<typename From, typename To, typename... Options>
    auto expect(bool reachable, const From& from, const To& to,
                std::optional<port_number> explicit_port, Options&&... options) -> void {
        unactivated_checkers().add(this);

        auto exp = _config.reverse_direction
            ? make_expectation(reachable, to, from, explicit_port)
            : make_expectation(reachable, from, to, explicit_port);

        (std::invoke(options, exp), ...);

        _expectations.push_back(std::move(exp));
    }

    // Roles are checked here rather than in the signatures so that a caller
    // can pass a target-only endpoint as "from" when the direction is reversed.
    template<typename Source, typename Target>
    static auto make_expectation(bool reachable, const Source& source, const Target& target,
                                 std::optional<port_number> explicit_port) -> expectation {
        if constexpr (!connection_source<Source>) {
            throw configuration_exception("Connectivity source cannot originate probes");
        } else if constexpr (!connection_target<Target>) {
            throw configuration_exception("Connectivity target cannot be resolved to an address");
        } else {
            expectation exp{
                .source = source_handle(source),
                .target = target.to_matcher(explicit_port),
                .expected_reachable = reachable
            };
            // No NAT unless an option says otherwise
            if (reachable) {
                exp.expected_source_ips = source.source_ips();
            }
            return exp;
        }
    }

    auto report_failure(int caller_skip, const std::string& description,
                        const std::vector<std::string>& actual,
                        const std::vector<std::string>& expected) -> void {
        std::string message;
        if (!description.empty()) {
            message = description + "\n";
        }
        message += "Connectivity was incorrect:\n\nExpected\n    " + join_lines(actual) +
                   "\nto match\n    " + join_lines(expected);

        _logger.log(log_level::error, "Connectivity check failed", {
            {"attempts", std::to_string(_last_attempt_count)},
            {"expectations", std::to_string(_expectations.size())}
        });

        if (_config.on_fail) {
            _config.on_fail(message);
            return;
        }
        throw connectivity_check_failed(message, caller_skip);
    }

    static auto join_lines(const std::vector<std::string>& lines) -> std::string {
        std::string joined;
        for (std::size_t i = 0; i < lines.size(); ++i) {
            if (i > 0) {
                joined += "\n    ";
            }
            joined += lines[i];
        }
        return joined;
    }
};

} // namespace reachability
