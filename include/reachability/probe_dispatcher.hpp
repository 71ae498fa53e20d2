#pragma once

#include <reachability/exceptions.hpp>
#include <reachability/expectation.hpp>
#include <reachability/future.hpp>
#include <reachability/logger.hpp>
#include <reachability/outcome_matcher.hpp>

#include <folly/executors/CPUThreadPoolExecutor.h>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace reachability {

// One probe round over every expectation, in registration order
struct dispatch_result {
    std::vector<std::optional<probe_result>> outcomes;
    std::vector<std::string> summaries;

    // Units that threw instead of returning; their outcome slot is empty
    std::vector<std::string> faults;
};

/**
 * @brief Runs one probe per expectation concurrently
 *
 * Each expectation gets its own unit of work on a thread pool sized to the
 * batch, optionally capped by max_concurrency. dispatch() returns only once
 * every unit has completed, so a slow probe delays the whole round but never
 * blocks its siblings from running.
 *
 * A unit that throws is isolated: its slot becomes an absent outcome and the
 * failure is recorded as a fault. A result_decode_exception means the probe
 * broke its output contract; it is rethrown once all units have finished, as
 * is anything not derived from std::exception.
 *
 * @tparam Logger Diagnostic logger type
 */
template<diagnostic_logger Logger>
class probe_dispatcher {
public:
    explicit probe_dispatcher(Logger& logger, std::size_t max_concurrency = 0)
        : _logger(logger)
        , _max_concurrency(max_concurrency) {}

    auto dispatch(
        const std::vector<expectation>& expectations,
        const std::string& protocol,
        bool check_snat
    ) -> dispatch_result {
        dispatch_result result;
        const auto count = expectations.size();
        result.outcomes.resize(count);
        result.summaries.resize(count);
        if (count == 0) {
            return result;
        }

        auto results = run_units(expectations, protocol);

        std::exception_ptr fatal;
        for (std::size_t i = 0; i < count; ++i) {
            const auto& exp = expectations[i];
            auto& unit = results[i];

            if (unit.hasValue()) {
                result.outcomes[i] = std::move(unit.value());
            } else {
                try {
                    std::rethrow_exception(unit.exception());
                } catch (const result_decode_exception& e) {
                    record_fault(result, exp, e.what());
                    if (!fatal) {
                        fatal = std::current_exception();
                    }
                } catch (const std::exception& e) {
                    record_fault(result, exp, e.what());
                } catch (...) {
                    record_fault(result, exp, "non-standard exception");
                    if (!fatal) {
                        fatal = std::current_exception();
                    }
                }
            }

            result.summaries[i] = describe_actual(exp, result.outcomes[i], check_snat);
            log_completion(exp, protocol, result.outcomes[i]);
        }

        if (fatal) {
            std::rethrow_exception(fatal);
        }
        return result;
    }

private:
    Logger& _logger;
    std::size_t _max_concurrency;

    auto run_units(
        const std::vector<expectation>& expectations,
        const std::string& protocol
    ) -> std::vector<Try<std::optional<probe_result>>> {
        auto threads = expectations.size();
        if (_max_concurrency > 0) {
            threads = std::min(threads, _max_concurrency);
        }
        auto executor = std::make_unique<folly::CPUThreadPoolExecutor>(threads);

        std::vector<Future<std::optional<probe_result>>> units;
        units.reserve(expectations.size());
        for (const auto& exp : expectations) {
            units.push_back(FutureFactory::makeFutureVia(executor.get(), [&exp, &protocol]() {
                return exp.source.probe(
                    exp.target.ip,
                    exp.target.port,
                    exp.target.effective_protocol(protocol),
                    options_for(exp));
            }));
        }

        // Full barrier: matching never sees a partial round
        auto results = FutureCollector::collectAll(std::move(units)).get();
        executor->join();
        return results;
    }

    static auto options_for(const expectation& exp) -> probe_options {
        probe_options options;
        options.duration = exp.expected_loss.duration;
        if (exp.send_len > 0 || exp.recv_len > 0) {
            options.send_len = exp.send_len;
            options.recv_len = exp.recv_len;
        }
        return options;
    }

    auto log_completion(
        const expectation& exp,
        const std::string& protocol,
        const std::optional<probe_result>& outcome
    ) -> void {
        // log_fields only views its values; keep them alive until the call
        const auto source = exp.source.source_name();
        const auto effective = exp.target.effective_protocol(protocol);
        log_fields fields{
            {"source", source},
            {"target", exp.target.target_name},
            {"protocol", effective},
            {"reachable", outcome ? "true" : "false"}
        };

        std::string stats_text;
        std::string mtu_text;
        if (outcome) {
            std::ostringstream stats;
            stats << outcome->stats;
            stats_text = stats.str();
            std::ostringstream mtu;
            mtu << outcome->client_mtu;
            mtu_text = mtu.str();
            fields.emplace_back("stats", stats_text);
            fields.emplace_back("client_mtu", mtu_text);
        }
        _logger.log(log_level::debug, "Probe completed", fields);
    }

    auto record_fault(dispatch_result& result, const expectation& exp, const std::string& what) -> void {
        auto fault = exp.source.source_name() + " -> " + exp.target.target_name + ": " + what;
        _logger.log(log_level::error, "Probe unit failed", {
            {"source", exp.source.source_name()},
            {"target", exp.target.target_name},
            {"error", what}
        });
        result.faults.push_back(std::move(fault));
    }
};

} // namespace reachability
