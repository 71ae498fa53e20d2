#pragma once

#include <reachability/endpoint.hpp>
#include <reachability/exceptions.hpp>
#include <reachability/logger.hpp>
#include <reachability/probe_command.hpp>
#include <reachability/result_codec.hpp>
#include <reachability/types.hpp>

#include <concepts>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace reachability {

struct command_output {
    int exit_code{0};
    std::string stdout_text;
    std::string stderr_text;
};

// Executes the container runtime with the given arguments and waits for it.
// Failing to start the process at all is reported by throwing probe_exception.
template<typename R>
concept command_runner = requires(const R& runner, const std::vector<std::string>& args) {
    { runner.run(args) } -> std::same_as<command_output>;
};

struct workload_spec {
    std::string name;
    std::string container;
    std::vector<std::string> ips;
    port_number default_port{8055};
    std::optional<std::string> protocol;
};

/**
 * @brief A containerised workload that can both probe and be probed
 *
 * Probing runs the probe binary inside the container through the runner.
 * A non-zero exit status means the connection failed. Otherwise stdout is
 * decoded, and a malformed result line is an error, not a negative outcome.
 *
 * @tparam Runner Container runtime invoker
 * @tparam Logger Diagnostic logger type
 */
template<command_runner Runner, diagnostic_logger Logger>
class container_workload {
public:
    container_workload(workload_spec spec, Runner runner, Logger& logger)
        : _spec(std::move(spec))
        , _runner(std::move(runner))
        , _logger(&logger) {
        if (_spec.ips.empty()) {
            throw configuration_exception("Workload " + _spec.name + " has no IP address");
        }
    }

    auto probe(
        const std::string& ip,
        const std::string& port,
        const std::string& protocol,
        const probe_options& options
    ) const -> std::optional<probe_result> {
        auto command = probe_command::from_options(ip, port, protocol, options);
        auto output = _runner.run(command.to_args(_spec.container));

        _logger->log(log_level::info, "Connection check", {
            {"container", _spec.container},
            {"target", ip + ":" + port},
            {"protocol", protocol},
            {"exit_code", std::to_string(output.exit_code)},
            {"stdout", output.stdout_text},
            {"stderr", output.stderr_text}
        });

        if (output.exit_code != 0) {
            return std::nullopt;
        }
        return result_codec::parse_probe_output(output.stdout_text);
    }

    auto source_name() const -> std::string { return _spec.name; }
    auto source_ips() const -> std::vector<std::string> { return _spec.ips; }

    auto to_matcher(std::optional<port_number> explicit_port) const -> target_matcher {
        const auto port = std::to_string(explicit_port.value_or(_spec.default_port));
        return target_matcher{
            .ip = _spec.ips.front(),
            .port = port,
            .target_name = explicit_port ? _spec.name + ":" + port : _spec.name,
            .protocol = _spec.protocol
        };
    }

    auto spec() const -> const workload_spec& { return _spec; }

private:
    workload_spec _spec;
    Runner _runner;
    Logger* _logger;
};

} // namespace reachability
