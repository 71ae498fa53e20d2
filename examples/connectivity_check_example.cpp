/**
 * Example: Declaring and verifying a network policy
 *
 * This example demonstrates:
 * 1. Container workloads probed through a command runner
 * 2. Reachable, unreachable and SNAT expectations on one checker
 * 3. Failure reports delivered to a callback instead of an exception
 *
 * The container runtime is simulated: a small policy table decides which
 * connections succeed, and allowed ones print the probe tool's RESULT line.
 */

#include <reachability/reachability.hpp>

#include <folly/init/Init.h>

#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace {
    constexpr reachability::port_number server_port = 8055;
    constexpr const char* egress_nat_ip = "172.16.0.100";

    // Simulated runtime: "exec <container> ... <ip> <port>" succeeds when the
    // policy allows container -> ip:port
    class simulated_runtime {
    public:
        struct route {
            std::string observed_source;
        };

        auto allow(const std::string& container, const std::string& destination, std::string observed_source)
            -> void {
            (*_routes)[{container, destination}] = route{std::move(observed_source)};
        }

        auto deny(const std::string& container, const std::string& destination) -> void {
            _routes->erase({container, destination});
        }

        auto run(const std::vector<std::string>& args) const -> reachability::command_output {
            const auto& container = args.at(1);
            const auto destination = args.at(8) + ":" + args.at(9);

            auto it = _routes->find({container, destination});
            if (it == _routes->end()) {
                return {1, "", "connect: connection timed out"};
            }

            reachability::probe_result result;
            result.last_response.source_addr = it->second.observed_source + ":40000";
            result.last_response.server_addr = destination;
            result.stats.requests_sent = 1;
            result.stats.responses_received = 1;
            return {0, reachability::result_codec::encode_result_line(result) + "\n", ""};
        }

    private:
        std::shared_ptr<std::map<std::pair<std::string, std::string>, route>> _routes =
            std::make_shared<std::map<std::pair<std::string, std::string>, route>>();
    };

    using workload = reachability::container_workload<simulated_runtime, reachability::console_logger>;
}

auto main(int argc, char* argv[]) -> int {
    folly::Init init(&argc, &argv);

    reachability::console_logger probe_logger("workload", reachability::log_level::warning);
    simulated_runtime runtime;

    workload client(reachability::workload_spec{
        .name = "client", .container = "client-pod", .ips = {"10.65.0.2"}}, runtime, probe_logger);
    workload backend(reachability::workload_spec{
        .name = "backend", .container = "backend-pod", .ips = {"10.65.0.3"}}, runtime, probe_logger);
    workload database(reachability::workload_spec{
        .name = "database", .container = "db-pod", .ips = {"10.65.0.4"}, .default_port = 5432}, runtime,
        probe_logger);

    // client -> backend allowed, backend -> database allowed, client -> database denied,
    // egress to the internet leaves through the NAT gateway
    runtime.allow("client-pod", "10.65.0.3:8055", "10.65.0.2");
    runtime.allow("backend-pod", "10.65.0.4:5432", "10.65.0.3");
    runtime.allow("client-pod", "8.8.8.8:53", egress_nat_ip);

    std::vector<std::string> failures;
    reachability::checker_config config;
    config.on_fail = [&failures](const std::string& report) { failures.push_back(report); };

    reachability::default_checker cc(std::move(config));

    cc.expect_some(client, backend);
    cc.expect_some(backend, database);
    cc.expect_none(client, database);
    cc.expect_snat(client, egress_nat_ip, reachability::target_ip("8.8.8.8"), 53);

    std::cout << "Expected connectivity:\n";
    for (const auto& line : cc.expected_connectivity_pretty()) {
        std::cout << "    " << line << "\n";
    }

    try {
        cc.check_connectivity_with_timeout(std::chrono::milliseconds{500}, "Initial policy");
        std::cout << "Initial policy: " << (failures.empty() ? "verified" : "FAILED")
                  << " after " << cc.last_attempt_count() << " attempt(s)\n";

        // A policy change that breaks backend -> database is reported, not thrown
        runtime.deny("backend-pod", "10.65.0.4:5432");
        cc.check_connectivity_with_timeout(std::chrono::milliseconds{500}, "After deny");
        std::cout << "After deny: " << cc.last_attempt_count() << " attempt(s)\n";
    } catch (const reachability::reachability_exception& e) {
        std::cerr << "Check aborted: " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    for (const auto& report : failures) {
        std::cout << "\n" << report << "\n";
    }

    std::cout << "\nDirect probe client -> backend: "
              << (reachability::have_connectivity_to(client, backend) ? "reachable" : "unreachable")
              << "\n";

    return failures.size() == 1 ? EXIT_SUCCESS : EXIT_FAILURE;
}
