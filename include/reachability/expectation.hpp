#pragma once

#include <reachability/endpoint.hpp>
#include <reachability/exceptions.hpp>
#include <reachability/types.hpp>

#include <chrono>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace reachability {

// Packet-loss bounds for a timed probe run. A bound of -1 is unset.
struct packet_loss_expectation {
    std::chrono::seconds duration{0};
    double max_percent{-1.0};
    int max_count{-1};

    auto is_set() const -> bool { return duration > std::chrono::seconds{0}; }
};

// One declared source -> target check
struct expectation {
    source_handle source;
    target_matcher target;
    bool expected_reachable{false};

    // Post-NAT source addresses; only consulted when the checker checks SNAT
    std::vector<std::string> expected_source_ips;

    packet_loss_expectation expected_loss;

    int send_len{0};
    int recv_len{0};

    // Zero means "not constrained"
    int client_mtu_start{0};
    int client_mtu_end{0};
};

// Modifies a freshly built expectation before it is stored
using expectation_option = std::function<void(expectation&)>;

inline auto with_source_ips(std::vector<std::string> ips) -> expectation_option {
    return [ips = std::move(ips)](expectation& e) {
        e.expected_source_ips = ips;
    };
}

template<typename... Ips>
requires (std::convertible_to<Ips, std::string> && ...)
auto with_source_ips(Ips&&... ips) -> expectation_option {
    return with_source_ips(std::vector<std::string>{std::string(std::forward<Ips>(ips))...});
}

// Additional bytes sent on top of the request
inline auto with_send_len(int len) -> expectation_option {
    return [len](expectation& e) { e.send_len = len; };
}

// Additional bytes received on top of the response
inline auto with_recv_len(int len) -> expectation_option {
    return [len](expectation& e) { e.recv_len = len; };
}

// The client-side MTU must move from start to end during the transfer
inline auto with_client_adjusted_mtu(int start, int end) -> expectation_option {
    return [start, end](expectation& e) {
        e.client_mtu_start = start;
        e.client_mtu_end = end;
    };
}

inline auto validate_packet_loss(const packet_loss_expectation& loss) -> void {
    if (loss.duration <= std::chrono::seconds{0}) {
        throw configuration_exception("Packet loss test must have a duration");
    }
    if (loss.max_percent > 100.0) {
        throw configuration_exception(
            "Loss percentage should be <=100, got " + std::to_string(loss.max_percent));
    }
    if (loss.max_percent < 0.0 && loss.max_count < 0) {
        throw configuration_exception("Either loss count or percent must be specified");
    }
}

// Validated here, when the option is built, so a bad declaration fails before
// anything is registered or probed.
inline auto with_loss(std::chrono::seconds duration, double max_percent, int max_count)
    -> expectation_option {
    packet_loss_expectation loss{
        .duration = duration,
        .max_percent = max_percent,
        .max_count = max_count
    };
    validate_packet_loss(loss);
    return [loss](expectation& e) { e.expected_loss = loss; };
}

} // namespace reachability
