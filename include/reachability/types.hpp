#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace reachability {

using port_number = std::uint16_t;

inline constexpr const char* protocol_tcp = "tcp";
inline constexpr const char* protocol_udp = "udp";
inline constexpr const char* protocol_sctp = "sctp";

// Request echoed back by the probe's server side
struct probe_request {
    std::chrono::system_clock::time_point timestamp{};
    std::string id;
    std::string payload;
    int send_size{0};
    int response_size{0};

    auto operator==(const probe_request& other) const -> bool {
        return id == other.id && timestamp == other.timestamp;
    }
};

struct probe_response {
    std::chrono::system_clock::time_point timestamp{};
    std::string source_addr;   // "ip:port" as observed by the server
    std::string server_addr;
    probe_request request;

    // Everything before the first ':' of source_addr
    auto source_ip() const -> std::string {
        return source_addr.substr(0, source_addr.find(':'));
    }
};

struct probe_stats {
    int requests_sent{0};
    int responses_received{0};

    auto lost() const -> int {
        return requests_sent - responses_received;
    }

    // Undefined when nothing was sent; loss-window probes always send
    auto lost_percent() const -> double {
        return static_cast<double>(lost()) * 100.0 / static_cast<double>(requests_sent);
    }
};

// MTU observed before and after the transfer
struct mtu_pair {
    int start{0};
    int end{0};
};

// Outcome of a single probe. An empty std::optional<probe_result> means the
// source could not connect.
struct probe_result {
    probe_response last_response;
    probe_stats stats;
    mtu_pair client_mtu;
};

// Options applied to one probe. Unset fields leave the probe tool default.
struct probe_options {
    std::chrono::seconds duration{0};
    int send_len{0};
    int recv_len{0};
    std::optional<std::string> source_ip;
    std::optional<std::string> source_port;
    std::optional<std::string> namespace_path;
};

// A target resolved to a concrete address. protocol is only set when the
// target overrides the checker's protocol.
struct target_matcher {
    std::string ip;
    std::string port;
    std::string target_name;
    std::optional<std::string> protocol;

    auto effective_protocol(const std::string& checker_default) const -> std::string {
        if (protocol) {
            return *protocol;
        }
        return checker_default.empty() ? std::string{protocol_tcp} : checker_default;
    }
};

inline auto operator<<(std::ostream& os, const mtu_pair& mtu) -> std::ostream& {
    return os << mtu.start << " -> " << mtu.end;
}

inline auto operator<<(std::ostream& os, const probe_stats& stats) -> std::ostream& {
    return os << "sent=" << stats.requests_sent << " received=" << stats.responses_received;
}

} // namespace reachability
