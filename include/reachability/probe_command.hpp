#pragma once

#include <reachability/types.hpp>

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace reachability {

// Name of the probe binary inside every test container
inline constexpr const char* probe_binary_name = "test-connection";

/**
 * @brief Command line of one invocation of the probe binary
 *
 * The binary itself, and the runtime that executes it, are external. This
 * type only knows the argument contract.
 */
struct probe_command {
    std::string namespace_path{"-"};

    std::string ip;
    std::string port;
    std::string protocol;

    std::string source_ip;
    std::string source_port;

    std::chrono::seconds duration{0};

    int send_len{0};
    int recv_len{0};

    static auto from_options(
        std::string ip,
        std::string port,
        std::string protocol,
        const probe_options& options
    ) -> probe_command {
        probe_command cmd;
        cmd.ip = std::move(ip);
        cmd.port = std::move(port);
        cmd.protocol = std::move(protocol);
        cmd.duration = options.duration;
        cmd.send_len = options.send_len;
        cmd.recv_len = options.recv_len;
        if (options.source_ip) {
            cmd.source_ip = *options.source_ip;
        }
        if (options.source_port) {
            cmd.source_port = *options.source_port;
        }
        if (options.namespace_path) {
            cmd.namespace_path = *options.namespace_path;
        }
        return cmd;
    }

    // Arguments for the container runtime, starting with its "exec" verb
    auto to_args(const std::string& container) const -> std::vector<std::string> {
        std::vector<std::string> args{
            "exec",
            container,
            std::string("/") + probe_binary_name,
            "--protocol=" + protocol,
            "--duration=" + std::to_string(duration.count()),
            "--sendlen=" + std::to_string(send_len),
            "--recvlen=" + std::to_string(recv_len),
            namespace_path,
            ip,
            port,
        };
        if (!source_ip.empty()) {
            args.push_back("--source-ip=" + source_ip);
        }
        if (!source_port.empty()) {
            args.push_back("--source-port=" + source_port);
        }
        return args;
    }
};

} // namespace reachability
