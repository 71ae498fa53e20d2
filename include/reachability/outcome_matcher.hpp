#pragma once

#include <reachability/expectation.hpp>
#include <reachability/types.hpp>

#include <algorithm>
#include <format>
#include <optional>
#include <string>

namespace reachability {

/**
 * @brief Decide whether one probe outcome satisfies one expectation
 *
 * An expected-unreachable check matches only an absent outcome. An
 * expected-reachable check needs a present outcome that also satisfies every
 * declared constraint:
 * - with check_snat, the observed source IP must be one of the expected ones
 * - non-zero MTU bounds must equal the observed client MTU
 * - loss bounds of 0 or more cap the lost count and the lost percentage,
 *   inclusively
 *
 * @param exp The declared expectation
 * @param outcome The probe outcome, empty if the source could not connect
 * @param check_snat Whether source-NAT addresses are verified
 * @return true if the outcome matches
 */
inline auto matches(
    const expectation& exp,
    const std::optional<probe_result>& outcome,
    bool check_snat
) -> bool {
    if (!exp.expected_reachable) {
        return !outcome.has_value();
    }

    if (!outcome) {
        return false;
    }

    if (check_snat) {
        const auto observed = outcome->last_response.source_ip();
        const auto& expected = exp.expected_source_ips;
        if (std::find(expected.begin(), expected.end(), observed) == expected.end()) {
            return false;
        }
    }

    if (exp.client_mtu_start != 0 && exp.client_mtu_start != outcome->client_mtu.start) {
        return false;
    }
    if (exp.client_mtu_end != 0 && exp.client_mtu_end != outcome->client_mtu.end) {
        return false;
    }

    if (exp.expected_loss.is_set()) {
        const auto& loss = exp.expected_loss;
        if (loss.max_count >= 0 && outcome->stats.lost() > loss.max_count) {
            return false;
        }
        if (loss.max_percent >= 0.0 && outcome->stats.lost_percent() > loss.max_percent) {
            return false;
        }
    }

    return true;
}

// "<source> -> <target> = <reachable>" plus what was observed
inline auto describe_actual(
    const expectation& exp,
    const std::optional<probe_result>& outcome,
    bool check_snat
) -> std::string {
    auto line = std::format("{} -> {} = {}",
        exp.source.source_name(), exp.target.target_name, outcome.has_value());
    if (!outcome) {
        return line;
    }

    if (check_snat) {
        line += " (from " + outcome->last_response.source_ip() + ")";
    }
    if (outcome->client_mtu.start != 0) {
        line += std::format(" (client MTU {} -> {})",
            outcome->client_mtu.start, outcome->client_mtu.end);
    }
    if (exp.expected_loss.is_set()) {
        line += std::format(" (sent: {}, lost: {} / {:.1f}%)",
            outcome->stats.requests_sent, outcome->stats.lost(), outcome->stats.lost_percent());
    }
    return line;
}

// Same shape as describe_actual, but for what was declared
inline auto describe_expected(const expectation& exp, bool check_snat) -> std::string {
    auto line = std::format("{} -> {} = {}",
        exp.source.source_name(), exp.target.target_name, exp.expected_reachable);

    if (exp.expected_reachable) {
        if (check_snat) {
            std::string joined;
            for (const auto& ip : exp.expected_source_ips) {
                if (!joined.empty()) {
                    joined += "|";
                }
                joined += ip;
            }
            line += " (from " + joined + ")";
        }
        if (exp.client_mtu_start != 0 || exp.client_mtu_end != 0) {
            line += std::format(" (client MTU {} -> {})", exp.client_mtu_start, exp.client_mtu_end);
        }
    }

    if (exp.expected_loss.is_set()) {
        if (exp.expected_loss.max_count >= 0) {
            line += std::format(" (maxLoss: {} packets)", exp.expected_loss.max_count);
        }
        if (exp.expected_loss.max_percent >= 0.0) {
            line += std::format(" (maxLoss: {:.1f}%)", exp.expected_loss.max_percent);
        }
    }
    return line;
}

} // namespace reachability
