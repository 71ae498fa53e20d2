#pragma once

#include <reachability/exceptions.hpp>

#include <cctype>
#include <charconv>
#include <string>
#include <string_view>
#include <system_error>

namespace reachability {

inline constexpr const char* connection_type_stream = "stream";
inline constexpr const char* connection_type_ping = "ping";

namespace detail {

inline auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

} // namespace detail

// Identifies the payloads of one long-running connection so that the server
// side can attribute sequence numbers to it.
struct conn_config {
    std::string type;
    std::string id;

    auto message_prefix() const -> std::string {
        return type + ":" + id + "~";
    }

    auto test_message(int sequence) const -> std::string {
        return message_prefix() + std::to_string(sequence);
    }

    // Sequence number carried by msg; surrounding whitespace is ignored
    auto message_sequence(std::string_view msg) const -> int {
        const auto trimmed = detail::trim(msg);
        const auto prefix = message_prefix();
        if (!trimmed.starts_with(prefix)) {
            throw message_format_exception("invalid message prefix format:" + std::string(trimmed));
        }

        const auto digits = trimmed.substr(prefix.size());
        int sequence = 0;
        const auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), sequence);
        if (digits.empty() || ec != std::errc{} || end != digits.data() + digits.size() || sequence < 0) {
            throw message_format_exception("invalid message sequence format:" + std::string(trimmed));
        }
        return sequence;
    }
};

inline auto is_message_part_of_stream(std::string_view msg) -> bool {
    return detail::trim(msg).starts_with(connection_type_stream);
}

} // namespace reachability
