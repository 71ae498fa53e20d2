#pragma once

#include <reachability/exceptions.hpp>
#include <reachability/types.hpp>

#include <boost/json.hpp>

#include <charconv>
#include <chrono>
#include <cstdint>
#include <format>
#include <limits>
#include <optional>
#include <system_error>
#include <regex>
#include <string>
#include <string_view>

namespace reachability {

// Wire format of the probe tool. A successful probe prints one line
// "RESULT=<json>" on stdout; field names are the tool's, not ours.
namespace result_codec {

inline constexpr const char* result_prefix = "RESULT=";

namespace detail {

inline auto format_timestamp(std::chrono::system_clock::time_point tp) -> std::string {
    // %T of a nanosecond time point carries nine fractional digits
    return std::format("{:%Y-%m-%dT%H:%M:%S}Z",
                       std::chrono::time_point_cast<std::chrono::nanoseconds>(tp));
}

// Fixed-width decimal field at pos; throws unless every character is a digit
inline auto read_digits(const std::string& text, std::size_t pos, std::size_t width) -> int {
    int value = 0;
    if (pos + width > text.size()) {
        throw result_decode_exception("invalid timestamp '" + text + "'", text);
    }
    const auto* first = text.data() + pos;
    const auto* last = first + width;
    auto [end, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || end != last || *first == '-' || *first == '+') {
        throw result_decode_exception("invalid timestamp '" + text + "'", text);
    }
    return value;
}

// RFC 3339 with optional fractional seconds and either "Z" or a numeric offset
inline auto parse_timestamp(const std::string& text) -> std::chrono::system_clock::time_point {
    using namespace std::chrono;

    if (text.size() < 19 || text[4] != '-' || text[7] != '-' ||
        (text[10] != 'T' && text[10] != 't') || text[13] != ':' || text[16] != ':') {
        throw result_decode_exception("invalid timestamp '" + text + "'", text);
    }
    const auto y = read_digits(text, 0, 4);
    const auto mo = read_digits(text, 5, 2);
    const auto d = read_digits(text, 8, 2);
    const auto h = read_digits(text, 11, 2);
    const auto mi = read_digits(text, 14, 2);
    const auto sec = read_digits(text, 17, 2);

    // Year 1 is the probe tool's "no timestamp"
    if (y <= 1) {
        return {};
    }
    const year_month_day date{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
    if (!date.ok() || h > 23 || mi > 59 || sec > 59) {
        throw result_decode_exception("invalid timestamp '" + text + "'", text);
    }

    std::string_view rest(text);
    rest.remove_prefix(19);

    nanoseconds fraction{0};
    if (!rest.empty() && rest.front() == '.') {
        rest.remove_prefix(1);
        long long nanos = 0;
        int digits = 0;
        while (!rest.empty() && rest.front() >= '0' && rest.front() <= '9') {
            if (digits < 9) {
                nanos = nanos * 10 + (rest.front() - '0');
                ++digits;
            }
            rest.remove_prefix(1);
        }
        if (digits == 0) {
            throw result_decode_exception("invalid timestamp fraction '" + text + "'", text);
        }
        for (; digits < 9; ++digits) {
            nanos *= 10;
        }
        fraction = nanoseconds{nanos};
    }

    minutes offset{0};
    if (rest == "Z" || rest == "z") {
        offset = minutes{0};
    } else if (rest.size() == 6 && (rest[0] == '+' || rest[0] == '-') && rest[3] == ':') {
        const auto zone_at = text.size() - 5;
        const auto zone_hours = read_digits(text, zone_at, 2);
        const auto zone_minutes = read_digits(text, zone_at + 3, 2);
        offset = hours{zone_hours} + minutes{zone_minutes};
        if (rest[0] == '-') {
            offset = -offset;
        }
    } else {
        throw result_decode_exception("invalid timestamp zone '" + text + "'", text);
    }

    const auto utc = sys_days{date} + hours{h} + minutes{mi} + seconds{sec} + fraction - offset;
    return time_point_cast<system_clock::duration>(utc);
}

inline auto field(const boost::json::object& obj, std::string_view key) -> const boost::json::value* {
    return obj.if_contains(key);
}

inline auto get_int(const boost::json::object& obj, std::string_view key) -> int {
    const auto* v = field(obj, key);
    if (v == nullptr || v->is_null()) {
        return 0;
    }
    if (v->is_int64()) {
        const auto n = v->as_int64();
        if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) {
            throw result_decode_exception("field '" + std::string(key) + "' is out of range",
                                          boost::json::serialize(*v));
        }
        return static_cast<int>(n);
    }
    if (v->is_uint64()) {
        const auto n = v->as_uint64();
        if (n > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            throw result_decode_exception("field '" + std::string(key) + "' is out of range",
                                          boost::json::serialize(*v));
        }
        return static_cast<int>(n);
    }
    throw result_decode_exception("field '" + std::string(key) + "' is not an integer",
                                  boost::json::serialize(*v));
}

inline auto get_string(const boost::json::object& obj, std::string_view key) -> std::string {
    const auto* v = field(obj, key);
    if (v == nullptr || v->is_null()) {
        return {};
    }
    if (!v->is_string()) {
        throw result_decode_exception("field '" + std::string(key) + "' is not a string",
                                      boost::json::serialize(*v));
    }
    return std::string(v->as_string());
}

inline auto get_object(const boost::json::object& obj, std::string_view key) -> const boost::json::object* {
    const auto* v = field(obj, key);
    if (v == nullptr || v->is_null()) {
        return nullptr;
    }
    if (!v->is_object()) {
        throw result_decode_exception("field '" + std::string(key) + "' is not an object",
                                      boost::json::serialize(*v));
    }
    return &v->as_object();
}

inline auto get_timestamp(const boost::json::object& obj, std::string_view key)
    -> std::chrono::system_clock::time_point {
    auto text = get_string(obj, key);
    if (text.empty()) {
        return {};
    }
    return parse_timestamp(text);
}

} // namespace detail

inline auto to_json(const probe_result& result) -> boost::json::object {
    const auto& response = result.last_response;
    const auto& request = response.request;

    boost::json::object request_obj;
    request_obj["Timestamp"] = detail::format_timestamp(request.timestamp);
    request_obj["ID"] = request.id;
    request_obj["Payload"] = request.payload;
    request_obj["SendSize"] = request.send_size;
    request_obj["ResponseSize"] = request.response_size;

    boost::json::object response_obj;
    response_obj["Timestamp"] = detail::format_timestamp(response.timestamp);
    response_obj["SourceAddr"] = response.source_addr;
    response_obj["ServerAddr"] = response.server_addr;
    response_obj["Request"] = std::move(request_obj);

    boost::json::object stats_obj;
    stats_obj["RequestsSent"] = result.stats.requests_sent;
    stats_obj["ResponsesReceived"] = result.stats.responses_received;

    boost::json::object mtu_obj;
    mtu_obj["Start"] = result.client_mtu.start;
    mtu_obj["End"] = result.client_mtu.end;

    boost::json::object obj;
    obj["LastResponse"] = std::move(response_obj);
    obj["Stats"] = std::move(stats_obj);
    obj["ClientMTU"] = std::move(mtu_obj);
    return obj;
}

inline auto from_json(const boost::json::value& value) -> probe_result {
    if (!value.is_object()) {
        throw result_decode_exception("result is not a JSON object", boost::json::serialize(value));
    }
    const auto& obj = value.as_object();
    probe_result result;

    if (const auto* response = detail::get_object(obj, "LastResponse")) {
        result.last_response.timestamp = detail::get_timestamp(*response, "Timestamp");
        result.last_response.source_addr = detail::get_string(*response, "SourceAddr");
        result.last_response.server_addr = detail::get_string(*response, "ServerAddr");
        if (const auto* request = detail::get_object(*response, "Request")) {
            auto& req = result.last_response.request;
            req.timestamp = detail::get_timestamp(*request, "Timestamp");
            req.id = detail::get_string(*request, "ID");
            req.payload = detail::get_string(*request, "Payload");
            req.send_size = detail::get_int(*request, "SendSize");
            req.response_size = detail::get_int(*request, "ResponseSize");
        }
    }

    if (const auto* stats = detail::get_object(obj, "Stats")) {
        result.stats.requests_sent = detail::get_int(*stats, "RequestsSent");
        result.stats.responses_received = detail::get_int(*stats, "ResponsesReceived");
    }

    if (const auto* mtu = detail::get_object(obj, "ClientMTU")) {
        result.client_mtu.start = detail::get_int(*mtu, "Start");
        result.client_mtu.end = detail::get_int(*mtu, "End");
    }

    return result;
}

// "RESULT=<json>" without a trailing newline
inline auto encode_result_line(const probe_result& result) -> std::string {
    return std::string(result_prefix) + boost::json::serialize(to_json(result));
}

/**
 * @brief Extract the probe result from the probe tool's stdout
 *
 * @param output Complete stdout of the probe process
 * @return The decoded result, or nullopt when no RESULT line is present
 * @throws result_decode_exception if a RESULT line is present but malformed
 */
inline auto parse_probe_output(const std::string& output) -> std::optional<probe_result> {
    static const std::regex result_line("RESULT=(.*)\n");

    std::smatch match;
    if (!std::regex_search(output, match, result_line)) {
        return std::nullopt;
    }

    const auto payload = match[1].str();
    boost::system::error_code ec;
    auto value = boost::json::parse(payload, ec);
    if (ec) {
        throw result_decode_exception(ec.message(), payload);
    }
    return from_json(value);
}

} // namespace result_codec

} // namespace reachability
