#pragma once

#include <stdexcept>
#include <string>

namespace reachability {

// Base exception for all reachability errors
class reachability_exception : public std::runtime_error {
public:
    explicit reachability_exception(const std::string& message)
        : std::runtime_error(message) {}
};

// Invalid declaration: raised at registration time, never deferred to check time
class configuration_exception : public reachability_exception {
public:
    explicit configuration_exception(const std::string& message)
        : reachability_exception(message) {}
};

// Transport-level probe failure; the dispatcher treats it as "could not connect"
class probe_exception : public reachability_exception {
public:
    explicit probe_exception(const std::string& message)
        : reachability_exception(message) {}
};

// The probe reported success but its result payload could not be decoded
class result_decode_exception : public reachability_exception {
public:
    result_decode_exception(const std::string& reason, const std::string& payload)
        : reachability_exception("Failed to parse connection check response: " + reason)
        , _payload(payload) {}

    auto get_payload() const -> const std::string& { return _payload; }

private:
    std::string _payload;
};

class message_format_exception : public reachability_exception {
public:
    explicit message_format_exception(const std::string& message)
        : reachability_exception(message) {}
};

// Raised by a checker with no failure callback once its retries are exhausted.
// caller_skip is the number of stack frames between the assertion and the
// test code that declared the check.
class connectivity_check_failed : public reachability_exception {
public:
    connectivity_check_failed(const std::string& message, int caller_skip)
        : reachability_exception(message)
        , _caller_skip(caller_skip) {}

    auto caller_skip() const -> int { return _caller_skip; }

private:
    int _caller_skip;
};

} // namespace reachability
