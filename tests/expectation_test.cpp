#define BOOST_TEST_MODULE expectation_test
#include <boost/test/unit_test.hpp>

#include <reachability/endpoint.hpp>
#include <reachability/expectation.hpp>
#include "reachability_test_utilities.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace reachability;
using test_utilities::probe_call;
using test_utilities::scripted_endpoint;

namespace {
    auto blank_expectation(const scripted_endpoint& source) -> expectation {
        return expectation{
            .source = source_handle(source),
            .target = source.to_matcher(std::nullopt),
            .expected_reachable = true
        };
    }
}

BOOST_AUTO_TEST_SUITE(expectation_option_tests)

BOOST_AUTO_TEST_CASE(options_apply_in_order_and_last_one_wins) {
    auto source = scripted_endpoint::reachable("w0", "10.0.0.1");
    auto exp = blank_expectation(source);

    std::vector<expectation_option> options{
        with_send_len(10),
        with_client_adjusted_mtu(1500, 1400),
        with_send_len(20),
        with_recv_len(30),
        with_client_adjusted_mtu(9000, 1500),
    };
    for (const auto& option : options) {
        option(exp);
    }

    BOOST_CHECK_EQUAL(exp.send_len, 20);
    BOOST_CHECK_EQUAL(exp.recv_len, 30);
    BOOST_CHECK_EQUAL(exp.client_mtu_start, 9000);
    BOOST_CHECK_EQUAL(exp.client_mtu_end, 1500);
}

BOOST_AUTO_TEST_CASE(source_ips_replace_rather_than_append) {
    auto source = scripted_endpoint::reachable("w0", "10.0.0.1");
    auto exp = blank_expectation(source);
    exp.expected_source_ips = {"10.0.0.1"};

    with_source_ips("172.16.0.5", std::string("172.16.0.6"))(exp);
    BOOST_CHECK_EQUAL(exp.expected_source_ips.size(), 2u);
    BOOST_CHECK_EQUAL(exp.expected_source_ips[0], "172.16.0.5");
    BOOST_CHECK_EQUAL(exp.expected_source_ips[1], "172.16.0.6");

    with_source_ips(std::vector<std::string>{"192.168.0.1"})(exp);
    BOOST_REQUIRE_EQUAL(exp.expected_source_ips.size(), 1u);
    BOOST_CHECK_EQUAL(exp.expected_source_ips[0], "192.168.0.1");
}

BOOST_AUTO_TEST_CASE(loss_option_records_bounds) {
    auto source = scripted_endpoint::reachable("w0", "10.0.0.1");
    auto exp = blank_expectation(source);
    BOOST_CHECK(!exp.expected_loss.is_set());

    with_loss(std::chrono::seconds{30}, 2.5, -1)(exp);

    BOOST_CHECK(exp.expected_loss.is_set());
    BOOST_CHECK(exp.expected_loss.duration == std::chrono::seconds{30});
    BOOST_CHECK_EQUAL(exp.expected_loss.max_percent, 2.5);
    BOOST_CHECK_EQUAL(exp.expected_loss.max_count, -1);
}

BOOST_AUTO_TEST_CASE(loss_validation) {
    BOOST_CHECK_EXCEPTION(with_loss(std::chrono::seconds{0}, 10.0, -1), configuration_exception,
        [](const configuration_exception& e) {
            return std::string(e.what()) == "Packet loss test must have a duration";
        });
    BOOST_CHECK_THROW(with_loss(std::chrono::seconds{-3}, 10.0, -1), configuration_exception);
    BOOST_CHECK_EXCEPTION(with_loss(std::chrono::seconds{5}, 100.5, -1), configuration_exception,
        [](const configuration_exception& e) {
            return std::string(e.what()).starts_with("Loss percentage should be <=100");
        });
    BOOST_CHECK_EXCEPTION(with_loss(std::chrono::seconds{5}, -1.0, -1), configuration_exception,
        [](const configuration_exception& e) {
            return std::string(e.what()) == "Either loss count or percent must be specified";
        });

    BOOST_CHECK_NO_THROW(with_loss(std::chrono::seconds{5}, 100.0, -1));
    BOOST_CHECK_NO_THROW(with_loss(std::chrono::seconds{5}, -1.0, 0));
    BOOST_CHECK_NO_THROW(with_loss(std::chrono::seconds{5}, 0.0, -1));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(endpoint_tests)

BOOST_AUTO_TEST_CASE(target_ip_requires_explicit_port) {
    target_ip target("192.168.10.4");

    BOOST_CHECK_EXCEPTION(target.to_matcher(std::nullopt), configuration_exception,
        [](const configuration_exception& e) {
            return std::string(e.what()) ==
                   "Explicit port needed with IP as a connectivity target: 192.168.10.4";
        });

    auto matcher = target.to_matcher(port_number{53});
    BOOST_CHECK_EQUAL(matcher.ip, "192.168.10.4");
    BOOST_CHECK_EQUAL(matcher.port, "53");
    BOOST_CHECK_EQUAL(matcher.target_name, "192.168.10.4:53");
    BOOST_CHECK(!matcher.protocol.has_value());
}

BOOST_AUTO_TEST_CASE(effective_protocol_resolution) {
    target_matcher matcher{.ip = "10.0.0.2", .port = "80", .target_name = "web", .protocol = std::nullopt};
    BOOST_CHECK_EQUAL(matcher.effective_protocol("udp"), "udp");
    BOOST_CHECK_EQUAL(matcher.effective_protocol(""), "tcp");

    matcher.protocol = "sctp";
    BOOST_CHECK_EQUAL(matcher.effective_protocol("udp"), "sctp");
}

BOOST_AUTO_TEST_CASE(source_handle_forwards_to_the_source) {
    auto source = scripted_endpoint::reachable("w0", "10.0.0.1");
    source_handle handle(source);

    BOOST_CHECK_EQUAL(handle.source_name(), "w0");
    BOOST_REQUIRE_EQUAL(handle.source_ips().size(), 1u);

    auto outcome = handle.probe("10.0.0.2", "8055", "tcp", probe_options{});
    BOOST_CHECK(outcome.has_value());
    BOOST_CHECK_EQUAL(source.call_count(), 1u);

    // A copy of the handle refers to the same source
    auto copy = handle;
    copy.probe("10.0.0.2", "8055", "tcp", probe_options{});
    BOOST_CHECK_EQUAL(source.call_count(), 2u);
}

BOOST_AUTO_TEST_CASE(handle_keeps_its_own_copy_of_the_source) {
    std::optional<source_handle> handle;
    {
        handle.emplace(scripted_endpoint::reachable("temporary", "10.0.0.5"));
    }
    BOOST_CHECK_EQUAL(handle->source_name(), "temporary");
    BOOST_REQUIRE_EQUAL(handle->source_ips().size(), 1u);
    BOOST_CHECK_EQUAL(handle->source_ips()[0], "10.0.0.5");
    BOOST_CHECK(handle->probe("10.0.0.2", "8055", "tcp", probe_options{}).has_value());
}

BOOST_AUTO_TEST_CASE(shared_source_handle_keeps_source_alive) {
    std::optional<source_handle> handle;
    {
        auto owned = std::make_shared<const scripted_endpoint>(
            scripted_endpoint::reachable("owned", "10.0.0.9"));
        handle.emplace(owned);
    }
    BOOST_CHECK_EQUAL(handle->source_name(), "owned");
    BOOST_CHECK(handle->probe("10.0.0.2", "8055", "tcp", probe_options{}).has_value());
}

BOOST_AUTO_TEST_CASE(have_connectivity_to_probes_once) {
    auto source = scripted_endpoint::reachable("w0", "10.0.0.1");
    auto silent = scripted_endpoint::unreachable("w1", "10.0.0.2");

    BOOST_CHECK(have_connectivity_to(source, silent));
    BOOST_CHECK(!have_connectivity_to(silent, source, port_number{443}));
    BOOST_CHECK(have_connectivity_to(source, target_ip("8.8.8.8"), port_number{53}));

    auto calls = source.calls();
    BOOST_REQUIRE_EQUAL(calls.size(), 2u);
    BOOST_CHECK_EQUAL(calls[0].port, "8055");
    BOOST_CHECK_EQUAL(calls[0].protocol, "tcp");
    BOOST_CHECK_EQUAL(calls[1].ip, "8.8.8.8");
    BOOST_CHECK_EQUAL(silent.calls().at(0).port, "443");
}

BOOST_AUTO_TEST_CASE(connectivity_messages) {
    target_matcher matcher{.ip = "10.0.0.2", .port = "8055", .target_name = "w1", .protocol = std::nullopt};

    BOOST_CHECK_EQUAL(failure_message("w0", matcher),
                      "Expected w0\nto have connectivity to w1\n\t10.0.0.2:8055\nbut it does not");
    BOOST_CHECK_EQUAL(negated_failure_message("w0", matcher),
                      "Expected w0\nnot to have connectivity to w1\n\t10.0.0.2:8055\nbut it does");
}

BOOST_AUTO_TEST_SUITE_END()
