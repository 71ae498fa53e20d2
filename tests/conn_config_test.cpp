#define BOOST_TEST_MODULE conn_config_test
#include <boost/test/unit_test.hpp>

#include <reachability/conn_config.hpp>

#include <string>

using namespace reachability;

BOOST_AUTO_TEST_SUITE(conn_config_tests)

BOOST_AUTO_TEST_CASE(messages_carry_prefix_and_sequence) {
    conn_config config{.type = connection_type_stream, .id = "c1"};

    BOOST_CHECK_EQUAL(config.message_prefix(), "stream:c1~");
    BOOST_CHECK_EQUAL(config.test_message(0), "stream:c1~0");
    BOOST_CHECK_EQUAL(config.test_message(42), "stream:c1~42");
}

BOOST_AUTO_TEST_CASE(sequence_is_extracted_ignoring_whitespace) {
    conn_config config{.type = connection_type_ping, .id = "p7"};

    BOOST_CHECK_EQUAL(config.message_sequence("ping:p7~17"), 17);
    BOOST_CHECK_EQUAL(config.message_sequence("  ping:p7~3\n"), 3);
    BOOST_CHECK_EQUAL(config.message_sequence(config.test_message(999)), 999);
}

BOOST_AUTO_TEST_CASE(foreign_prefix_is_rejected) {
    conn_config config{.type = connection_type_stream, .id = "c1"};

    BOOST_CHECK_EXCEPTION(config.message_sequence("stream:c2~1"), message_format_exception,
        [](const message_format_exception& e) {
            return std::string(e.what()) == "invalid message prefix format:stream:c2~1";
        });
    BOOST_CHECK_THROW(config.message_sequence("ping:c1~1"), message_format_exception);
}

BOOST_AUTO_TEST_CASE(bad_sequence_is_rejected) {
    conn_config config{.type = connection_type_stream, .id = "c1"};

    BOOST_CHECK_EXCEPTION(config.message_sequence("stream:c1~abc"), message_format_exception,
        [](const message_format_exception& e) {
            return std::string(e.what()) == "invalid message sequence format:stream:c1~abc";
        });
    BOOST_CHECK_THROW(config.message_sequence("stream:c1~"), message_format_exception);
    BOOST_CHECK_THROW(config.message_sequence("stream:c1~12x"), message_format_exception);
    BOOST_CHECK_THROW(config.message_sequence("stream:c1~-4"), message_format_exception);
}

BOOST_AUTO_TEST_CASE(stream_messages_are_recognised) {
    BOOST_CHECK(is_message_part_of_stream("stream:c1~5"));
    BOOST_CHECK(is_message_part_of_stream(" stream:other~0"));
    BOOST_CHECK(!is_message_part_of_stream("ping:c1~5"));
    BOOST_CHECK(!is_message_part_of_stream(""));
}

BOOST_AUTO_TEST_SUITE_END()
