// tests/log/test_logger.cpp
#define BOOST_TEST_MODULE LoggerTests
#include <boost/core/null_deleter.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/smart_ptr/make_shared.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>
#include <boost/test/unit_test.hpp>
#include <sstream>
#include <string>

#include "weave/di/container.hpp"
#include "weave/log/log_config.hpp"
#include "weave/log/logger.hpp"

namespace logging = boost::log;
namespace sinks = boost::log::sinks;
namespace expr = boost::log::expressions;

// Sink backend writing records to a stringstream
class StringStreamBackend : public sinks::text_ostream_backend {
public:
    explicit StringStreamBackend(std::ostream& os) {
        add_stream(boost::shared_ptr<std::ostream>(&os, boost::null_deleter()));
    }
};

std::stringstream g_log_stream;
boost::shared_ptr<sinks::synchronous_sink<StringStreamBackend>> g_test_sink;

void clear_log_stream() {
    g_log_stream.str("");
    g_log_stream.clear();
}

void attach_test_sink() {
    logging::core::get()->add_sink(g_test_sink);
}

void set_trace_filter() {
    logging::core::get()->set_filter(
        expr::attr<logging::trivial::severity_level>("Severity") >=
        logging::trivial::trace);
}

struct LogFixture {
    LogFixture() {
        clear_log_stream();
        logging::core::get()->remove_all_sinks();

        g_test_sink =
            boost::make_shared<sinks::synchronous_sink<StringStreamBackend>>(
                boost::make_shared<StringStreamBackend>(g_log_stream));
        g_test_sink->set_formatter(
            expr::stream << expr::attr<logging::trivial::severity_level>(
                                "Severity")
                         << ": " << expr::smessage);
        attach_test_sink();
        set_trace_filter();

        logging::add_common_attributes();
    }

    ~LogFixture() {
        logging::core::get()->remove_sink(g_test_sink);
        g_test_sink.reset();
    }
};

BOOST_GLOBAL_FIXTURE(LogFixture);

BOOST_AUTO_TEST_SUITE(LoggerTestSuite)

// ============================================================================
// Macros
// ============================================================================

BOOST_AUTO_TEST_CASE(test_log_info_message) {
    clear_log_stream();
    WEAVE_LOG_INFO << "This is an info message.";
    BOOST_CHECK(g_log_stream.str().find("info: This is an info message.") !=
                std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_log_debug_message) {
    clear_log_stream();
    WEAVE_LOG_DEBUG << "This is a debug message.";
    BOOST_CHECK(g_log_stream.str().find("debug: This is a debug message.") !=
                std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_log_level_filtering) {
    clear_log_stream();
    weave::log::Logger::set_level(weave::log::LogConfig::LogLevel::WARN);

    WEAVE_LOG_INFO << "This info message should not appear.";
    WEAVE_LOG_WARN << "This warning message should appear.";
    WEAVE_LOG_ERROR << "This error message should also appear.";

    BOOST_CHECK(g_log_stream.str().find("should not appear") ==
                std::string::npos);
    BOOST_CHECK(g_log_stream.str().find(
                    "warning: This warning message should appear.") !=
                std::string::npos);
    BOOST_CHECK(g_log_stream.str().find(
                    "error: This error message should also appear.") !=
                std::string::npos);

    set_trace_filter();
}

// ============================================================================
// Init / shutdown
// ============================================================================

BOOST_AUTO_TEST_CASE(test_logger_init_shutdown) {
    weave::log::LogConfig config;
    config.global_level = weave::log::LogConfig::LogLevel::WARN;
    config.console.enabled = false;
    config.file.enabled = false;

    // init replaces every sink, including ours
    weave::log::Logger::init(config);
    attach_test_sink();
    clear_log_stream();

    WEAVE_LOG_INFO << "Filtered after init";
    WEAVE_LOG_ERROR << "Kept after init";
    BOOST_CHECK(g_log_stream.str().find("Filtered after init") ==
                std::string::npos);
    BOOST_CHECK(g_log_stream.str().find("error: Kept after init") !=
                std::string::npos);

    set_trace_filter();
    clear_log_stream();
    weave::log::Logger::shutdown();
    BOOST_CHECK(g_log_stream.str().find("debug: Logger shutting down") !=
                std::string::npos);

    attach_test_sink();
}

BOOST_AUTO_TEST_CASE(test_init_rejects_invalid_config) {
    weave::log::LogConfig config;
    config.file.enabled = true;
    config.file.log_file = "";

    BOOST_CHECK_THROW(weave::log::Logger::init(config), std::invalid_argument);
}

// ============================================================================
// Levels and patterns
// ============================================================================

BOOST_AUTO_TEST_CASE(test_level_from_string) {
    using Level = weave::log::LogConfig::LogLevel;

    BOOST_CHECK(weave::log::Logger::level_from_string("trace") == Level::TRACE);
    BOOST_CHECK(weave::log::Logger::level_from_string("DEBUG") == Level::DEBUG);
    BOOST_CHECK(weave::log::Logger::level_from_string("warning") == Level::WARN);
    BOOST_CHECK(weave::log::Logger::level_from_string("critical") ==
                Level::FATAL);
    BOOST_CHECK_THROW(weave::log::Logger::level_from_string("verbose"),
                      std::invalid_argument);
    BOOST_CHECK_EQUAL(weave::log::LogConfig::level_to_string(Level::ERROR),
                      "error");
}

BOOST_AUTO_TEST_CASE(test_normalize_pattern) {
    BOOST_CHECK_EQUAL(
        weave::log::Logger::normalize_pattern("[%Y-%m-%d %H:%M:%S.%f] [%l] %v"),
        "[%TimeStamp%] [%Severity%] %Message%");
    BOOST_CHECK_EQUAL(weave::log::Logger::normalize_pattern("[%t] %v"),
                      "[%ThreadID%] %Message%");

    const std::string native = "[%Severity%] %Message%";
    BOOST_CHECK_EQUAL(weave::log::Logger::normalize_pattern(native), native);
}

// ============================================================================
// Container diagnostics
// ============================================================================

namespace billing {
class PaymentGateway {};
}  // namespace billing

namespace shipping {
class PaymentGateway {};
}  // namespace shipping

BOOST_AUTO_TEST_CASE(test_container_warns_about_ambiguous_names) {
    clear_log_stream();

    weave::di::Container container;
    container.add_singleton<billing::PaymentGateway>()
        .add_singleton<shipping::PaymentGateway>();
    auto provider = container.build_provider();

    BOOST_CHECK(!provider->contains("payment_gateway"));
    BOOST_CHECK(g_log_stream.str().find(
                    "warning: Name 'payment_gateway' refers to 2 services") !=
                std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
