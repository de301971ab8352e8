// ferry_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <ferry/core/log.hpp>
#include <spdlog/sinks/ostream_sink.h>

#include <algorithm>
#include <sstream>

using namespace ferry_core;

TEST_CASE("Log level parsing", "[core][log]") {
    SECTION("known names") {
        REQUIRE(parse_log_level("trace") == spdlog::level::trace);
        REQUIRE(parse_log_level("debug") == spdlog::level::debug);
        REQUIRE(parse_log_level("info") == spdlog::level::info);
        REQUIRE(parse_log_level("warning") == spdlog::level::warn);
        REQUIRE(parse_log_level("err") == spdlog::level::err);
        REQUIRE(parse_log_level("fatal") == spdlog::level::critical);
        REQUIRE(parse_log_level("off") == spdlog::level::off);
    }

    SECTION("unknown name") {
        REQUIRE_FALSE(parse_log_level("verbose").has_value());
    }

    SECTION("names round trip") {
        REQUIRE(std::string(log_level_name(spdlog::level::warn)) == "warn");
        REQUIRE(parse_log_level(log_level_name(spdlog::level::err)) == spdlog::level::err);
    }
}

TEST_CASE("Named loggers", "[core][log]") {
    SECTION("same name returns the same logger") {
        auto a = get_logger("ferry_test_named");
        auto b = get_logger("ferry_test_named");
        REQUIRE(a == b);
        REQUIRE(a->name() == "ferry_test_named");
    }

    SECTION("module loggers") {
        REQUIRE(bundle_logger()->name() == "ferry_bundle");
        REQUIRE(publish_logger()->name() == "ferry_publish");
        REQUIRE(core_logger()->name() == "ferry_core");
    }
}

TEST_CASE("Log level management", "[core][log]") {
    auto previous = current_log_config();

    set_global_log_level(spdlog::level::warn);
    REQUIRE(current_log_config().level == spdlog::level::warn);
    REQUIRE(bundle_logger()->level() == spdlog::level::warn);
    REQUIRE(publish_logger()->level() == spdlog::level::warn);

    configure_logging(previous);
    REQUIRE(current_log_config().level == previous.level);
    REQUIRE(bundle_logger()->level() == previous.level);
}

TEST_CASE("configure_logging without sinks", "[core][log]") {
    auto previous = current_log_config();

    LogConfig quiet;
    quiet.console_enabled = false;
    quiet.level = spdlog::level::debug;
    configure_logging(quiet);

    auto logger = get_logger("ferry_test_sinkless");
    REQUIRE(logger->sinks().empty());
    REQUIRE(logger->level() == spdlog::level::debug);
    REQUIRE_FALSE(current_log_config().console_enabled);

    configure_logging(previous);
}

namespace {

/// Routes a logger's output into a string stream for the lifetime of the capture
class LogCapture {
public:
    LogCapture(const std::string& logger_name, spdlog::level::level_enum level)
        : m_logger(get_logger(logger_name))
        , m_sink(std::make_shared<spdlog::sinks::ostream_sink_mt>(m_out)) {
        m_sink->set_pattern("%v");
        m_logger->sinks().push_back(m_sink);
        m_logger->set_level(level);
    }

    ~LogCapture() {
        auto& sinks = m_logger->sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), m_sink), sinks.end());
    }

    std::string text() {
        m_logger->flush();
        return m_out.str();
    }

private:
    std::ostringstream m_out;
    std::shared_ptr<spdlog::logger> m_logger;
    std::shared_ptr<spdlog::sinks::ostream_sink_mt> m_sink;
};

} // anonymous namespace

TEST_CASE("Structured logging", "[core][log]") {
    LogCapture capture("ferry_test_structured", spdlog::level::info);

    SECTION("fields are appended") {
        log_structured(spdlog::level::info, "ferry_test_structured", "published",
            {{"bundle", "app"}, {"hash", "1a2b3c"}});
        REQUIRE(capture.text().find("published {bundle=\"app\", hash=\"1a2b3c\"}") != std::string::npos);
    }

    SECTION("no fields, no braces") {
        log_structured(spdlog::level::warn, "ferry_test_structured", "plain", {});
        REQUIRE(capture.text().find("plain\n") != std::string::npos);
    }

    SECTION("below level is dropped") {
        log_structured(spdlog::level::debug, "ferry_test_structured", "hidden", {});
        REQUIRE(capture.text().empty());
    }
}

TEST_CASE("Log scope", "[core][log]") {
    LogCapture capture("ferry_test_scope", spdlog::level::trace);

    {
        LogScope scope("register", "ferry_test_scope");
    }

    auto text = capture.text();
    REQUIRE(text.find(">>> Entering register") != std::string::npos);
    REQUIRE(text.find("<<< Exiting register") != std::string::npos);
}
