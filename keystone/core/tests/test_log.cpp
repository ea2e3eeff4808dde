#include <catch2/catch_test_macros.hpp>
#include <keystone/core/log.hpp>
#include <string>
#include <vector>

using namespace keystone::core;

namespace {

struct CapturedLine {
    LogLevel level;
    std::string category;
    std::string message;
};

class CaptureSink : public ILogSink {
public:
    CaptureSink() {
        add_log_sink(this);
        set_console_output(false);
    }
    ~CaptureSink() override {
        remove_log_sink(this);
        set_console_output(true);
    }

    void log(LogLevel level, const std::string& category, const std::string& message) override {
        lines.push_back({level, category, message});
    }

    std::vector<CapturedLine> lines;
};

} // namespace

TEST_CASE("Log sinks receive formatted messages", "[core][log]") {
    LogLevel previous = get_log_level();
    set_log_level(LogLevel::Trace);
    CaptureSink sink;

    SECTION("Format arguments are substituted") {
        log(LogLevel::Info, "[DI] Registered {} as {}", "ITimeService", "Singleton");
        REQUIRE(sink.lines.size() == 1);
        REQUIRE(sink.lines[0].message == "[DI] Registered ITimeService as Singleton");
        REQUIRE(sink.lines[0].level == LogLevel::Info);
    }

    SECTION("Bracketed prefix becomes the category") {
        log(LogLevel::Warn, "[Locator] cache miss");
        log(LogLevel::Warn, "no tag here");
        log(LogLevel::Warn, "[unterminated tag");
        REQUIRE(sink.lines.size() == 3);
        REQUIRE(sink.lines[0].category == "Locator");
        REQUIRE(sink.lines[1].category.empty());
        REQUIRE(sink.lines[2].category.empty());
    }

    SECTION("Messages below the minimum level are dropped") {
        set_log_level(LogLevel::Error);
        log(LogLevel::Info, "[Init] {} managers", 3);
        log(LogLevel::Error, "[Init] failed");
        REQUIRE(sink.lines.size() == 1);
        REQUIRE(sink.lines[0].level == LogLevel::Error);
    }

    set_log_level(previous);
}

TEST_CASE("Removed sinks stop receiving", "[core][log]") {
    std::vector<std::string> received;
    struct VectorSink : ILogSink {
        std::vector<std::string>* out;
        void log(LogLevel, const std::string&, const std::string& message) override {
            out->push_back(message);
        }
    } sink;
    sink.out = &received;

    add_log_sink(&sink);
    log(LogLevel::Error, "[Test] first");
    remove_log_sink(&sink);
    log(LogLevel::Error, "[Test] second");

    REQUIRE(received == std::vector<std::string>{"[Test] first"});
    REQUIRE(std::string(log_level_name(LogLevel::Fatal)) == "FATAL");
}
