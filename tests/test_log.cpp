#include <catch2/catch.hpp>
#include <logtmpl/log.hpp>
#include <logtmpl/template_parser.hpp>
#include <string>
#include <utility>
#include <vector>

using namespace logtmpl::log;

// Helper: collect messages routed through the sink while fn runs
static std::vector<std::pair<Level, std::string>> capture(std::function<void()> fn) {
    std::vector<std::pair<Level, std::string>> lines;
    set_sink([&lines](Level lvl, const std::string& msg) {
        lines.emplace_back(lvl, msg);
    });
    fn();
    set_sink(nullptr);
    return lines;
}

TEST_CASE("set_level / get_level roundtrip", "[log]") {
    set_level(Trace);
    REQUIRE(get_level() == Trace);

    set_level(Error);
    REQUIRE(get_level() == Error);

    set_level(Info);
    REQUIRE(get_level() == Info);
}

TEST_CASE("level_name() and parse_level() agree", "[log]") {
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        REQUIRE(parse_level(level_name(lvl)) == lvl);
    }
    REQUIRE(std::string(level_name(Warn)) == "warn");
    REQUIRE_FALSE(parse_level("verbose").has_value());
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    set_level(Warn);
    auto lines = capture([] {
        info("should not appear");
    });
    REQUIRE(lines.empty());
    set_level(Info);
}

TEST_CASE("Messages at or above threshold reach the sink", "[log]") {
    set_level(Warn);
    auto lines = capture([] {
        warn("this is a warning");
        error("this is an error");
    });
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0].first == Warn);
    REQUIRE(lines[0].second == "this is a warning");
    REQUIRE(lines[1].first == Error);
    set_level(Info);
}

TEST_CASE("Format string substitution", "[log]") {
    auto lines = capture([] {
        info("value: %d, name: %s", 42, "test");
    });
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].second == "value: 42, name: test");
}

TEST_CASE("Parser reports placeholder count at trace level", "[log]") {
    set_level(Trace);
    auto lines = capture([] {
        logtmpl::parse_template("{A} {B}");
    });
    set_level(Info);
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].first == Trace);
    REQUIRE(lines[0].second.find("2 placeholder(s)") != std::string::npos);
}
