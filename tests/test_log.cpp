#include <catch2/catch.hpp>
#include <weft/log.hpp>
#include <cstdio>
#include <functional>
#include <string>

using namespace weft::log;

// Helper: capture log output from a callable through a temporary sink
static std::string capture_log(std::function<void()> fn) {
    std::FILE* tmp = std::tmpfile();
    REQUIRE(tmp != nullptr);
    set_sink(tmp);
    fn();
    set_sink(nullptr);

    std::fflush(tmp);
    std::rewind(tmp);
    std::string output;
    char buf[1024];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), tmp)) > 0) {
        output.append(buf, n);
    }
    std::fclose(tmp);
    return output;
}

TEST_CASE("set_level / get_level roundtrip", "[log]") {
    for (Level lvl : {Trace, Debug, Info, Warn, Error, Off}) {
        set_level(lvl);
        REQUIRE(get_level() == lvl);
    }
    set_level(Warn);
}

TEST_CASE("level_name() returns correct strings", "[log]") {
    REQUIRE(std::string(level_name(Trace)) == "trace");
    REQUIRE(std::string(level_name(Debug)) == "debug");
    REQUIRE(std::string(level_name(Info)) == "info");
    REQUIRE(std::string(level_name(Warn)) == "warn");
    REQUIRE(std::string(level_name(Error)) == "error");
    REQUIRE(std::string(level_name(Off)) == "off");
}

TEST_CASE("parse_level() accepts names in any case", "[log]") {
    REQUIRE(parse_level("debug").value() == Debug);
    REQUIRE(parse_level("WARN").value() == Warn);
    auto bad = parse_level("loud");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == weft::WeftError::InvalidArg);
}

TEST_CASE("set_color_enabled / is_color_enabled", "[log]") {
    set_color_enabled(true);
    REQUIRE(is_color_enabled() == true);
    set_color_enabled(false);
    REQUIRE(is_color_enabled() == false);
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    set_level(Warn);
    set_color_enabled(false);
    auto output = capture_log([] { info("should not appear"); });
    REQUIRE(output.empty());
}

TEST_CASE("Messages at and above threshold are emitted", "[log]") {
    set_level(Warn);
    set_color_enabled(false);
    auto output = capture_log([] {
        warn("this is a warning");
        error("this is an error");
    });
    REQUIRE(output.find("weft warn: this is a warning") != std::string::npos);
    REQUIRE(output.find("weft error: this is an error") != std::string::npos);
}

TEST_CASE("Off silences everything", "[log]") {
    set_level(Off);
    auto output = capture_log([] { error("nothing"); });
    REQUIRE(output.empty());
    set_level(Warn);
}

TEST_CASE("Format string substitution", "[log]") {
    set_level(Info);
    set_color_enabled(false);
    auto output = capture_log([] { info("rules: %d, name: %s", 42, "expr"); });
    REQUIRE(output.find("rules: 42") != std::string::npos);
    REQUIRE(output.find("name: expr") != std::string::npos);
    set_level(Warn);
}
