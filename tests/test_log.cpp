#include <catch2/catch_test_macros.hpp>
#include "core/log.hpp"
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {

struct CapturedLog {
    std::vector<std::pair<wv::log::Level, std::string>> lines;

    CapturedLog() {
        wv::log::set_sink([this](wv::log::Level lvl, const std::string& msg) { lines.emplace_back(lvl, msg); });
    }
    ~CapturedLog() {
        wv::log::set_sink(nullptr);
        wv::log::set_level(wv::log::Level::Info);
    }
};

} // namespace

TEST_CASE("log sink receives level and message", "[log]") {
    CapturedLog cap;
    wv::log::info("Image saved: out.png");
    wv::log::error("Error playing audio: boom");
    REQUIRE(cap.lines.size() == 2);
    REQUIRE(cap.lines[0].first == wv::log::Level::Info);
    REQUIRE(cap.lines[0].second == "Image saved: out.png");
    REQUIRE(cap.lines[1].first == wv::log::Level::Error);
}

TEST_CASE("log level filters quieter messages", "[log]") {
    CapturedLog cap;
    wv::log::set_level(wv::log::Level::Warn);
    wv::log::debug("hidden");
    wv::log::info("hidden too");
    wv::log::warn("shown");
    REQUIRE(cap.lines.size() == 1);
    REQUIRE(cap.lines[0].second == "shown");
    REQUIRE(wv::log::level() == wv::log::Level::Warn);
}

TEST_CASE("json mode writes one escaped object per line", "[log]") {
    std::ostringstream captured;
    auto* old = std::clog.rdbuf(captured.rdbuf());
    wv::log::set_json_mode(true);
    wv::log::warn("say \"hi\" to C:\\tmp");
    wv::log::set_json_mode(false);
    std::clog.rdbuf(old);

    const std::string line = captured.str();
    REQUIRE(line.find("\"level\":\"warn\"") != std::string::npos);
    REQUIRE(line.find("say \\\"hi\\\" to C:\\\\tmp") != std::string::npos);
    REQUIRE(line.find("\"ts\":\"") != std::string::npos);
    REQUIRE(line.back() == '\n');
}

TEST_CASE("json mode escapes control characters", "[log]") {
    std::ostringstream captured;
    auto* old = std::clog.rdbuf(captured.rdbuf());
    wv::log::set_json_mode(true);
    wv::log::info(std::string("a\tb\rc") + '\x01' + "d");
    wv::log::set_json_mode(false);
    std::clog.rdbuf(old);

    const std::string line = captured.str();
    REQUIRE(line.find("a\\tb\\rc\\u0001d") != std::string::npos);
    // Only the terminating newline may be a raw control character.
    for (std::size_t i = 0; i + 1 < line.size(); ++i) {
        REQUIRE(static_cast<unsigned char>(line[i]) >= 0x20);
    }
}

TEST_CASE("level names", "[log]") {
    REQUIRE(std::string(wv::log::level_name(wv::log::Level::Trace)) == "trace");
    REQUIRE(std::string(wv::log::level_name(wv::log::Level::Critical)) == "critical");
}
