#include <catch2/catch_test_macros.hpp>
#include "config/viewer_config.hpp"
#include "core/log.hpp"

TEST_CASE("default config carries the compiled defaults", "[config]") {
    const auto cfg = wv::config::default_config();
    REQUIRE_FALSE(cfg.wav_path.empty());
    REQUIRE(cfg.window_title == "Sound Wave Viewer");
    REQUIRE(cfg.chart_width == 1000);
    REQUIRE(cfg.chart_height == 400);
}

TEST_CASE("apply_logging drives the log facade", "[config]") {
    auto cfg = wv::config::default_config();
    cfg.json_log = true;
    cfg.log_level = wv::log::Level::Error;
    wv::config::apply_logging(cfg);
    REQUIRE(wv::log::json_mode());
    REQUIRE(wv::log::level() == wv::log::Level::Error);

    wv::log::set_json_mode(false);
    wv::log::set_level(wv::log::Level::Info);
}
