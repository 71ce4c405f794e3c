#include <catch2/catch_test_macros.hpp>
#include "app/application.hpp"
#include "config/viewer_config.hpp"
#include <QtGlobal>
#include <string>
#include <vector>

namespace {

const char* kMissingWav = "this_wav_should_not_exist_12345.wav";

int& test_argc() {
    static int argc = 1;
    return argc;
}

char** test_argv() {
    static char name[] = "wv_app_tests";
    static char* argv[] = {name, nullptr};
    return argv;
}

void use_offscreen_platform() {
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }
}

} // namespace

TEST_CASE("missing audio file stops startup before any window is built", "[app]") {
    use_offscreen_platform();
    auto cfg = wv::config::default_config();
    cfg.wav_path = kMissingWav;
    wv::app::Application app(test_argc(), test_argv(), cfg);

    REQUIRE_FALSE(app.start());
    REQUIRE(app.main_window() == nullptr);
    REQUIRE(app.load_error().has_value());
    REQUIRE(app.load_error()->kind == wv::audio::LoadErrorKind::FileNotFound);
    REQUIRE(wv::app::Application::instance() == &app);
}

TEST_CASE("run reports a load failure once and exits with code 1", "[app]") {
    use_offscreen_platform();
    auto cfg = wv::config::default_config();
    cfg.wav_path = kMissingWav;
    wv::app::Application app(test_argc(), test_argv(), cfg);

    std::vector<wv::audio::LoadError> reported;
    app.set_load_failure_reporter([&](const wv::audio::LoadError& error) { reported.push_back(error); });

    REQUIRE(app.run() == 1);
    REQUIRE(reported.size() == 1);
    REQUIRE(reported.front().kind == wv::audio::LoadErrorKind::FileNotFound);
    REQUIRE(reported.front().message.find(kMissingWav) != std::string::npos);
    REQUIRE(app.main_window() == nullptr);
}
