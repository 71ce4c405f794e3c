#include "app/application.hpp"
#include "audio/sound_player.hpp"
#include "ui/main_window.hpp"
#include "core/log.hpp"
#include <QMessageBox>

namespace wv::app {

Application* Application::instance_ = nullptr;

Application::Application(int& argc, char** argv, wv::config::ViewerConfig config)
    : QApplication(argc, argv)
    , config_(std::move(config))
    , load_failure_reporter_(&Application::default_load_failure_reporter)
{
    instance_ = this;

    setApplicationName("Wave Viewer");
    setApplicationVersion("0.1.0");

    wv::log::info("Application starting");
}

Application::~Application() {
    // Window (and its playback thread) must go before the QApplication base.
    main_window_.reset();
    wv::log::info("Application shutting down");
    instance_ = nullptr;
}

Application* Application::instance() {
    return instance_;
}

bool Application::start() {
    if (!load_source()) {
        return false;
    }
    create_main_window();
    return true;
}

int Application::run() {
    if (!start()) {
        report_load_failure();
        return 1;
    }

    main_window_->show();

    wv::log::info("Entering Qt event loop...");
    int result = exec();
    wv::log::info("Qt event loop exited with code: " + std::to_string(result));
    return result;
}

bool Application::load_source() {
    wv::audio::LoadOptions options;
    options.silence_policy = config_.silence_policy;

    auto loaded = wv::audio::load_audio(config_.wav_path, options);
    if (!loaded) {
        load_error_ = loaded.error();
        wv::log::error(std::string("Error loading audio [") + wv::audio::to_string(load_error_->kind)
                       + "]: " + load_error_->message);
        return false;
    }
    audio_ = std::move(loaded).value();
    load_error_.reset();
    return true;
}

void Application::create_main_window() {
    player_ = wv::audio::SoundPlayer::create();
    main_window_ = std::make_unique<wv::ui::MainWindow>(*audio_, config_, player_);
    wv::log::info("Main window created");
}

void Application::set_load_failure_reporter(LoadFailureReporter reporter) {
    load_failure_reporter_ = reporter ? std::move(reporter)
                                      : LoadFailureReporter(&Application::default_load_failure_reporter);
}

void Application::report_load_failure() {
    if (!load_error_) return;
    load_failure_reporter_(*load_error_);
}

void Application::default_load_failure_reporter(const wv::audio::LoadError& error) {
    QMessageBox::critical(nullptr, tr("Error loading audio"),
                          QString::fromStdString(error.message));
}

} // namespace wv::app
