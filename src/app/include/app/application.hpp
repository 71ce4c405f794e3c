#pragma once
#include "audio/audio_buffer.hpp"
#include "config/viewer_config.hpp"
#include <QApplication>
#include <functional>
#include <memory>
#include <optional>

namespace wv::ui { class MainWindow; }
namespace wv::audio { class SoundPlayer; }

namespace wv::app {

class Application : public QApplication {
    Q_OBJECT

public:
    // Tells the user why startup failed; the default shows a critical message box.
    using LoadFailureReporter = std::function<void(const wv::audio::LoadError& error)>;

    Application(int& argc, char** argv, wv::config::ViewerConfig config);
    ~Application() override;

    static Application* instance();

    // Load, show the window and enter the event loop. Returns 1 if the audio file
    // could not be loaded, otherwise the event loop's exit code.
    int run();

    // Load the audio and build the window without entering the event loop.
    // On a load failure no window (and no chart) is created.
    bool start();

    void set_load_failure_reporter(LoadFailureReporter reporter);

    const wv::config::ViewerConfig& config() const { return config_; }
    const std::optional<wv::audio::LoadError>& load_error() const { return load_error_; }
    wv::ui::MainWindow* main_window() const { return main_window_.get(); }

private:
    bool load_source();
    void create_main_window();
    void report_load_failure();

    static void default_load_failure_reporter(const wv::audio::LoadError& error);

    static Application* instance_;

    wv::config::ViewerConfig config_;
    std::optional<wv::audio::AudioBuffer> audio_;
    std::optional<wv::audio::LoadError> load_error_;
    LoadFailureReporter load_failure_reporter_;
    std::shared_ptr<wv::audio::SoundPlayer> player_;
    std::unique_ptr<wv::ui::MainWindow> main_window_;
};

} // namespace wv::app
