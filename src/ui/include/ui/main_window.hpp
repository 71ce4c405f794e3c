#pragma once
#include "audio/audio_buffer.hpp"
#include "config/viewer_config.hpp"
#include "render/waveform_chart.hpp"
#include <QMainWindow>
#include <QString>
#include <functional>
#include <memory>

QT_BEGIN_NAMESPACE
class QChartView;
class QPushButton;
class QThread;
QT_END_NAMESPACE

namespace wv::audio { class SoundPlayer; }

namespace wv::ui {

class PlaybackWorker;

// Window hosting the waveform chart with "Save Full Image" and "Play Audio".
// Export runs on the UI thread; playback runs on a worker thread owned by the window.
class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    // Returns the chosen destination, or an empty string when the user cancels.
    using SavePathPrompt = std::function<QString(QWidget* parent)>;

    MainWindow(const wv::audio::AudioBuffer& buffer,
               const wv::config::ViewerConfig& config,
               std::shared_ptr<wv::audio::SoundPlayer> player,
               QWidget* parent = nullptr);
    ~MainWindow() override;

    void set_save_path_prompt(SavePathPrompt prompt);

    // Prompt for a path and write the chart there; a cancelled prompt writes nothing.
    wv::render::ExportResult export_plot();

    bool is_playing() const { return playing_; }
    bool playback_available() const;

    QChart* chart() const;
    QPushButton* save_button() const { return save_button_; }
    QPushButton* play_button() const { return play_button_; }

public slots:
    void play_audio();

signals:
    void playback_finished(bool ok);

private slots:
    void on_save_clicked();
    void on_playback_finished(bool ok, const QString& error);

private:
    void create_widgets(const wv::audio::AudioBuffer& buffer);
    void setup_playback_worker();
    void cleanup_playback_worker();
    void show_status(const QString& text, bool is_error);

    static QString default_save_path_prompt(QWidget* parent);

    wv::config::ViewerConfig config_;
    std::shared_ptr<wv::audio::SoundPlayer> player_;
    SavePathPrompt save_path_prompt_;

    QChartView* chart_view_ = nullptr;
    QPushButton* save_button_ = nullptr;
    QPushButton* play_button_ = nullptr;

    QThread* playback_thread_ = nullptr;
    PlaybackWorker* playback_worker_ = nullptr;
    bool playing_ = false;
};

} // namespace wv::ui
