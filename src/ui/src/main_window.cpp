#include "ui/main_window.hpp"
#include "ui/playback_worker.hpp"
#include "audio/sound_player.hpp"
#include "core/log.hpp"
#include <QtCharts/QChartView>
#include <QFileDialog>
#include <QPainter>
#include <QPushButton>
#include <QStatusBar>
#include <QThread>
#include <QVBoxLayout>
#include <QWidget>

namespace wv::ui {

MainWindow::MainWindow(const wv::audio::AudioBuffer& buffer,
                       const wv::config::ViewerConfig& config,
                       std::shared_ptr<wv::audio::SoundPlayer> player,
                       QWidget* parent)
    : QMainWindow(parent)
    , config_(config)
    , player_(std::move(player))
    , save_path_prompt_(&MainWindow::default_save_path_prompt)
{
    setWindowTitle(QString::fromStdString(config_.window_title));
    create_widgets(buffer);
    setup_playback_worker();
}

MainWindow::~MainWindow() {
    cleanup_playback_worker();
    wv::log::info("Main window destroyed");
}

void MainWindow::create_widgets(const wv::audio::AudioBuffer& buffer) {
    wv::render::ChartStyle style;
    style.max_points = config_.max_plot_points;

    // QChartView takes ownership of the chart.
    chart_view_ = new QChartView(wv::render::build_waveform_chart(buffer, style).release());
    chart_view_->setRenderHint(QPainter::Antialiasing);
    chart_view_->setMinimumSize(config_.chart_width, config_.chart_height);

    save_button_ = new QPushButton(tr("Save Full Image"));
    play_button_ = new QPushButton(tr("Play Audio"));

    auto* central = new QWidget(this);
    auto* layout = new QVBoxLayout(central);
    layout->addWidget(chart_view_, 1);
    layout->addWidget(save_button_);
    layout->addWidget(play_button_);
    setCentralWidget(central);

    connect(save_button_, &QPushButton::clicked, this, &MainWindow::on_save_clicked);
    connect(play_button_, &QPushButton::clicked, this, &MainWindow::play_audio);

    if (!playback_available()) {
        play_button_->setEnabled(false);
        play_button_->setToolTip(tr("Audio playback is not supported on this platform"));
        wv::log::warn("Audio playback unavailable; Play Audio disabled");
    }

    resize(config_.chart_width, config_.chart_height + 100);
}

void MainWindow::setup_playback_worker() {
    if (!playback_available()) return;

    playback_thread_ = new QThread(this);
    playback_worker_ = new PlaybackWorker(player_);
    playback_worker_->moveToThread(playback_thread_);

    connect(playback_worker_, &PlaybackWorker::playbackFinished,
            this, &MainWindow::on_playback_finished, Qt::QueuedConnection);
    connect(playback_thread_, &QThread::finished,
            playback_worker_, &QObject::deleteLater);

    playback_thread_->start();
    wv::log::debug("Playback worker thread started");
}

void MainWindow::cleanup_playback_worker() {
    if (!playback_thread_) return;
    // Also cancels a play request that is queued but not yet picked up.
    if (player_) {
        player_->stop();
    }
    playback_thread_->quit();
    if (!playback_thread_->wait(3000)) {
        wv::log::warn("Playback worker did not stop within 3 s; terminating it");
        playback_thread_->terminate();
        playback_thread_->wait(1000);
    }
    playback_thread_ = nullptr;
    playback_worker_ = nullptr;
}

bool MainWindow::playback_available() const {
    return player_ && player_->is_available();
}

QChart* MainWindow::chart() const {
    return chart_view_ ? chart_view_->chart() : nullptr;
}

void MainWindow::set_save_path_prompt(SavePathPrompt prompt) {
    save_path_prompt_ = prompt ? std::move(prompt) : SavePathPrompt(&MainWindow::default_save_path_prompt);
}

QString MainWindow::default_save_path_prompt(QWidget* parent) {
    QFileDialog dialog(parent, tr("Save Full Image"));
    dialog.setAcceptMode(QFileDialog::AcceptSave);
    dialog.setNameFilter(tr("PNG Images (*.png)"));
    dialog.setDefaultSuffix(QStringLiteral("png"));
    if (dialog.exec() != QDialog::Accepted) return QString();
    const QStringList files = dialog.selectedFiles();
    return files.isEmpty() ? QString() : files.front();
}

wv::render::ExportResult MainWindow::export_plot() {
    const QString path = save_path_prompt_(this);
    if (path.isEmpty()) {
        wv::log::info("Image export cancelled by user");
        wv::render::ExportResult cancelled;
        cancelled.status = wv::render::ExportStatus::Cancelled;
        return cancelled;
    }

    auto result = wv::render::export_widget_png(*chart_view_, path);
    if (result.success()) {
        wv::log::info("Image saved: " + result.path);
        show_status(tr("Image saved: %1").arg(QString::fromStdString(result.path)), false);
    } else {
        wv::log::error("Image export failed: " + result.error);
        show_status(tr("Image export failed: %1").arg(QString::fromStdString(result.error)), true);
    }
    return result;
}

void MainWindow::on_save_clicked() {
    // Outcome is logged and shown in the status bar by export_plot().
    export_plot();
}

void MainWindow::play_audio() {
    if (!playback_available() || !playback_worker_) {
        wv::log::warn("Play requested but no playback backend is available");
        return;
    }
    if (playing_) {
        wv::log::debug("Play requested while already playing; ignored");
        return;
    }

    playing_ = true;
    play_button_->setEnabled(false);
    show_status(tr("Playing %1...").arg(QString::fromStdString(config_.wav_path)), false);
    wv::log::info("Playing " + config_.wav_path + " via " + player_->backend_name());

    QMetaObject::invokeMethod(playback_worker_, "play",
                              Qt::QueuedConnection,
                              Q_ARG(QString, QString::fromStdString(config_.wav_path)));
}

void MainWindow::on_playback_finished(bool ok, const QString& error) {
    playing_ = false;
    play_button_->setEnabled(true);
    if (ok) {
        show_status(tr("Playback finished"), false);
    } else {
        wv::log::error("Error playing audio: " + error.toStdString());
        show_status(tr("Error playing audio: %1").arg(error), true);
    }
    emit playback_finished(ok);
}

void MainWindow::show_status(const QString& text, bool is_error) {
    statusBar()->setStyleSheet(is_error ? QStringLiteral("color: red;") : QString());
    statusBar()->showMessage(text);
}

} // namespace wv::ui
