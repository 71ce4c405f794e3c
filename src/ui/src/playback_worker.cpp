#include "ui/playback_worker.hpp"
#include "core/log.hpp"
#include <QElapsedTimer>
#include <sstream>

namespace wv::ui {

PlaybackWorker::PlaybackWorker(std::shared_ptr<wv::audio::SoundPlayer> player)
    : player_(std::move(player))
{
}

void PlaybackWorker::play(const QString& path) {
    if (!player_) {
        emit playbackFinished(false, QStringLiteral("no sound player"));
        return;
    }

    QElapsedTimer timer;
    timer.start();
    const auto rc = player_->play_file(path.toStdString());
    if (rc != wv::audio::PlaybackError::Success) {
        std::string detail = player_->last_error();
        if (detail.empty()) detail = wv::audio::to_string(rc);
        emit playbackFinished(false, QString::fromStdString(detail));
        return;
    }

    std::ostringstream oss;
    oss << "Playback of " << path.toStdString() << " finished after " << timer.elapsed() << " ms";
    wv::log::debug(oss.str());
    emit playbackFinished(true, QString());
}

} // namespace wv::ui
