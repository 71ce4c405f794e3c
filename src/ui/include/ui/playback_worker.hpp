#pragma once
#include "audio/sound_player.hpp"
#include <QObject>
#include <QString>
#include <memory>

namespace wv::ui {

// Runs blocking SoundPlayer::play_file() calls on the thread it has been moved to and
// reports each completion with playbackFinished.
class PlaybackWorker : public QObject {
    Q_OBJECT

public:
    explicit PlaybackWorker(std::shared_ptr<wv::audio::SoundPlayer> player);

public slots:
    void play(const QString& path);

signals:
    void playbackFinished(bool ok, const QString& error);

private:
    std::shared_ptr<wv::audio::SoundPlayer> player_;
};

} // namespace wv::ui
