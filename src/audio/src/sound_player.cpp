#include "audio/sound_player.hpp"
#include "core/log.hpp"

namespace wv::audio {

const char* to_string(PlaybackError err) noexcept {
    switch(err) {
        case PlaybackError::Success: return "Success";
        case PlaybackError::Unavailable: return "Unavailable";
        case PlaybackError::FileNotFound: return "FileNotFound";
        case PlaybackError::InvalidFile: return "InvalidFile";
        case PlaybackError::DeviceError: return "DeviceError";
        case PlaybackError::Unknown: return "Unknown";
    }
    return "Unknown";
}

PlaybackError UnavailableSoundPlayer::play_file(const std::string& path) {
    last_error_ = "audio playback is not supported on this platform (requested " + path + ")";
    return PlaybackError::Unavailable;
}

std::unique_ptr<SoundPlayer> SoundPlayer::create() {
    auto player = create_platform_sound_player();
    if(!player) {
        player = std::make_unique<UnavailableSoundPlayer>();
    }
    wv::log::info("Sound player backend: " + player->backend_name());
    return player;
}

#if !defined(_WIN32) && !defined(__linux__)
std::unique_ptr<SoundPlayer> create_platform_sound_player() {
    return nullptr;
}
#endif

} // namespace wv::audio
