// Windows playback through winmm. PlaySoundW decodes the file itself, so anything the
// system WAV handler accepts will play, not only 16-bit PCM.
#include "audio/sound_player.hpp"
#include "core/log.hpp"
#include <atomic>
#include <filesystem>
#include <system_error>

#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <mmsystem.h>

namespace wv::audio {

namespace {

std::wstring widen(const std::string& utf8) {
    if(utf8.empty()) return {};
    const int len = MultiByteToWideChar(CP_UTF8, 0, utf8.data(), static_cast<int>(utf8.size()), nullptr, 0);
    std::wstring out(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, utf8.data(), static_cast<int>(utf8.size()), out.data(), len);
    return out;
}

class WinmmSoundPlayer final : public SoundPlayer {
public:
    PlaybackError play_file(const std::string& path) override {
        struct StopReset {
            std::atomic<bool>& flag;
            ~StopReset() { flag.store(false); }
        } stop_reset{stop_requested_};

        std::error_code ec;
        if(!std::filesystem::exists(path, ec)) {
            last_error_ = "file not found: " + path;
            return PlaybackError::FileNotFound;
        }
        // PlaySoundW(nullptr) only stops a sound that has already started.
        if(stop_requested_.load()) {
            wv::log::info("winmm playback cancelled before start: " + path);
            return PlaybackError::Success;
        }
        const std::wstring wide = widen(path);
        // SND_SYNC blocks until the sound ends; SND_NODEFAULT suppresses the fallback beep.
        if(!PlaySoundW(wide.c_str(), nullptr, SND_FILENAME | SND_SYNC | SND_NODEFAULT)) {
            last_error_ = "PlaySoundW could not play " + path;
            return PlaybackError::InvalidFile;
        }
        return PlaybackError::Success;
    }

    void stop() noexcept override {
        stop_requested_.store(true);
        // A null sound name stops whatever waveform sound is playing, including SND_SYNC.
        PlaySoundW(nullptr, nullptr, 0);
    }

    bool is_available() const override { return true; }
    std::string backend_name() const override { return "winmm"; }
    std::string last_error() const override { return last_error_; }

private:
    std::string last_error_;
    std::atomic<bool> stop_requested_{false};
};

} // namespace

std::unique_ptr<SoundPlayer> create_platform_sound_player() {
    return std::make_unique<WinmmSoundPlayer>();
}

} // namespace wv::audio
