/**
 * @file sound_player.hpp
 * @brief Blocking "play this file" facility backed by the OS sound API
 *
 * Windows uses winmm PlaySoundW, which decodes the file itself. Linux re-reads the
 * file with the WAV reader and streams it to the ALSA "default" PCM. Other platforms
 * get a player that reports itself unavailable so the UI can disable playback.
 */

#pragma once

#include <memory>
#include <string>

namespace wv::audio {

enum class PlaybackError {
    Success = 0,
    Unavailable = 1,    ///< No playback backend on this platform
    FileNotFound = 2,
    InvalidFile = 3,    ///< File exists but the backend cannot decode it
    DeviceError = 4,    ///< Output device could not be opened or written
    Unknown = 5
};

const char* to_string(PlaybackError err) noexcept;

class SoundPlayer {
public:
    virtual ~SoundPlayer() = default;

    /**
     * @brief Play the file at path, returning when playback has finished
     *
     * Must not be called concurrently on the same instance. Call from a worker
     * thread when the caller has an event loop to keep alive.
     */
    virtual PlaybackError play_file(const std::string& path) = 0;

    // Ask play_file() to end early. Safe from any thread. A request made before
    // play_file() starts makes that call return without playing; the request is
    // cleared when play_file() returns.
    virtual void stop() noexcept = 0;

    virtual bool is_available() const = 0;
    virtual std::string backend_name() const = 0;

    // Detail for the most recent non-Success result of play_file().
    virtual std::string last_error() const = 0;

    // Backend for the platform this binary was built for.
    static std::unique_ptr<SoundPlayer> create();
};

/**
 * @brief Player for platforms without a supported sound API
 */
class UnavailableSoundPlayer final : public SoundPlayer {
public:
    PlaybackError play_file(const std::string& path) override;
    void stop() noexcept override {}
    bool is_available() const override { return false; }
    std::string backend_name() const override { return "none"; }
    std::string last_error() const override { return last_error_; }

private:
    std::string last_error_;
};

std::unique_ptr<SoundPlayer> create_platform_sound_player();

} // namespace wv::audio
