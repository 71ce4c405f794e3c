// Linux playback through ALSA. ALSA has no file decoder, so the file is re-read from
// disk with the WAV reader and streamed as native-endian S16 frames.
#include "audio/sound_player.hpp"
#include "audio/wav_reader.hpp"
#include "core/log.hpp"
#include <algorithm>
#include <atomic>
#include <memory>
#include <sstream>

#include <alsa/asoundlib.h>

namespace wv::audio {

namespace {

constexpr unsigned int kLatencyUs = 500000;
constexpr snd_pcm_uframes_t kFramesPerWrite = 4096;

struct PcmCloser {
    void operator()(snd_pcm_t* pcm) const noexcept { if(pcm) snd_pcm_close(pcm); }
};
using PcmHandle = std::unique_ptr<snd_pcm_t, PcmCloser>;

class AlsaSoundPlayer final : public SoundPlayer {
public:
    explicit AlsaSoundPlayer(std::string device) : device_(std::move(device)) {}

    PlaybackError play_file(const std::string& path) override {
        // A stop() issued before this call (e.g. while the request was still queued)
        // stays pending until the call returns.
        struct StopReset {
            std::atomic<bool>& flag;
            ~StopReset() { flag.store(false); }
        } stop_reset{stop_requested_};

        auto pcm = read_wav_pcm16(path);
        if(!pcm) {
            last_error_ = pcm.error().message;
            return pcm.error().kind == LoadErrorKind::FileNotFound ? PlaybackError::FileNotFound
                                                                  : PlaybackError::InvalidFile;
        }
        const WavFormat& fmt = pcm->format;
        if(stop_requested_.load()) {
            wv::log::info("ALSA playback cancelled before start: " + path);
            return PlaybackError::Success;
        }

        snd_pcm_t* raw = nullptr;
        int rc = snd_pcm_open(&raw, device_.c_str(), SND_PCM_STREAM_PLAYBACK, 0);
        if(rc < 0) {
            return device_failure("cannot open PCM device '" + device_ + "'", rc);
        }
        PcmHandle handle(raw);

        rc = snd_pcm_set_params(handle.get(), SND_PCM_FORMAT_S16, SND_PCM_ACCESS_RW_INTERLEAVED,
                                fmt.channels, fmt.sample_rate, 1 /* allow resampling */, kLatencyUs);
        if(rc < 0) {
            return device_failure("cannot configure PCM device", rc);
        }

        const snd_pcm_uframes_t total = pcm->frame_count();
        snd_pcm_uframes_t offset = 0;
        while(offset < total) {
            if(stop_requested_.load()) {
                snd_pcm_drop(handle.get());
                wv::log::info("ALSA playback stopped early: " + path);
                return PlaybackError::Success;
            }
            const snd_pcm_uframes_t count = std::min(kFramesPerWrite, total - offset);
            snd_pcm_sframes_t written = snd_pcm_writei(handle.get(),
                                                       pcm->samples.data() + offset * fmt.channels, count);
            if(written < 0) {
                // Underrun or suspend; recover once and retry the same block.
                written = snd_pcm_recover(handle.get(), static_cast<int>(written), 1);
                if(written < 0) {
                    return device_failure("write to PCM device failed", static_cast<int>(written));
                }
                continue;
            }
            offset += static_cast<snd_pcm_uframes_t>(written);
        }

        if(stop_requested_.load()) {
            snd_pcm_drop(handle.get());
            wv::log::info("ALSA playback stopped early: " + path);
            return PlaybackError::Success;
        }
        rc = snd_pcm_drain(handle.get());
        if(rc < 0) {
            return device_failure("drain failed", rc);
        }

        std::ostringstream oss;
        oss << "ALSA played " << total << " frames from " << path;
        wv::log::debug(oss.str());
        return PlaybackError::Success;
    }

    void stop() noexcept override { stop_requested_.store(true); }

    bool is_available() const override { return true; }
    std::string backend_name() const override { return "alsa"; }
    std::string last_error() const override { return last_error_; }

private:
    PlaybackError device_failure(const std::string& what, int rc) {
        last_error_ = what + ": " + snd_strerror(rc);
        return PlaybackError::DeviceError;
    }

    std::string device_;
    std::string last_error_;
    std::atomic<bool> stop_requested_{false};
};

} // namespace

std::unique_ptr<SoundPlayer> create_platform_sound_player() {
    return std::make_unique<AlsaSoundPlayer>("default");
}

} // namespace wv::audio
