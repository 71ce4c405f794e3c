#pragma once
#include "audio/audio_buffer.hpp"
#include "core/log.hpp"
#include <cstddef>
#include <string>

// Compile-time defaults. CMake defines these from cache variables; the fallbacks below
// apply when the header is used outside that build.
#ifndef WV_DEFAULT_WAV_PATH
  #define WV_DEFAULT_WAV_PATH "u.wav"
#endif

#ifndef WV_MAX_PLOT_POINTS
  #define WV_MAX_PLOT_POINTS 200000
#endif

#ifndef WV_KEEP_SILENT_SIGNAL
  #define WV_KEEP_SILENT_SIGNAL 0
#endif

#ifndef WV_LOG_JSON
  #define WV_LOG_JSON 0
#endif

#ifndef WV_RUNTIME_DEBUG
  #define WV_RUNTIME_DEBUG 0
#endif

namespace wv::config {

struct ViewerConfig {
    std::string wav_path;                // Source file; not changeable at runtime
    std::string window_title;
    int chart_width = 1000;              // Initial chart size in pixels (10x4 in at 100 dpi)
    int chart_height = 400;
    std::size_t max_plot_points = 0;     // 0 disables decimation
    audio::SilencePolicy silence_policy = audio::SilencePolicy::Reject;
    bool json_log = false;
    log::Level log_level = log::Level::Info;
};

ViewerConfig default_config();

// Applies the logging part of the config to the wv::log facade.
void apply_logging(const ViewerConfig& cfg) noexcept;

} // namespace wv::config
