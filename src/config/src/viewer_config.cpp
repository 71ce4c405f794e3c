#include "config/viewer_config.hpp"

namespace wv::config {

ViewerConfig default_config() {
    ViewerConfig cfg;
    cfg.wav_path = WV_DEFAULT_WAV_PATH;
    cfg.window_title = "Sound Wave Viewer";
    cfg.max_plot_points = static_cast<std::size_t>(WV_MAX_PLOT_POINTS);
    cfg.silence_policy = WV_KEEP_SILENT_SIGNAL ? audio::SilencePolicy::KeepZeros
                                               : audio::SilencePolicy::Reject;
    cfg.json_log = WV_LOG_JSON != 0;
    cfg.log_level = WV_RUNTIME_DEBUG ? log::Level::Debug : log::Level::Info;
    return cfg;
}

void apply_logging(const ViewerConfig& cfg) noexcept {
    log::set_json_mode(cfg.json_log);
    log::set_level(cfg.log_level);
}

} // namespace wv::config
