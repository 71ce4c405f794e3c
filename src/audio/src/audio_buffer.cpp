#include "audio/audio_buffer.hpp"
#include "core/log.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace wv::audio {

std::vector<float> downmix_to_mono(const std::vector<int16_t>& interleaved, uint16_t channels) {
    std::vector<float> mono;
    if(channels == 0) return mono;
    const std::size_t frames = interleaved.size() / channels;
    mono.resize(frames);
    if(channels == 1) {
        for(std::size_t i = 0; i < frames; ++i) mono[i] = static_cast<float>(interleaved[i]);
        return mono;
    }
    for(std::size_t i = 0; i < frames; ++i) {
        int32_t sum = 0;
        const int16_t* frame = interleaved.data() + i * channels;
        for(uint16_t c = 0; c < channels; ++c) sum += frame[c];
        mono[i] = static_cast<float>(sum) / static_cast<float>(channels);
    }
    return mono;
}

float peak_magnitude(const std::vector<float>& samples) noexcept {
    float peak = 0.0f;
    for(float s : samples) peak = std::max(peak, std::fabs(s));
    return peak;
}

expected<float, LoadError> normalize_peak(std::vector<float>& samples, SilencePolicy policy) {
    const float peak = peak_magnitude(samples);
    if(peak == 0.0f) {
        if(policy == SilencePolicy::KeepZeros) {
            wv::log::warn("Signal is silent; leaving samples unscaled");
            return 0.0f;
        }
        return make_unexpected(LoadError{LoadErrorKind::EmptySignal, "signal is silent (peak is zero)"});
    }
    // Divide rather than multiply by 1/peak so the peak sample lands on exactly +-1.0.
    for(float& s : samples) s /= peak;
    return peak;
}

std::vector<double> make_time_axis(std::size_t count, uint32_t sample_rate) {
    std::vector<double> axis(count);
    if(sample_rate == 0) return axis;
    const double rate = static_cast<double>(sample_rate);
    for(std::size_t i = 0; i < count; ++i) axis[i] = static_cast<double>(i) / rate;
    return axis;
}

expected<AudioBuffer, LoadError> make_audio_buffer(const PcmData& pcm, const LoadOptions& options) {
    if(pcm.frame_count() == 0) {
        return make_unexpected(LoadError{LoadErrorKind::EmptySignal, "file contains no audio frames"});
    }

    AudioBuffer buffer;
    buffer.sample_rate = pcm.format.sample_rate;
    buffer.source_channels = pcm.format.channels;
    buffer.samples = downmix_to_mono(pcm.samples, pcm.format.channels);

    auto peak = normalize_peak(buffer.samples, options.silence_policy);
    if(!peak) return make_unexpected(peak.error());
    buffer.peak = *peak;

    buffer.time_axis = make_time_axis(buffer.samples.size(), buffer.sample_rate);
    return buffer;
}

expected<AudioBuffer, LoadError> load_audio(const std::string& path, const LoadOptions& options) {
    auto pcm = read_wav_pcm16(path);
    if(!pcm) return make_unexpected(pcm.error());

    auto buffer = make_audio_buffer(*pcm, options);
    if(!buffer) {
        LoadError err = buffer.error();
        err.message = path + ": " + err.message;
        return make_unexpected(std::move(err));
    }

    std::ostringstream oss;
    oss << "Loaded " << path << ": " << buffer->size() << " samples, "
        << buffer->sample_rate << " Hz, " << buffer->source_channels << " ch, "
        << buffer->duration_seconds() << " s, peak " << buffer->peak;
    wv::log::info(oss.str());
    return buffer;
}

} // namespace wv::audio
