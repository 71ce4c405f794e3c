/**
 * @file audio_buffer.hpp
 * @brief Normalized, display-ready audio loaded once at startup
 */

#pragma once

#include "audio/load_error.hpp"
#include "audio/wav_reader.hpp"
#include "core/expected.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace wv::audio {

/**
 * @brief What to do with a signal whose peak is zero
 */
enum class SilencePolicy {
    Reject,     ///< Fail with LoadErrorKind::EmptySignal
    KeepZeros   ///< Return the zeros unscaled (peak == 0)
};

struct LoadOptions {
    SilencePolicy silence_policy = SilencePolicy::Reject;
};

/**
 * @brief Mono samples scaled to [-1, 1] plus a matching time axis
 *
 * samples.size() == time_axis.size() and time_axis[i] == i / sample_rate,
 * so the axis covers [0, size() / sample_rate).
 */
struct AudioBuffer {
    std::vector<float> samples;
    std::vector<double> time_axis;   ///< Seconds
    uint32_t sample_rate = 0;
    uint16_t source_channels = 0;    ///< Channels in the file before downmix
    float peak = 0.0f;               ///< Peak magnitude before normalization

    std::size_t size() const noexcept { return samples.size(); }
    double duration_seconds() const noexcept {
        return sample_rate ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
};

// Average the channels of each interleaved frame into one value.
std::vector<float> downmix_to_mono(const std::vector<int16_t>& interleaved, uint16_t channels);

float peak_magnitude(const std::vector<float>& samples) noexcept;

// Divides every sample by the peak magnitude in place and returns that peak.
// A zero peak is handled according to the policy.
expected<float, LoadError> normalize_peak(std::vector<float>& samples, SilencePolicy policy);

std::vector<double> make_time_axis(std::size_t count, uint32_t sample_rate);

expected<AudioBuffer, LoadError> make_audio_buffer(const PcmData& pcm, const LoadOptions& options = {});

/**
 * @brief Read, downmix, normalize and time-stamp a WAV file
 *
 * The single entry point the application uses before anything is rendered. On
 * failure nothing is returned that a renderer could consume.
 */
expected<AudioBuffer, LoadError> load_audio(const std::string& path, const LoadOptions& options = {});

} // namespace wv::audio
