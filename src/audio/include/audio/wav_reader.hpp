/**
 * @file wav_reader.hpp
 * @brief RIFF/WAVE reader for 16-bit integer PCM
 *
 * Walks the chunk list instead of assuming a 44-byte header, accepts plain PCM and
 * WAVE_FORMAT_EXTENSIBLE with a PCM sub-format, and returns the interleaved samples
 * untouched. Used by the loader and by the ALSA playback backend.
 */

#pragma once

#include "audio/load_error.hpp"
#include "core/expected.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace wv::audio {

/**
 * @brief Contents of the "fmt " chunk that matter for decoding
 */
struct WavFormat {
    static constexpr uint16_t kFormatPcm = 0x0001;
    static constexpr uint16_t kFormatExtensible = 0xFFFE;

    uint16_t format_tag = 0;       ///< Effective tag (sub-format for EXTENSIBLE files)
    uint16_t channels = 0;
    uint32_t sample_rate = 0;      ///< Frames per second
    uint16_t block_align = 0;      ///< Bytes per frame as declared by the file
    uint16_t bits_per_sample = 0;
};

/**
 * @brief Decoded file: format plus interleaved signed 16-bit samples
 */
struct PcmData {
    WavFormat format;
    std::vector<int16_t> samples;

    std::size_t frame_count() const noexcept {
        return format.channels ? samples.size() / format.channels : 0;
    }
};

/**
 * @brief Read every frame of a 16-bit PCM WAV file
 * @param path File to read; the handle is closed before returning
 * @return Samples, or a LoadError whose message names the path
 *
 * A data chunk that claims more bytes than the file holds is cut to the whole
 * frames present (logged as a warning). Trailing partial frames are dropped.
 */
expected<PcmData, LoadError> read_wav_pcm16(const std::string& path);

} // namespace wv::audio
