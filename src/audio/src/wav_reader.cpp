#include "audio/wav_reader.hpp"
#include "core/log.hpp"
#include <algorithm>
#include <array>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace wv::audio {

namespace {

// Tail of KSDATAFORMAT_SUBTYPE_PCM after its leading format tag
// {00000001-0000-0010-8000-00aa00389b71}.
constexpr std::array<uint8_t, 14> kSubFormatGuidTail = {
    0x00, 0x00, 0x00, 0x00, 0x10, 0x00, 0x80, 0x00, 0x00, 0xAA, 0x00, 0x38, 0x9B, 0x71
};

constexpr std::size_t kMinFmtSize = 16;
constexpr std::size_t kExtensibleFmtSize = 40;

uint16_t read_le16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t read_le32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

unexpected<LoadError> fail(LoadErrorKind kind, const std::string& path, const std::string& what) {
    return make_unexpected(LoadError{kind, path + ": " + what});
}

bool read_bytes(std::ifstream& in, uint8_t* dst, std::size_t n) {
    in.read(reinterpret_cast<char*>(dst), static_cast<std::streamsize>(n));
    return static_cast<std::size_t>(in.gcount()) == n;
}

} // namespace

const char* to_string(LoadErrorKind kind) noexcept {
    switch(kind) {
        case LoadErrorKind::FileNotFound: return "FileNotFound";
        case LoadErrorKind::ReadFailed: return "ReadFailed";
        case LoadErrorKind::InvalidHeader: return "InvalidHeader";
        case LoadErrorKind::UnsupportedEncoding: return "UnsupportedEncoding";
        case LoadErrorKind::EmptySignal: return "EmptySignal";
    }
    return "Unknown";
}

expected<PcmData, LoadError> read_wav_pcm16(const std::string& path) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if(!fs::exists(path, ec)) {
        return fail(LoadErrorKind::FileNotFound, path, "file not found");
    }
    const auto file_size = fs::file_size(path, ec);
    if(ec) {
        return fail(LoadErrorKind::ReadFailed, path, "cannot stat file: " + ec.message());
    }

    std::ifstream in(path, std::ios::binary);
    if(!in.is_open()) {
        return fail(LoadErrorKind::ReadFailed, path, "cannot open file");
    }

    std::array<uint8_t, 12> riff{};
    if(!read_bytes(in, riff.data(), riff.size())) {
        return fail(LoadErrorKind::InvalidHeader, path, "file too short for a RIFF header");
    }
    if(std::memcmp(riff.data(), "RIFF", 4) != 0 || std::memcmp(riff.data() + 8, "WAVE", 4) != 0) {
        return fail(LoadErrorKind::InvalidHeader, path, "not a RIFF/WAVE file");
    }

    PcmData pcm;
    bool have_fmt = false;
    uint64_t pos = riff.size();

    while(pos + 8 <= file_size) {
        std::array<uint8_t, 8> header{};
        in.seekg(static_cast<std::streamoff>(pos));
        if(!read_bytes(in, header.data(), header.size())) {
            return fail(LoadErrorKind::ReadFailed, path, "short read in chunk header");
        }
        const uint32_t chunk_size = read_le32(header.data() + 4);
        const uint64_t body = pos + 8;

        if(std::memcmp(header.data(), "fmt ", 4) == 0) {
            if(chunk_size < kMinFmtSize) {
                return fail(LoadErrorKind::InvalidHeader, path, "fmt chunk too small");
            }
            std::array<uint8_t, kExtensibleFmtSize> fmt{};
            const std::size_t want = std::min<std::size_t>(chunk_size, fmt.size());
            if(!read_bytes(in, fmt.data(), want)) {
                return fail(LoadErrorKind::InvalidHeader, path, "truncated fmt chunk");
            }
            WavFormat& f = pcm.format;
            f.format_tag = read_le16(fmt.data());
            f.channels = read_le16(fmt.data() + 2);
            f.sample_rate = read_le32(fmt.data() + 4);
            f.block_align = read_le16(fmt.data() + 12);
            f.bits_per_sample = read_le16(fmt.data() + 14);
            if(f.format_tag == WavFormat::kFormatExtensible) {
                if(want < kExtensibleFmtSize) {
                    return fail(LoadErrorKind::InvalidHeader, path, "extensible fmt chunk too small");
                }
                // Sub-format GUID starts at byte 24; its first two bytes are the real tag.
                const uint16_t sub_tag = read_le16(fmt.data() + 24);
                const bool known_guid = std::memcmp(fmt.data() + 26, kSubFormatGuidTail.data(),
                                                    kSubFormatGuidTail.size()) == 0;
                f.format_tag = known_guid ? sub_tag : 0;
            }
            have_fmt = true;
        } else if(std::memcmp(header.data(), "data", 4) == 0) {
            if(!have_fmt) {
                return fail(LoadErrorKind::InvalidHeader, path, "data chunk before fmt chunk");
            }
            const WavFormat& f = pcm.format;
            if(f.format_tag != WavFormat::kFormatPcm || f.bits_per_sample != 16) {
                std::ostringstream oss;
                oss << "unsupported encoding (format tag " << f.format_tag << ", "
                    << f.bits_per_sample << " bits); only 16-bit PCM is supported";
                return fail(LoadErrorKind::UnsupportedEncoding, path, oss.str());
            }
            if(f.channels == 0 || f.sample_rate == 0) {
                return fail(LoadErrorKind::InvalidHeader, path, "zero channels or sample rate");
            }
            if(f.block_align != f.channels * sizeof(int16_t)) {
                std::ostringstream oss;
                oss << "block align " << f.block_align << " does not match " << f.channels
                    << " channel(s) of 16-bit samples";
                return fail(LoadErrorKind::InvalidHeader, path, oss.str());
            }

            const std::size_t frame_bytes = static_cast<std::size_t>(f.channels) * sizeof(int16_t);
            uint64_t available = chunk_size;
            if(body + available > file_size) {
                available = file_size - body;
                std::ostringstream oss;
                oss << path << ": data chunk declares " << chunk_size << " bytes but only "
                    << available << " are present";
                wv::log::warn(oss.str());
            }
            const std::size_t frames = static_cast<std::size_t>(available / frame_bytes);

            std::vector<uint8_t> raw(frames * frame_bytes);
            if(!raw.empty() && !read_bytes(in, raw.data(), raw.size())) {
                return fail(LoadErrorKind::ReadFailed, path, "short read in data chunk");
            }
            pcm.samples.resize(frames * f.channels);
            for(std::size_t i = 0; i < pcm.samples.size(); ++i) {
                pcm.samples[i] = static_cast<int16_t>(read_le16(raw.data() + i * 2));
            }

            std::ostringstream oss;
            oss << "Read " << frames << " frames (" << f.channels << " ch, "
                << f.sample_rate << " Hz) from " << path;
            wv::log::debug(oss.str());
            return pcm;
        }

        // Chunks are word aligned: odd sizes carry one pad byte.
        pos = body + chunk_size + (chunk_size & 1u);
    }

    if(!have_fmt) {
        return fail(LoadErrorKind::InvalidHeader, path, "missing fmt chunk");
    }
    return fail(LoadErrorKind::InvalidHeader, path, "missing data chunk");
}

} // namespace wv::audio
