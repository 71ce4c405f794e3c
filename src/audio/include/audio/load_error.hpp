#pragma once
#include <string>

namespace wv::audio {

enum class LoadErrorKind {
    FileNotFound,         ///< Path does not exist
    ReadFailed,           ///< Path exists but could not be opened or read
    InvalidHeader,        ///< Not a RIFF/WAVE container, or required chunks missing/malformed
    UnsupportedEncoding,  ///< Valid WAV, but not 16-bit integer PCM
    EmptySignal           ///< No frames, or an all-zero signal that cannot be normalized
};

struct LoadError {
    LoadErrorKind kind = LoadErrorKind::ReadFailed;
    std::string message;
};

const char* to_string(LoadErrorKind kind) noexcept;

} // namespace wv::audio
