#include <catch2/catch_test_macros.hpp>
#include "audio/wav_reader.hpp"
#include "support/wav_fixture.hpp"
#include <string>
#include <vector>

using wv::audio::LoadErrorKind;
using wv::audio::read_wav_pcm16;
using namespace wv::test;

TEST_CASE("reads a mono 16-bit PCM file", "[wav]") {
    auto path = write_wav16("wv_reader_mono.wav", {0, 1000, -1000, 32767, -32768});
    auto pcm = read_wav_pcm16(path);
    REQUIRE(pcm.has_value());
    REQUIRE(pcm->format.format_tag == 1);
    REQUIRE(pcm->format.channels == 1);
    REQUIRE(pcm->format.sample_rate == 8000);
    REQUIRE(pcm->format.bits_per_sample == 16);
    REQUIRE(pcm->frame_count() == 5);
    REQUIRE(pcm->samples == std::vector<int16_t>{0, 1000, -1000, 32767, -32768});
}

TEST_CASE("missing file is FileNotFound", "[wav]") {
    auto pcm = read_wav_pcm16("this_wav_should_not_exist_12345.wav");
    REQUIRE_FALSE(pcm.has_value());
    REQUIRE(pcm.error().kind == LoadErrorKind::FileNotFound);
    REQUIRE(pcm.error().message.find("this_wav_should_not_exist_12345.wav") != std::string::npos);
}

TEST_CASE("non-RIFF content is rejected", "[wav]") {
    auto path = write_bytes("wv_reader_text.wav", {'h', 'e', 'l', 'l', 'o', ' ', 'w', 'o', 'r', 'l', 'd', '!', '!'});
    auto pcm = read_wav_pcm16(path);
    REQUIRE_FALSE(pcm);
    REQUIRE(pcm.error().kind == LoadErrorKind::InvalidHeader);

    auto short_path = write_bytes("wv_reader_short.wav", {'R', 'I', 'F', 'F'});
    auto short_pcm = read_wav_pcm16(short_path);
    REQUIRE_FALSE(short_pcm);
    REQUIRE(short_pcm.error().kind == LoadErrorKind::InvalidHeader);
}

TEST_CASE("only 16-bit integer PCM is accepted", "[wav]") {
    WavSpec eight_bit;
    eight_bit.bits_per_sample = 8;
    auto path8 = write_bytes("wv_reader_8bit.wav", make_wav_bytes(eight_bit, {128, 130, 126, 128}));
    auto r8 = read_wav_pcm16(path8);
    REQUIRE_FALSE(r8);
    REQUIRE(r8.error().kind == LoadErrorKind::UnsupportedEncoding);

    WavSpec float_spec;
    float_spec.format_tag = 3;
    float_spec.bits_per_sample = 32;
    auto pathf = write_bytes("wv_reader_float.wav", make_wav_bytes(float_spec, std::vector<uint8_t>(16, 0)));
    auto rf = read_wav_pcm16(pathf);
    REQUIRE_FALSE(rf);
    REQUIRE(rf.error().kind == LoadErrorKind::UnsupportedEncoding);
}

TEST_CASE("WAVE_FORMAT_EXTENSIBLE with PCM sub-format is accepted", "[wav]") {
    WavSpec spec;
    spec.extensible_pcm = true;
    spec.channels = 2;
    auto path = write_wav16("wv_reader_ext.wav", {1, 2, 3, 4}, spec);
    auto pcm = read_wav_pcm16(path);
    REQUIRE(pcm.has_value());
    REQUIRE(pcm->format.format_tag == wv::audio::WavFormat::kFormatPcm);
    REQUIRE(pcm->frame_count() == 2);
}

TEST_CASE("unknown chunks before fmt are skipped", "[wav]") {
    WavSpec spec;
    spec.junk_chunk_before_fmt = true;
    auto path = write_wav16("wv_reader_junk.wav", {5, -5, 7}, spec);
    auto pcm = read_wav_pcm16(path);
    REQUIRE(pcm.has_value());
    REQUIRE(pcm->samples == std::vector<int16_t>{5, -5, 7});
}

TEST_CASE("truncated data chunk yields the whole frames present", "[wav]") {
    WavSpec spec;
    spec.channels = 2;
    spec.declared_data_bytes = 4000;
    // 5 samples = 2 full stereo frames plus half a frame.
    auto path = write_wav16("wv_reader_trunc.wav", {10, 20, 30, 40, 50}, spec);
    auto pcm = read_wav_pcm16(path);
    REQUIRE(pcm.has_value());
    REQUIRE(pcm->frame_count() == 2);
    REQUIRE(pcm->samples == std::vector<int16_t>{10, 20, 30, 40});
}

TEST_CASE("data chunk before fmt chunk is rejected", "[wav]") {
    std::vector<uint8_t> bytes;
    put_tag(bytes, "RIFF");
    put32(bytes, 4 + 8 + 4);
    put_tag(bytes, "WAVE");
    put_tag(bytes, "data");
    put32(bytes, 4);
    put16(bytes, 1);
    put16(bytes, 2);
    auto path = write_bytes("wv_reader_order.wav", bytes);
    auto pcm = read_wav_pcm16(path);
    REQUIRE_FALSE(pcm);
    REQUIRE(pcm.error().kind == LoadErrorKind::InvalidHeader);
}

TEST_CASE("missing data chunk is rejected", "[wav]") {
    auto full = make_wav_bytes(WavSpec{}, {});
    // Drop the 8-byte data chunk header from the end.
    full.resize(full.size() - 8);
    auto path = write_bytes("wv_reader_nodata.wav", full);
    auto pcm = read_wav_pcm16(path);
    REQUIRE_FALSE(pcm);
    REQUIRE(pcm.error().kind == LoadErrorKind::InvalidHeader);
    REQUIRE(pcm.error().message.find("data") != std::string::npos);
}

TEST_CASE("block align that disagrees with the channel count is rejected", "[wav]") {
    WavSpec spec;
    spec.channels = 2;
    spec.block_align = 2;
    auto path = write_wav16("wv_reader_block_align.wav", {1, 2, 3, 4}, spec);
    auto pcm = read_wav_pcm16(path);
    REQUIRE_FALSE(pcm);
    REQUIRE(pcm.error().kind == LoadErrorKind::InvalidHeader);
    REQUIRE(pcm.error().message.find("block align") != std::string::npos);
}

TEST_CASE("load error kinds have names", "[wav]") {
    REQUIRE(std::string(wv::audio::to_string(LoadErrorKind::EmptySignal)) == "EmptySignal");
    REQUIRE(std::string(wv::audio::to_string(LoadErrorKind::UnsupportedEncoding)) == "UnsupportedEncoding");
}
