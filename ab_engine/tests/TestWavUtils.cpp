#include <catch2/catch.hpp>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <string>

#include "AudioBufferPair.hpp"
#include "WavUtils.hpp"

namespace fs = std::filesystem;

namespace {

// Fresh scratch directory per test case, removed on scope exit.
struct TempDir {
    fs::path path;

    explicit TempDir(const std::string& name)
        : path(fs::temp_directory_path() / ("abPlay_" + name)) {
        fs::remove_all(path);
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    std::string file(const std::string& name) const { return (path / name).string(); }
};

WavData sine(int sampleRate, int channels, uint64_t frames, float amp) {
    WavData w;
    w.sampleRate = sampleRate;
    w.channels = channels;
    w.samples.resize(static_cast<size_t>(frames) * channels);
    for (uint64_t f = 0; f < frames; ++f) {
        float v = amp * static_cast<float>(std::sin(2.0 * 3.14159265358979 * 440.0 * f / sampleRate));
        for (int c = 0; c < channels; ++c) w.samples[f * channels + c] = v;
    }
    return w;
}

} // namespace

TEST_CASE("WAV files decode to interleaved floats", "[wav]") {
    TempDir dir("decode");
    WavData src = sine(48000, 2, 4800, 0.5f);
    WavUtils::writeWav(dir.file("a.wav"), src);

    WavData got = WavUtils::loadWav(dir.file("a.wav"));
    REQUIRE(got.sampleRate == 48000);
    REQUIRE(got.channels == 2);
    REQUIRE(got.frames() == 4800);
    for (size_t i = 0; i < src.samples.size(); i += 97) {
        REQUIRE(got.samples[i] == Approx(src.samples[i]).margin(1e-6));
    }
}

TEST_CASE("Missing file is reported as FileNotFoundError", "[wav][errors]") {
    TempDir dir("missing");
    REQUIRE_THROWS_AS(WavUtils::loadWav(dir.file("nope.wav")), FileNotFoundError);
}

TEST_CASE("Non-audio file is reported as DecodeError", "[wav][errors]") {
    TempDir dir("garbage");
    {
        std::ofstream out(dir.file("junk.wav"), std::ios::binary);
        out << "this is not a RIFF file at all";
    }
    REQUIRE_THROWS_AS(WavUtils::loadWav(dir.file("junk.wav")), DecodeError);
}

TEST_CASE("Loading a pair from disk validates and truncates", "[wav][buffers]") {
    TempDir dir("pair");
    WavUtils::writeWav(dir.file("a.wav"), sine(48000, 1, 48000, 0.5f));
    WavUtils::writeWav(dir.file("b.wav"), sine(48000, 1, 57600, 0.25f));

    auto pair = AudioBufferPair::load(dir.file("a.wav"), dir.file("b.wav"), false);
    REQUIRE(pair.frameCount() == 48000);
    REQUIRE(pair.sampleRate() == 48000);
    REQUIRE(pair.channelCount() == 1);
}

TEST_CASE("Loading a pair with mismatched rates fails", "[wav][buffers][errors]") {
    TempDir dir("rates");
    WavUtils::writeWav(dir.file("a.wav"), sine(48000, 1, 1000, 0.5f));
    WavUtils::writeWav(dir.file("b.wav"), sine(44100, 1, 1000, 0.5f));

    REQUIRE_THROWS_AS(AudioBufferPair::load(dir.file("a.wav"), dir.file("b.wav"), false),
                      RateMismatchError);
}

TEST_CASE("Loading a pair with mismatched channels fails", "[wav][buffers][errors]") {
    TempDir dir("channels");
    WavUtils::writeWav(dir.file("a.wav"), sine(48000, 1, 1000, 0.5f));
    WavUtils::writeWav(dir.file("b.wav"), sine(48000, 2, 1000, 0.5f));

    REQUIRE_THROWS_AS(AudioBufferPair::load(dir.file("a.wav"), dir.file("b.wav"), false),
                      ChannelMismatchError);
}

TEST_CASE("Missing B is reported before anything is compared", "[wav][buffers][errors]") {
    TempDir dir("missing_b");
    WavUtils::writeWav(dir.file("a.wav"), sine(48000, 1, 1000, 0.5f));

    REQUIRE_THROWS_AS(AudioBufferPair::load(dir.file("a.wav"), dir.file("b.wav"), false),
                      FileNotFoundError);
}

TEST_CASE("Normalize flag applies to loaded files", "[wav][buffers][normalize]") {
    TempDir dir("normalize");
    WavUtils::writeWav(dir.file("a.wav"), sine(48000, 1, 4800, 0.5f));
    WavUtils::writeWav(dir.file("b.wav"), sine(48000, 1, 4800, 0.2f));

    auto pair = AudioBufferPair::load(dir.file("a.wav"), dir.file("b.wav"), true);
    REQUIRE(peakAbs(pair.buffer(0)) == Approx(0.95f).epsilon(1e-5));
    REQUIRE(peakAbs(pair.buffer(1)) == Approx(0.95f).epsilon(1e-5));
}
