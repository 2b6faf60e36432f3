#include "WavUtils.hpp"
#include <sndfile.h>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

WavData WavUtils::loadWav(const std::string &path) {
    if (!fs::exists(path)) {
        throw FileNotFoundError("File not found: " + path);
    }

    SF_INFO info = {};
    SNDFILE *snd = sf_open(path.c_str(), SFM_READ, &info);
    if (!snd) {
        throw DecodeError("Failed to open WAV: " + path + " (" + sf_strerror(nullptr) + ")");
    }

    WavData d;
    d.sampleRate = info.samplerate;
    d.channels = info.channels;
    d.samples.resize(static_cast<size_t>(info.frames) * info.channels);

    // sf_readf_float converts any PCM/float subtype to [-1, 1] floats
    sf_count_t got = sf_readf_float(snd, d.samples.data(), info.frames);
    sf_close(snd);

    if (got != info.frames) {
        throw DecodeError("Short read in " + path + ": got " + std::to_string(got)
                          + " of " + std::to_string(info.frames) + " frames");
    }

    std::cout << "[Loader] " << path << ": " << d.sampleRate << " Hz, "
              << d.channels << " ch, " << d.frames() << " frames\n";

    return d;
}

void WavUtils::writeWav(const std::string &path, const WavData &wav) {
    SF_INFO info = {};
    info.channels = wav.channels;
    info.samplerate = wav.sampleRate;
    info.format = SF_FORMAT_WAV | SF_FORMAT_FLOAT;

    SNDFILE *snd = sf_open(path.c_str(), SFM_WRITE, &info);
    if (!snd) {
        throw std::runtime_error("Cannot create WAV file " + path + ": " + sf_strerror(nullptr));
    }

    sf_count_t frames = static_cast<sf_count_t>(wav.frames());
    sf_count_t written = sf_writef_float(snd, wav.samples.data(), frames);
    std::string err = sf_strerror(snd);
    sf_close(snd);

    if (written != frames) {
        throw std::runtime_error("Write error in " + path + ": " + err);
    }
}
