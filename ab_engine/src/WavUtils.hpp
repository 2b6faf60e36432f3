#pragma once

#include <string>

#include "PlaybackTypes.hpp"

class WavUtils {
public:
    /// Decode a whole file into interleaved float samples.
    /// Throws FileNotFoundError if the path does not exist, DecodeError if
    /// libsndfile cannot open or fully read it.
    static WavData loadWav(const std::string &path);

    /// Write interleaved float samples as a 32-bit float WAV.
    static void writeWav(const std::string &path, const WavData &wav);
};
