// AudioBufferPair.hpp — The two renderings being compared
//
// Built once at load time from two decoded files, then never mutated. Both
// buffers share one sample rate, one channel count and one frame count (the
// shorter input defines the comparison window). The audio thread reads the
// buffers without any locking.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "PlaybackTypes.hpp"

class AudioBufferPair {
public:

    /// Empty pair; assign from load() or fromWavData().
    AudioBufferPair() = default;

    static constexpr float kDefaultNormalizeTarget = 0.95f;

    /// Decode both files with libsndfile and build the pair.
    /// Throws FileNotFoundError / DecodeError from the loader, then the
    /// validation errors documented on fromWavData().
    static AudioBufferPair load(const std::string& pathA,
                                const std::string& pathB,
                                bool normalize,
                                float target = kDefaultNormalizeTarget);

    /// Validate and build from already-decoded audio.
    ///   RateMismatchError    — sample rates differ
    ///   ChannelMismatchError — channel counts differ
    ///   EmptyAudioError      — the shorter input has zero frames
    /// Both buffers are truncated to min(framesA, framesB). No padding.
    static AudioBufferPair fromWavData(WavData a, WavData b,
                                       bool normalize,
                                       float target = kDefaultNormalizeTarget);

    /// index 0 = A, 1 = B. Interleaved.
    const std::vector<float>& buffer(int index) const {
        return index == 0 ? mBufferA : mBufferB;
    }

    uint64_t frameCount()   const { return mFrameCount; }
    int      channelCount() const { return mChannels; }
    int      sampleRate()   const { return mSampleRate; }
    bool     normalized()   const { return mNormalized; }

    double durationSec() const {
        return mSampleRate > 0 ? static_cast<double>(mFrameCount) / mSampleRate : 0.0;
    }

private:
    std::vector<float> mBufferA;
    std::vector<float> mBufferB;
    uint64_t           mFrameCount = 0;
    int                mChannels   = 0;
    int                mSampleRate = 0;
    bool               mNormalized = false;
};

/// Largest absolute sample value over all channels.
float peakAbs(const std::vector<float>& samples);

/// Scale every sample by target / peak. A silent buffer (peak == 0) is left
/// untouched. Returns the gain that was applied (1.0 for silence).
float normalizePeak(std::vector<float>& samples, float target);
