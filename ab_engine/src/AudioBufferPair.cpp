#include "AudioBufferPair.hpp"
#include "WavUtils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

float peakAbs(const std::vector<float>& samples) {
    float peak = 0.0f;
    for (float s : samples) {
        peak = std::max(peak, std::fabs(s));
    }
    return peak;
}

float normalizePeak(std::vector<float>& samples, float target) {
    const float peak = peakAbs(samples);
    // silence stays silence
    if (peak == 0.0f) return 1.0f;

    const float gain = target / peak;
    for (float& s : samples) {
        s *= gain;
    }
    return gain;
}

AudioBufferPair AudioBufferPair::load(const std::string& pathA,
                                      const std::string& pathB,
                                      bool normalize,
                                      float target) {
    WavData a = WavUtils::loadWav(pathA);
    WavData b = WavUtils::loadWav(pathB);
    return fromWavData(std::move(a), std::move(b), normalize, target);
}

AudioBufferPair AudioBufferPair::fromWavData(WavData a, WavData b,
                                             bool normalize,
                                             float target) {
    if (a.sampleRate != b.sampleRate) {
        throw RateMismatchError("Sample rates differ (A=" + std::to_string(a.sampleRate)
                                + ", B=" + std::to_string(b.sampleRate) + ")");
    }
    if (a.channels != b.channels) {
        throw ChannelMismatchError("Channel counts differ (A=" + std::to_string(a.channels)
                                   + ", B=" + std::to_string(b.channels) + ")");
    }

    const uint64_t frames = std::min(a.frames(), b.frames());
    if (frames == 0) {
        throw EmptyAudioError("Nothing to compare: at least one input has no audio frames");
    }

    if (a.frames() != b.frames()) {
        std::cout << "[Loader] Length mismatch (A=" << a.frames() << ", B=" << b.frames()
                  << " frames), truncating both to " << frames << "\n";
    }

    const size_t samples = static_cast<size_t>(frames) * static_cast<size_t>(a.channels);
    a.samples.resize(samples);
    b.samples.resize(samples);

    if (normalize) {
        // each buffer gets its own gain; A and B are not matched to each other
        float gainA = normalizePeak(a.samples, target);
        float gainB = normalizePeak(b.samples, target);
        std::cout << "[Loader] Normalized to peak " << target
                  << " (gain A=" << gainA << ", B=" << gainB << ")\n";
    }

    AudioBufferPair pair;
    pair.mBufferA    = std::move(a.samples);
    pair.mBufferB    = std::move(b.samples);
    pair.mFrameCount = frames;
    pair.mChannels   = a.channels;
    pair.mSampleRate = a.sampleRate;
    pair.mNormalized = normalize;
    return pair;
}
