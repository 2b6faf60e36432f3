// PlaybackBackend.hpp — Audio Backend Adapter
//
// Wraps AlloLib's AudioIO for the A/B player. This is the ONLY file that
// touches AudioIO; the rest of the engine only sees RenderEngine.
//
// RESPONSIBILITIES:
// 1. Open the output device at the buffer pair's sample rate and channel
//    count with the configured block size (optionally a specific device).
// 2. Register the top-level audio callback and forward each block to
//    RenderEngine.
// 3. De-interleave the rendered block into AlloLib's per-channel buffers.
// 4. Start / stop / close the stream.
//
// DESIGN NOTES:
// - The callback is static (AlloLib's C-style callback). It recovers `this`
//   from io.user() and dispatches to processBlock().
// - RenderEngine writes interleaved frames into mScratch, which is sized in
//   init() after open() to the larger of blockSize and the device's actual
//   framesPerBuffer, so each hardware block is one render() call and one
//   transport snapshot. The chunk loop in processBlock() only matters if the
//   device later hands over a bigger block than it reported.
// - AudioIO cannot be aborted from inside the callback. When RenderEngine
//   reports Abort the callback writes silence and raises mStopRequested; the
//   main thread tears the stream down with shutdown().
//
// REFERENCE: AlloLib AudioIO API (al/io/al_AudioIO.hpp)
//   AudioIO::init(callback, userData, framesPerBuf, framesPerSec, outChans, inChans)
//   AudioIO::deviceOut(AudioDevice)
//   AudioIO::open() / start() / stop() / close()
//   AudioIOData::outBuffer(chan) → per-channel output buffer
//   AudioIOData::framesPerBuffer() / channelsOut()

#pragma once

#include <algorithm>
#include <atomic>
#include <cstring>  // memset
#include <iostream>
#include <vector>

#include "al/io/al_AudioIO.hpp"

#include "PlaybackTypes.hpp"
#include "RenderEngine.hpp"

class PlaybackBackend {
public:

    PlaybackBackend(const PlaybackConfig& config, RenderEngine& engine,
                    int sampleRate, int channels)
        : mConfig(config), mEngine(engine),
          mSampleRate(sampleRate), mChannels(channels) {}

    ~PlaybackBackend() {
        shutdown();
    }

    PlaybackBackend(const PlaybackBackend&) = delete;
    PlaybackBackend& operator=(const PlaybackBackend&) = delete;

    // ── Lifecycle ────────────────────────────────────────────────────────

    /// Open the audio device. Must be called before start().
    /// Returns false on any device error.
    bool init() {
        std::cout << "[Backend] Initializing audio device..." << std::endl;
        std::cout << "  Sample rate:      " << mSampleRate << " Hz" << std::endl;
        std::cout << "  Block size:       " << mConfig.blockSize << " frames" << std::endl;
        std::cout << "  Output channels:  " << mChannels << std::endl;

        mAudioIO.init(
            audioCallback,              // static callback function
            this,                       // userData → passed back in callback
            mConfig.blockSize,          // frames per buffer
            (double)mSampleRate,        // sample rate
            mChannels,                  // output channels
            0                           // no input
        );

        if (mConfig.deviceIndex >= 0) {
            if (mConfig.deviceIndex >= al::AudioDevice::numDevices()) {
                std::cerr << "[Backend] ERROR: No audio device with index "
                          << mConfig.deviceIndex << " (" << al::AudioDevice::numDevices()
                          << " devices available, see --list-devices)." << std::endl;
                return false;
            }
            al::AudioDevice dev(mConfig.deviceIndex);
            if (!dev.valid() || !dev.hasOutput()) {
                std::cerr << "[Backend] ERROR: Device " << mConfig.deviceIndex
                          << " is not an output device." << std::endl;
                return false;
            }
            std::cout << "  Device:           [" << mConfig.deviceIndex << "] "
                      << dev.name() << std::endl;
            mAudioIO.deviceOut(dev);
            mAudioIO.channelsOut(mChannels);
        }

        if (!mAudioIO.open()) {
            std::cerr << "[Backend] ERROR: Failed to open audio device." << std::endl;
            return false;
        }

        mInitialized = true;
        std::cout << "[Backend] Audio device opened successfully." << std::endl;
        std::cout << "  Actual output channels: " << mAudioIO.channelsOut() << std::endl;
        std::cout << "  Actual buffer size:     " << mAudioIO.framesPerBuffer() << std::endl;

        if (mAudioIO.channelsOut() < mChannels) {
            std::cerr << "[Backend] ERROR: Device offers " << mAudioIO.channelsOut()
                      << " output channels, program needs " << mChannels << "." << std::endl;
            shutdown();
            return false;
        }

        const int deviceFrames = static_cast<int>(mAudioIO.framesPerBuffer());
        if (deviceFrames != mConfig.blockSize) {
            std::cout << "[Backend] WARNING: Device uses " << deviceFrames
                      << "-frame blocks instead of " << mConfig.blockSize << "." << std::endl;
        }

        // Pre-allocate the interleaved render buffer before audio starts.
        mScratchFrames = std::max(mConfig.blockSize, deviceFrames);
        mScratch.assign(static_cast<size_t>(mScratchFrames) * mChannels, 0.0f);
        return true;
    }

    /// Start audio streaming. Returns false on failure.
    bool start() {
        if (!mInitialized) {
            std::cerr << "[Backend] ERROR: Cannot start — not initialized." << std::endl;
            return false;
        }
        std::cout << "[Backend] Starting audio stream..." << std::endl;

        if (!mAudioIO.start()) {
            std::cerr << "[Backend] ERROR: Failed to start audio stream." << std::endl;
            return false;
        }
        std::cout << "[Backend] Audio stream started." << std::endl;
        return true;
    }

    /// Stop streaming. Blocks until the device has stopped calling back.
    void stop() {
        if (mAudioIO.isRunning()) {
            mAudioIO.stop();
        }
    }

    /// Full shutdown: stop stream and close device.
    void shutdown() {
        stop();
        if (mInitialized) {
            mAudioIO.close();
            mInitialized = false;
        }
    }

    /// True once the render path has seen quit.
    bool stopRequested() const {
        return mStopRequested.load(std::memory_order_relaxed);
    }

    /// Print AlloLib's view of the audio devices.
    static void listDevices() {
        al::AudioDevice::printAll();
    }

private:

    // ── Static audio callback (C-style, required by AlloLib) ─────────────

    static void audioCallback(al::AudioIOData& io) {
        PlaybackBackend* self = static_cast<PlaybackBackend*>(io.user());
        if (self) {
            self->processBlock(io);
        }
    }

    // ── Per-block processing (called on audio thread) ────────────────────
    //
    // REAL-TIME CONTRACT: no allocation, no I/O. The only wait is the
    // transport lock inside RenderEngine::render().

    void processBlock(al::AudioIOData& io) {
        const unsigned int numFrames   = static_cast<unsigned int>(io.framesPerBuffer());
        const unsigned int numChannels = static_cast<unsigned int>(io.channelsOut());
        const unsigned int ourChannels = static_cast<unsigned int>(mChannels);
        const unsigned int chunkCap    = static_cast<unsigned int>(mScratchFrames);

        // Channels the program does not feed stay silent.
        for (unsigned int ch = ourChannels; ch < numChannels; ++ch)
            std::memset(io.outBuffer(ch), 0, numFrames * sizeof(float));

        unsigned int done = 0;
        while (done < numFrames) {
            const unsigned int n = std::min(chunkCap, numFrames - done);

            if (mEngine.render(mScratch.data(), n) == RenderStatus::Abort) {
                mStopRequested.store(true, std::memory_order_relaxed);
            }

            const unsigned int copyCh = std::min(ourChannels, numChannels);
            for (unsigned int ch = 0; ch < copyCh; ++ch) {
                float* dst = io.outBuffer(ch) + done;
                for (unsigned int f = 0; f < n; ++f) {
                    dst[f] = mScratch[f * ourChannels + ch];
                }
            }
            done += n;
        }
    }

    // ── Member data ──────────────────────────────────────────────────────

    const PlaybackConfig& mConfig;
    RenderEngine&         mEngine;
    const int             mSampleRate;
    const int             mChannels;

    al::AudioIO        mAudioIO;
    bool               mInitialized = false;
    std::vector<float> mScratch;              // interleaved, mScratchFrames × channels
    int                mScratchFrames = 0;
    std::atomic<bool>  mStopRequested{false}; // audio thread writes, main reads
};
