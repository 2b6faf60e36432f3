// TransportState.hpp — Play/pause/position/track state shared by both threads
//
// One std::mutex guards all four fields. The control thread mutates through
// the methods below; the render thread goes through RenderEngine, which is a
// friend so it can hold the lock for exactly one block copy.
//
// Critical sections are O(1) here and O(frames copied) in RenderEngine.
// Callers must not print or draw while holding the lock; the methods never
// hand the lock out.

#pragma once

#include <algorithm>
#include <cstdint>
#include <mutex>

#include "PlaybackTypes.hpp"

class TransportState {
public:

    /// Bind to a buffer pair of frameCount frames. Starts paused on A at 0.
    explicit TransportState(uint64_t frameCount)
        : mFrameCount(frameCount) {}

    TransportState(const TransportState&) = delete;
    TransportState& operator=(const TransportState&) = delete;

    /// Length of the comparison window. Immutable, no lock needed.
    uint64_t frameCount() const { return mFrameCount; }

    /// All fields taken under one lock.
    TransportSnapshot snapshot() const {
        std::lock_guard<std::mutex> lock(mMutex);
        TransportSnapshot s;
        s.active   = mActive;
        s.paused   = mPaused;
        s.position = mPosition;
        s.quit     = mQuit;
        return s;
    }

    void togglePause() {
        std::lock_guard<std::mutex> lock(mMutex);
        mPaused = !mPaused;
    }

    /// Switch A <-> B. Position is left exactly where it is.
    void toggleActive() {
        std::lock_guard<std::mutex> lock(mMutex);
        mActive = 1 - mActive;
    }

    /// Move by deltaFrames, clamped into [0, frameCount - 1]. Never wraps.
    void seekBy(int64_t deltaFrames) {
        std::lock_guard<std::mutex> lock(mMutex);
        if (mFrameCount == 0) {
            mPosition = 0;
            return;
        }
        const int64_t last   = static_cast<int64_t>(mFrameCount - 1);
        const int64_t target = static_cast<int64_t>(mPosition) + deltaFrames;
        mPosition = static_cast<uint64_t>(std::max<int64_t>(0, std::min(target, last)));
    }

    void requestQuit() {
        std::lock_guard<std::mutex> lock(mMutex);
        mQuit = true;
    }

    bool quitRequested() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mQuit;
    }

private:
    friend class RenderEngine;

    mutable std::mutex mMutex;
    const uint64_t     mFrameCount;

    // ── Guarded by mMutex ────────────────────────────────────────────────
    int      mActive   = 0;
    bool     mPaused   = true;
    uint64_t mPosition = 0;
    bool     mQuit     = false;
};
