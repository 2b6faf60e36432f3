// RenderEngine.hpp — Per-block render for the A/B playback engine
//
// Pull-based: the backend asks for `frames` interleaved frames and says where
// to write them. One call is one render tick and takes the transport lock
// exactly once, so every tick is drawn from a single (active, paused,
// position) snapshot and never mixes A and B samples.
//
// Per tick:
//   1. quit set       → write silence, return Abort (backend stops the stream)
//   2. paused         → write silence, return Continue
//   3. otherwise copy min(frames, frameCount - position) frames from the
//      active buffer and advance position
//   4. buffer ran out → zero the tail, pause, rewind to 0 (no looping)
//
// REAL-TIME CONTRACT:
// - No allocation, no I/O. The lock is only ever held by the control thread
//   for O(1) updates, so the wait here is bounded.
// - Hold time is O(frames copied).
// - Nothing in here throws. `out` must hold frames × channelCount floats.

#pragma once

#include <algorithm>
#include <cstdint>
#include <mutex>

#include "AudioBufferPair.hpp"
#include "TransportState.hpp"

enum class RenderStatus {
    Continue,   // block written, keep the stream running
    Abort       // quit observed, block is silence, stream should stop
};

class RenderEngine {
public:

    RenderEngine(const AudioBufferPair& buffers, TransportState& transport)
        : mBuffers(buffers), mTransport(transport) {}

    int channelCount() const { return mBuffers.channelCount(); }

    RenderStatus render(float* out, uint64_t frames) {
        const uint64_t channels = static_cast<uint64_t>(mBuffers.channelCount());
        const uint64_t total    = mBuffers.frameCount();

        std::lock_guard<std::mutex> lock(mTransport.mMutex);

        if (mTransport.mQuit) {
            std::fill(out, out + frames * channels, 0.0f);
            return RenderStatus::Abort;
        }

        if (mTransport.mPaused) {
            std::fill(out, out + frames * channels, 0.0f);
            return RenderStatus::Continue;
        }

        const uint64_t start     = mTransport.mPosition;
        const uint64_t available = (start < total) ? (total - start) : 0;
        const uint64_t length    = std::min(frames, available);

        if (length > 0) {
            const float* src = mBuffers.buffer(mTransport.mActive).data() + start * channels;
            std::copy(src, src + length * channels, out);
            mTransport.mPosition = start + length;
        }

        // End of stream: stop and rewind
        if (length < frames) {
            std::fill(out + length * channels, out + frames * channels, 0.0f);
            mTransport.mPaused   = true;
            mTransport.mPosition = 0;
        }

        return RenderStatus::Continue;
    }

private:
    const AudioBufferPair& mBuffers;
    TransportState&        mTransport;
};
