// PlaybackTypes.hpp — Shared data types for the A/B playback engine
//
// These structs are used across the loader, the render engine, the control
// loop and the backend adapter.
//
// ─────────────────────────────────────────────────────────────────────────────
// THREADING MODEL
// ─────────────────────────────────────────────────────────────────────────────
//
// The engine uses TWO threads:
//
//  ┌───────────────┬───────────────────────────────────────────────────────┐
//  │ Thread        │ Role                                                  │
//  ├───────────────┼───────────────────────────────────────────────────────┤
//  │ MAIN thread   │ Setup, ControlLoop (draw / poll / mutate), shutdown.  │
//  │               │ Owns AudioBufferPair, TransportState and the backend. │
//  ├───────────────┼───────────────────────────────────────────────────────┤
//  │ AUDIO thread  │ AlloLib AudioIO callback at real-time priority.       │
//  │               │ Runs RenderEngine::render() every buffer.             │
//  │               │ MUST NOT allocate or do I/O.                          │
//  └───────────────┴───────────────────────────────────────────────────────┘
//
// SHARED STATE:
//
//  - TransportState (active, paused, position, quit) is guarded by ONE mutex.
//    Every read and every write takes it, including single booleans, so a
//    display snapshot can never pair a position with the wrong track.
//  - AudioBufferPair is immutable after load. Both threads read it without
//    synchronization.
//  - PlaybackBackend::mStopRequested is a relaxed atomic written by the audio
//    thread and polled by main for diagnostics only.
//
// INVARIANTS THAT MUST NEVER BE VIOLATED:
//
//  1. 0 <= position <= frameCount.
//  2. Toggling the active buffer never touches position.
//  3. Seeks clamp into [0, frameCount - 1].
//  4. Nothing prints, draws or blocks while the transport mutex is held.
//
// ─────────────────────────────────────────────────────────────────────────────

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// ─────────────────────────────────────────────────────────────────────────────
// Load-time errors
// ─────────────────────────────────────────────────────────────────────────────
// All of these are fatal: main prints the message and exits with status 1
// before any audio stream is opened.

struct LoadError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct FileNotFoundError : LoadError {
    using LoadError::LoadError;
};

struct DecodeError : LoadError {
    using LoadError::LoadError;
};

struct RateMismatchError : LoadError {
    using LoadError::LoadError;
};

struct ChannelMismatchError : LoadError {
    using LoadError::LoadError;
};

struct EmptyAudioError : LoadError {
    using LoadError::LoadError;
};

struct ConfigError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// ─────────────────────────────────────────────────────────────────────────────
// WavData — one decoded file, interleaved
// ─────────────────────────────────────────────────────────────────────────────

struct WavData {
    int                sampleRate = 0;
    int                channels   = 0;
    std::vector<float> samples;          // [f0c0, f0c1, ..., f1c0, ...]

    uint64_t frames() const {
        if (channels <= 0) return 0;
        return samples.size() / static_cast<uint64_t>(channels);
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// PlaybackConfig — startup configuration
// ─────────────────────────────────────────────────────────────────────────────
// Filled from the optional JSON session file, then overridden by CLI flags.
// Read-only once playback starts.

struct PlaybackConfig {
    // ── Inputs ───────────────────────────────────────────────────────────
    std::string pathA;                    // usually the unprocessed render
    std::string pathB;                    // usually the filtered render
    bool        normalize       = false;  // peak-normalize both buffers
    float       normalizeTarget = 0.95f;  // peak amplitude after normalization

    // ── Audio device settings ────────────────────────────────────────────
    int deviceIndex = -1;                 // -1 = system default output
    int blockSize   = 1024;               // frames per audio callback

    // ── Control loop ─────────────────────────────────────────────────────
    int pollIntervalMs = 50;              // UI tick / key poll timeout

    bool listDevices = false;
};

// ─────────────────────────────────────────────────────────────────────────────
// TransportSnapshot — one consistent copy of the transport fields
// ─────────────────────────────────────────────────────────────────────────────

struct TransportSnapshot {
    int      active   = 0;      // 0 = A, 1 = B
    bool     paused   = true;
    uint64_t position = 0;      // frame index
    bool     quit     = false;
};
