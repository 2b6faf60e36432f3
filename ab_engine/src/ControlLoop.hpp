// ControlLoop.hpp — UI-thread polling loop
//
// Each iteration:
//   snapshot transport → draw status → poll at most one command → apply it
//
// Drawing happens on the snapshot, outside the transport lock. Applying a
// command takes the lock once for an O(1) update. The loop ends the first
// time it sees quit, whoever set it.
//
// The surface (terminal, test script) sits behind ControlSurface so the loop
// itself has no curses dependency. The surface owns pacing: pollCommand()
// waits at most one poll interval.

#pragma once

#include <atomic>
#include <cstdint>
#include <string>

#include "PlaybackTypes.hpp"
#include "TransportState.hpp"

enum class ControlCommand {
    None,
    TogglePause,
    ToggleActive,
    SeekBack1s,
    SeekForward1s,
    SeekBack5s,
    SeekForward5s,
    Quit
};

/// Static facts the status line needs. Fixed after load.
struct PlaybackInfo {
    std::string nameA;
    std::string nameB;
    int         sampleRate = 0;
    uint64_t    frameCount = 0;
};

/// Display-ready status, built from one snapshot.
struct StatusView {
    std::string activeLabel;    // "A" or "B"
    std::string activeName;     // file name of the audible buffer
    std::string stateText;      // "PLAYING" / "PAUSED"
    std::string positionText;   // "  12.3s / 60.0s"
    std::string progressBar;    // kProgressCells cells, UTF-8
    int         filledCells = 0;
};

constexpr int kProgressCells = 40;

StatusView buildStatus(const TransportSnapshot& snap, const PlaybackInfo& info);

class ControlSurface {
public:
    virtual ~ControlSurface() = default;

    virtual void draw(const StatusView& view) = 0;

    /// Return at most one command. Waits no longer than one poll interval.
    virtual ControlCommand pollCommand() = 0;
};

class ControlLoop {
public:

    /// `interrupt` is an optional async-signal flag (SIGINT/SIGTERM). When it
    /// goes true the loop requests quit under the lock on its next iteration.
    ControlLoop(TransportState& transport,
                ControlSurface& surface,
                PlaybackInfo info,
                const std::atomic<bool>* interrupt = nullptr);

    /// Translate one command into one transport mutation.
    static void applyCommand(TransportState& transport, ControlCommand cmd, int sampleRate);

    /// One iteration. Returns false once quit has been observed.
    bool step();

    /// Iterate until quit.
    void run();

    uint64_t iterations() const { return mIterations; }

private:
    TransportState&          mTransport;
    ControlSurface&          mSurface;
    PlaybackInfo             mInfo;
    const std::atomic<bool>* mInterrupt = nullptr;
    uint64_t                 mIterations = 0;
};
