#include "ControlLoop.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

// ─────────────────────────────────────────────────────────────────────────────
// Status formatting
// ─────────────────────────────────────────────────────────────────────────────

StatusView buildStatus(const TransportSnapshot& snap, const PlaybackInfo& info) {
    StatusView v;
    v.activeLabel = (snap.active == 0) ? "A" : "B";
    v.activeName  = (snap.active == 0) ? info.nameA : info.nameB;
    v.stateText   = snap.paused ? "PAUSED" : "PLAYING";

    const double sr         = info.sampleRate > 0 ? static_cast<double>(info.sampleRate) : 1.0;
    const double currentSec = static_cast<double>(snap.position) / sr;
    const double totalSec   = static_cast<double>(info.frameCount) / sr;

    std::ostringstream pos;
    pos << std::fixed << std::setprecision(1)
        << std::setw(6) << currentSec << "s / " << totalSec << "s";
    v.positionText = pos.str();

    const double progress = info.frameCount > 0
        ? static_cast<double>(snap.position) / static_cast<double>(info.frameCount)
        : 0.0;
    v.filledCells = static_cast<int>(kProgressCells * progress);
    if (v.filledCells > kProgressCells) v.filledCells = kProgressCells;

    for (int i = 0; i < kProgressCells; ++i) {
        v.progressBar += (i < v.filledCells) ? "█" : "░";
    }
    return v;
}

// ─────────────────────────────────────────────────────────────────────────────
// ControlLoop
// ─────────────────────────────────────────────────────────────────────────────

ControlLoop::ControlLoop(TransportState& transport,
                         ControlSurface& surface,
                         PlaybackInfo info,
                         const std::atomic<bool>* interrupt)
    : mTransport(transport),
      mSurface(surface),
      mInfo(std::move(info)),
      mInterrupt(interrupt) {}

void ControlLoop::applyCommand(TransportState& transport, ControlCommand cmd, int sampleRate) {
    const int64_t oneSec = sampleRate;
    switch (cmd) {
        case ControlCommand::TogglePause:   transport.togglePause();       break;
        case ControlCommand::ToggleActive:  transport.toggleActive();      break;
        case ControlCommand::SeekBack1s:    transport.seekBy(-oneSec);     break;
        case ControlCommand::SeekForward1s: transport.seekBy(oneSec);      break;
        case ControlCommand::SeekBack5s:    transport.seekBy(-5 * oneSec); break;
        case ControlCommand::SeekForward5s: transport.seekBy(5 * oneSec);  break;
        case ControlCommand::Quit:          transport.requestQuit();       break;
        case ControlCommand::None:                                         break;
    }
}

bool ControlLoop::step() {
    if (mInterrupt && mInterrupt->load(std::memory_order_relaxed)) {
        mTransport.requestQuit();
    }

    const TransportSnapshot snap = mTransport.snapshot();
    if (snap.quit) return false;

    ++mIterations;
    mSurface.draw(buildStatus(snap, mInfo));
    applyCommand(mTransport, mSurface.pollCommand(), mInfo.sampleRate);
    return true;
}

void ControlLoop::run() {
    while (step()) {
    }
}
