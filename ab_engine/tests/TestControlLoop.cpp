#include <catch2/catch.hpp>

#include <atomic>
#include <deque>
#include <string>
#include <vector>

#include <ncurses.h>

#include "ControlLoop.hpp"
#include "TerminalUI.hpp"
#include "TransportState.hpp"

namespace {

// Plays back a fixed list of commands, then None forever. Records every view.
class ScriptedSurface : public ControlSurface {
public:
    explicit ScriptedSurface(std::vector<ControlCommand> script)
        : mScript(script.begin(), script.end()) {}

    void draw(const StatusView& view) override { views.push_back(view); }

    ControlCommand pollCommand() override {
        if (mScript.empty()) return ControlCommand::None;
        ControlCommand c = mScript.front();
        mScript.pop_front();
        return c;
    }

    std::vector<StatusView> views;

private:
    std::deque<ControlCommand> mScript;
};

PlaybackInfo makeInfo(uint64_t frames, int sampleRate = 48000) {
    PlaybackInfo info;
    info.nameA = "orig.wav";
    info.nameB = "hp120.wav";
    info.sampleRate = sampleRate;
    info.frameCount = frames;
    return info;
}

} // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Command → mutation
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Seek commands move by one and five seconds", "[control]") {
    TransportState t(60 * 48000);
    ControlLoop::applyCommand(t, ControlCommand::SeekForward5s, 48000);
    REQUIRE(t.snapshot().position == 240000);
    ControlLoop::applyCommand(t, ControlCommand::SeekBack1s, 48000);
    REQUIRE(t.snapshot().position == 192000);
    ControlLoop::applyCommand(t, ControlCommand::SeekForward1s, 48000);
    REQUIRE(t.snapshot().position == 240000);
    ControlLoop::applyCommand(t, ControlCommand::SeekBack5s, 48000);
    REQUIRE(t.snapshot().position == 0);
}

TEST_CASE("Seek forward one second from 0 in a one-second file clamps", "[control][seek]") {
    TransportState t(48000);
    ControlLoop::applyCommand(t, ControlCommand::SeekForward1s, 48000);
    REQUIRE(t.snapshot().position == 47999);
}

TEST_CASE("Toggle and pause commands leave position alone", "[control][toggle]") {
    TransportState t(48000);
    t.seekBy(24000);
    ControlLoop::applyCommand(t, ControlCommand::ToggleActive, 48000);
    REQUIRE(t.snapshot().active == 1);
    REQUIRE(t.snapshot().position == 24000);
    ControlLoop::applyCommand(t, ControlCommand::TogglePause, 48000);
    REQUIRE_FALSE(t.snapshot().paused);
    REQUIRE(t.snapshot().position == 24000);
}

TEST_CASE("None changes nothing", "[control]") {
    TransportState t(48000);
    t.seekBy(100);
    ControlLoop::applyCommand(t, ControlCommand::None, 48000);
    auto s = t.snapshot();
    REQUIRE(s.position == 100);
    REQUIRE(s.active == 0);
    REQUIRE(s.paused);
    REQUIRE_FALSE(s.quit);
}

// ─────────────────────────────────────────────────────────────────────────────
// Loop
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Loop applies one command per tick and stops on quit", "[control][loop]") {
    TransportState t(10 * 48000);
    ScriptedSurface surface({ControlCommand::TogglePause,
                             ControlCommand::SeekForward5s,
                             ControlCommand::ToggleActive,
                             ControlCommand::Quit});
    ControlLoop loop(t, surface, makeInfo(10 * 48000));
    loop.run();

    REQUIRE(loop.iterations() == 4);
    REQUIRE(surface.views.size() == 4);

    // each view reflects the state before that tick's command
    REQUIRE(surface.views[0].stateText == "PAUSED");
    REQUIRE(surface.views[1].stateText == "PLAYING");
    REQUIRE(surface.views[2].positionText == "   5.0s / 10.0s");
    REQUIRE(surface.views[2].activeLabel == "A");
    REQUIRE(surface.views[3].activeLabel == "B");
    REQUIRE(surface.views[3].activeName == "hp120.wav");

    auto s = t.snapshot();
    REQUIRE(s.quit);
    REQUIRE(s.position == 240000);
}

TEST_CASE("Loop exits when quit was set elsewhere", "[control][loop]") {
    TransportState t(48000);
    t.requestQuit();
    ScriptedSurface surface(std::vector<ControlCommand>{});
    ControlLoop loop(t, surface, makeInfo(48000));
    loop.run();
    REQUIRE(loop.iterations() == 0);
    REQUIRE(surface.views.empty());
}

TEST_CASE("Interrupt flag becomes a locked quit", "[control][loop]") {
    TransportState t(48000);
    std::atomic<bool> interrupted{false};
    ScriptedSurface surface(std::vector<ControlCommand>{});
    ControlLoop loop(t, surface, makeInfo(48000), &interrupted);

    REQUIRE(loop.step());
    REQUIRE(loop.step());
    interrupted.store(true);
    REQUIRE_FALSE(loop.step());
    REQUIRE(t.quitRequested());
    REQUIRE(loop.iterations() == 2);
}

// ─────────────────────────────────────────────────────────────────────────────
// Status formatting
// ─────────────────────────────────────────────────────────────────────────────

static int countCells(const std::string& bar, const std::string& glyph) {
    int n = 0;
    for (size_t p = bar.find(glyph); p != std::string::npos; p = bar.find(glyph, p + glyph.size())) ++n;
    return n;
}

TEST_CASE("Status shows label, name, state and time", "[control][status]") {
    TransportSnapshot snap;
    snap.active = 1;
    snap.paused = false;
    snap.position = 12 * 48000 + 14400;   // 12.3 s
    StatusView v = buildStatus(snap, makeInfo(60 * 48000));

    REQUIRE(v.activeLabel == "B");
    REQUIRE(v.activeName == "hp120.wav");
    REQUIRE(v.stateText == "PLAYING");
    REQUIRE(v.positionText == "  12.3s / 60.0s");
}

TEST_CASE("Progress bar has forty cells filled in proportion", "[control][status]") {
    TransportSnapshot snap;
    snap.position = 48000 / 4;
    StatusView v = buildStatus(snap, makeInfo(48000));

    REQUIRE(v.filledCells == 10);
    REQUIRE(countCells(v.progressBar, "█") == 10);
    REQUIRE(countCells(v.progressBar, "░") == kProgressCells - 10);
}

TEST_CASE("Progress bar is empty at the start and full at the end", "[control][status]") {
    TransportSnapshot snap;
    StatusView start = buildStatus(snap, makeInfo(1000));
    REQUIRE(start.filledCells == 0);

    snap.position = 1000;
    StatusView end = buildStatus(snap, makeInfo(1000));
    REQUIRE(end.filledCells == kProgressCells);
    REQUIRE(countCells(end.progressBar, "░") == 0);
}

// ─────────────────────────────────────────────────────────────────────────────
// Key map
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Keys map to transport commands", "[control][keys]") {
    REQUIRE(TerminalUI::commandForKey(' ') == ControlCommand::TogglePause);
    REQUIRE(TerminalUI::commandForKey('\t') == ControlCommand::ToggleActive);
    REQUIRE(TerminalUI::commandForKey(KEY_LEFT) == ControlCommand::SeekBack1s);
    REQUIRE(TerminalUI::commandForKey(KEY_RIGHT) == ControlCommand::SeekForward1s);
    REQUIRE(TerminalUI::commandForKey('h') == ControlCommand::SeekBack5s);
    REQUIRE(TerminalUI::commandForKey('H') == ControlCommand::SeekBack5s);
    REQUIRE(TerminalUI::commandForKey('l') == ControlCommand::SeekForward5s);
    REQUIRE(TerminalUI::commandForKey('L') == ControlCommand::SeekForward5s);
    REQUIRE(TerminalUI::commandForKey('q') == ControlCommand::Quit);
    REQUIRE(TerminalUI::commandForKey('Q') == ControlCommand::Quit);
}

TEST_CASE("Unmapped keys and timeouts do nothing", "[control][keys]") {
    REQUIRE(TerminalUI::commandForKey(ERR) == ControlCommand::None);
    REQUIRE(TerminalUI::commandForKey('x') == ControlCommand::None);
    REQUIRE(TerminalUI::commandForKey(KEY_UP) == ControlCommand::None);
}
