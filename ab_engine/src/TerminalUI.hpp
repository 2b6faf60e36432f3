// TerminalUI.hpp — curses implementation of ControlSurface
//
// Owns the terminal for its lifetime: the constructor enters curses mode and
// the destructor restores the terminal with endwin(). Nothing else may write
// to stdout while a TerminalUI exists.
//
// Keys:
//   SPACE      play / pause
//   TAB        toggle A/B at the current position
//   LEFT/RIGHT seek -/+ 1 second
//   h / l      seek -/+ 5 seconds (either case)
//   q          quit (either case)

#pragma once

#include "ControlLoop.hpp"

class TerminalUI : public ControlSurface {
public:

    /// pollIntervalMs becomes the getch() timeout, which paces the loop.
    explicit TerminalUI(int pollIntervalMs);
    ~TerminalUI() override;

    TerminalUI(const TerminalUI&) = delete;
    TerminalUI& operator=(const TerminalUI&) = delete;

    void draw(const StatusView& view) override;
    ControlCommand pollCommand() override;

    /// curses key code → command. Unmapped keys (and ERR) give None.
    static ControlCommand commandForKey(int key);
};
