#include "TerminalUI.hpp"

#include <clocale>
#include <string>

#include <ncurses.h>

namespace {

std::string repeat(const char* glyph, int n) {
    std::string s;
    for (int i = 0; i < n; ++i) s += glyph;
    return s;
}

} // namespace

TerminalUI::TerminalUI(int pollIntervalMs) {
    // UTF-8 box drawing and progress glyphs need the user's locale
    std::setlocale(LC_ALL, "");
    initscr();
    cbreak();              // keep Ctrl+C as SIGINT
    noecho();
    keypad(stdscr, TRUE);
    curs_set(0);
    timeout(pollIntervalMs);
}

TerminalUI::~TerminalUI() {
    endwin();
}

void TerminalUI::draw(const StatusView& view) {
    static const std::string heavy = repeat("═", 50);
    static const std::string light = repeat("─", 50);

    erase();
    mvaddstr(0, 0, heavy.c_str());
    mvaddstr(1, 0, "  A/B Playback");
    mvaddstr(2, 0, heavy.c_str());

    mvaddstr(4, 0, ("  Active:   [" + view.activeLabel + "] " + view.activeName).c_str());
    mvaddstr(5, 0, ("  Status:   " + view.stateText).c_str());
    mvaddstr(6, 0, ("  Position: " + view.positionText).c_str());
    mvaddstr(8, 0, ("  [" + view.progressBar + "]").c_str());

    mvaddstr(10, 0, light.c_str());
    mvaddstr(11, 0, "  SPACE: play/pause   TAB: toggle A/B");
    mvaddstr(12, 0, "  ←/→: seek ±1s      H/L: seek ±5s");
    mvaddstr(13, 0, "  Q: quit");
    mvaddstr(14, 0, light.c_str());
    refresh();
}

ControlCommand TerminalUI::pollCommand() {
    // ERR on timeout or when a signal interrupts the wait
    return commandForKey(getch());
}

ControlCommand TerminalUI::commandForKey(int key) {
    switch (key) {
        case ' ':       return ControlCommand::TogglePause;
        case '\t':      return ControlCommand::ToggleActive;
        case KEY_LEFT:  return ControlCommand::SeekBack1s;
        case KEY_RIGHT: return ControlCommand::SeekForward1s;
        case 'h':
        case 'H':       return ControlCommand::SeekBack5s;
        case 'l':
        case 'L':       return ControlCommand::SeekForward5s;
        case 'q':
        case 'Q':       return ControlCommand::Quit;
        default:        return ControlCommand::None;
    }
}
