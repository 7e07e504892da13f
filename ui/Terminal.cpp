#include "Terminal.hpp"
#include <ncurses.h>

Terminal::Terminal() {
    initscr();
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    curs_set(0);
    ESCDELAY = 25;
}

Terminal::~Terminal() {
    endwin();
}

void Terminal::suspend() {
    def_prog_mode();
    endwin();
}

void Terminal::resume() {
    reset_prog_mode();
    curs_set(0);
    ::refresh();
}

void Terminal::setInputTimeout(int ms) {
    timeout(ms);
}

int Terminal::readKey() {
    return getch();
}

NcursesScreen::NcursesScreen() {
    if (!has_colors()) return;
    colors_ = true;
    start_color();
    short bg = use_default_colors() == OK ? -1 : COLOR_BLACK;
    init_pair(palette::Info, COLOR_CYAN, bg);
    init_pair(palette::Success, COLOR_GREEN, bg);
    init_pair(palette::Error, COLOR_RED, bg);
    init_pair(palette::Help, COLOR_YELLOW, bg);
    init_pair(palette::Header, COLOR_BLACK, COLOR_CYAN);
    init_pair(palette::RemotePath, COLOR_BLUE, bg);
    init_pair(palette::RemoteSelected, COLOR_WHITE, COLOR_BLUE);
    init_pair(palette::RemoteDir, COLOR_BLUE, bg);
    init_pair(palette::LocalPath, COLOR_CYAN, bg);
    init_pair(palette::LocalSelected, COLOR_WHITE, COLOR_CYAN);
    init_pair(palette::LocalDir, COLOR_CYAN, bg);
    init_pair(palette::DangerModal, COLOR_RED, bg);
    init_pair(palette::UploadModal, COLOR_CYAN, bg);
    init_pair(palette::DownloadModal, COLOR_GREEN, bg);
    init_pair(palette::Marked, COLOR_YELLOW, bg);
}

ScreenSize NcursesScreen::size() const {
    int r, c;
    getmaxyx(stdscr, r, c);
    return {r, c};
}

void NcursesScreen::clear() {
    erase();
}

void NcursesScreen::drawText(int row, int col, const std::string& text, int colorPair, int attrs) {
    attr_t a = A_NORMAL;
    if (attrs & AttrBold) a |= A_BOLD;
    if (attrs & AttrReverse) a |= A_REVERSE;
    if (colors_ && colorPair > 0) a |= COLOR_PAIR(colorPair);
    attron(a);
    // Writing the bottom-right cell reports ERR after drawing; nothing to handle
    mvaddnstr(row, col, text.c_str(), static_cast<int>(text.size()));
    attroff(a);
}

void NcursesScreen::refresh() {
    ::refresh();
}
