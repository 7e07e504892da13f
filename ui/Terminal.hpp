// RAII wrapper around ncurses init/teardown, plus the NcursesScreen painter.
#pragma once
#include "Screen.hpp"

class Terminal {
public:
    Terminal();
    ~Terminal();

    Terminal(const Terminal&) = delete;
    Terminal& operator=(const Terminal&) = delete;

    // Hand the tty to a child process (the editor) and take it back.
    void suspend();
    void resume();

    // Milliseconds getch() waits; -1 blocks.
    void setInputTimeout(int ms);
    int readKey();
};

class NcursesScreen : public Screen {
public:
    NcursesScreen();

    ScreenSize size() const override;
    void clear() override;
    void drawText(int row, int col, const std::string& text, int colorPair = 0, int attrs = AttrPlain) override;
    void refresh() override;

private:
    bool colors_ = false;
};
