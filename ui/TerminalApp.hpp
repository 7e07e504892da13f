// The interactive loop: read a key, feed the controller, tick, redraw.
#pragma once
#include "ftpdeck/SessionController.hpp"
#include <optional>

class TerminalApp {
public:
    explicit TerminalApp(ftpdeck::SessionController& controller) : controller_(controller) {}

    // Owns the terminal until the controller reaches Quit. Returns the exit code.
    int run(const std::optional<ftpdeck::Address>& url);

    // ncurses key code -> ftpdeck::key; -1 for keys the controller ignores
    static int translateKey(int ch);

private:
    ftpdeck::SessionController& controller_;
};
