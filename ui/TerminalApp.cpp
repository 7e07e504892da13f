#include "TerminalApp.hpp"
#include "Renderer.hpp"
#include "Terminal.hpp"
#include "ftpdeck/Log.hpp"
#include "ftpdeck/Url.hpp"

#include <ncurses.h>

using namespace ftpdeck;

int TerminalApp::translateKey(int ch) {
    switch (ch) {
        case KEY_UP:        return key::Up;
        case KEY_DOWN:      return key::Down;
        case KEY_LEFT:      return key::Left;
        case KEY_RIGHT:     return key::Right;
        case KEY_PPAGE:     return key::PageUp;
        case KEY_NPAGE:     return key::PageDown;
        case KEY_HOME:      return key::Home;
        case KEY_END:       return key::End;
        case KEY_ENTER:     return key::Enter;
        case KEY_BACKSPACE: return key::Backspace;
        case KEY_RESIZE:    return -1;
        default:
            break;
    }
    if (ch >= 0 && ch < 256) return ch;
    return -1;
}

int TerminalApp::run(const std::optional<Address>& url) {
    Terminal term;
    NcursesScreen screen;
    Renderer renderer(screen);

    controller_.setViewRows(static_cast<std::size_t>(Renderer::listRows(screen.size())));
    const Address first = url ? *url : controller_.targetAddress();
    renderer.drawNotice("Connecting to " + formatUrl(first) + " ...");
    controller_.start(url);

    while (controller_.state() != ControllerState::Quit) {
        controller_.tick();
        if (controller_.editPending()) {
            renderer.draw(controller_);
            term.suspend();
            controller_.runPendingEdit();
            term.resume();
            continue;
        }
        if (controller_.state() == ControllerState::Quit) break;

        controller_.setViewRows(static_cast<std::size_t>(Renderer::listRows(screen.size())));
        renderer.draw(controller_);

        // Poll while a batch runs so the progress bar moves
        term.setInputTimeout(controller_.transferring() ? 100 : -1);
        const int ch = term.readKey();
        if (ch == ERR) continue;
        const int k = translateKey(ch);
        if (k >= 0) controller_.handleKey(k);
    }
    LOGI("leaving interactive mode");
    return 0;
}
