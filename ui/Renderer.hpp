// Paints the controller's panes, status line, progress bar and modals onto a Screen.
#pragma once
#include "Screen.hpp"
#include "ftpdeck/SessionController.hpp"
#include <chrono>
#include <cstdint>
#include <string>

// "  1.5 MB" (right aligned to 7 digits) or "1.5 MB" when trimmed
std::string formatSize(double bytes, bool trimmed = false);

// Cut or pad to exactly width columns, counting one column per code point.
std::string fitColumns(const std::string& text, int width);

class Renderer {
public:
    explicit Renderer(Screen& screen) : screen_(screen) {}

    void draw(const ftpdeck::SessionController& c);

    // Splash line shown while the first connect blocks.
    void drawNotice(const std::string& text);

    // Listing rows per pane for a screen of this size.
    static int listRows(ScreenSize size);

private:
    void drawHeader(const ftpdeck::SessionController& c, int cols);
    void drawPane(const ftpdeck::SessionController& c, ftpdeck::Side side, int x, int width, int rows);
    void drawHelp(const ftpdeck::SessionController& c, int row, int cols);
    void drawStatus(const ftpdeck::SessionController& c, int row, int cols);
    void drawModal(const ftpdeck::SessionController& c, ScreenSize sz);
    void drawViewer(const ftpdeck::ModalView& m, ScreenSize sz);
    void drawBox(int top, int left, int height, int width, int color);
    double speed(const ftpdeck::ProgressSnapshot& p);

    Screen& screen_;

    // Transfer rate, resampled every half second
    std::uint64_t speedToken_ = 0;
    std::uint64_t speedBytes_ = 0;
    std::chrono::steady_clock::time_point speedAt_{};
    double speed_ = 0;
};
