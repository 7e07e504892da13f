// Screen layout:
//   row 0          header with connection status
//   row 1          path bar of each pane
//   rows 2..h-3    listings, local left and remote right
//   row h-2        key help
//   row h-1        progress bar or status message
#include "Renderer.hpp"

#include <algorithm>
#include <cstdio>

using namespace ftpdeck;

std::string formatSize(double bytes, bool trimmed) {
    static const char* kUnits[] = {"B", "KB", "MB", "GB"};
    const char* unit = "TB";
    for (const char* u : kUnits) {
        if (bytes < 1024) {
            unit = u;
            break;
        }
        bytes /= 1024;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), trimmed ? "%.1f %s" : "%7.1f %s", bytes, unit);
    return buf;
}

static std::size_t sequenceLength(unsigned char c) {
    if (c < 0x80) return 1;
    if ((c >> 5) == 0x6) return 2;
    if ((c >> 4) == 0xE) return 3;
    if ((c >> 3) == 0x1E) return 4;
    return 1;
}

static int columns(const std::string& text) {
    int n = 0;
    for (std::size_t i = 0; i < text.size(); i += sequenceLength(static_cast<unsigned char>(text[i]))) ++n;
    return n;
}

std::string fitColumns(const std::string& text, int width) {
    if (width <= 0) return std::string();
    std::string out;
    int cols = 0;
    std::size_t i = 0;
    while (i < text.size() && cols < width) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        const std::size_t len = sequenceLength(c);
        if (i + len > text.size()) break;
        if (c < 0x20) out += '?';
        else out.append(text, i, len);
        i += len;
        ++cols;
    }
    out.append(static_cast<std::size_t>(width - cols), ' ');
    return out;
}

// Last width columns of text
static std::string tailColumns(const std::string& text, int width) {
    int extra = columns(text) - width;
    std::size_t i = 0;
    while (extra-- > 0 && i < text.size()) i += sequenceLength(static_cast<unsigned char>(text[i]));
    return fitColumns(text.substr(i), width);
}

static std::string centered(const std::string& text, int width) {
    const int pad = std::max(0, (width - columns(text)) / 2);
    return fitColumns(std::string(static_cast<std::size_t>(pad), ' ') + text, width);
}

static const char* verbFor(JobKind k) {
    switch (k) {
        case JobKind::Upload:   return "Uploading";
        case JobKind::Download: return "Downloading";
        case JobKind::Delete:   return "Deleting";
        case JobKind::Mkdir:    return "Creating";
        case JobKind::Rename:   return "Renaming";
    }
    return "Working";
}

int Renderer::listRows(ScreenSize size) {
    return std::max(1, size.rows - 4);
}

void Renderer::drawNotice(const std::string& text) {
    ScreenSize sz = screen_.size();
    screen_.clear();
    screen_.drawText(sz.rows / 2, 0, centered(text, sz.cols), palette::Info, AttrBold);
    screen_.refresh();
}

void Renderer::draw(const SessionController& c) {
    const ScreenSize sz = screen_.size();
    screen_.clear();
    if (sz.rows < 6 || sz.cols < 30) {
        screen_.drawText(0, 0, fitColumns("Terminal too small", sz.cols));
        screen_.refresh();
        return;
    }

    drawHeader(c, sz.cols);
    if (c.modal().kind == ModalKind::Viewer) {
        drawViewer(c.modal(), sz);
        screen_.refresh();
        return;
    }

    const int half = sz.cols / 2;
    drawPane(c, Side::Local, 0, half, listRows(sz));
    drawPane(c, Side::Remote, half, sz.cols - half, listRows(sz));
    drawHelp(c, sz.rows - 2, sz.cols);
    drawStatus(c, sz.rows - 1, sz.cols);
    drawModal(c, sz);
    screen_.refresh();
}

void Renderer::drawHeader(const SessionController& c, int cols) {
    screen_.drawText(0, 0, centered("═══ ftpdeck ═══", cols), palette::Header, AttrBold);
    std::string status;
    int color;
    if (c.connected()) {
        status = " ● " + std::string(protocolScheme(c.address().protocol)) + "://" + c.address().display() + " ";
        color = palette::Success;
    } else {
        status = " ○ Disconnected ";
        color = palette::Error;
    }
    const int w = columns(status);
    if (w < cols) screen_.drawText(0, cols - w - 1, status, color, AttrBold);
}

void Renderer::drawPane(const SessionController& c, Side side, int x, int width, int rows) {
    const Pane& p = c.pane(side);
    const bool active = c.activeSide() == side;
    const bool local = side == Side::Local;
    const int pathColor = local ? palette::LocalPath : palette::RemotePath;
    const int selColor = local ? palette::LocalSelected : palette::RemoteSelected;
    const int dirColor = local ? palette::LocalDir : palette::RemoteDir;

    std::string bar = local ? " LOCAL: " : " REMOTE: ";
    if (!local && !c.connected()) bar += "(disconnected)";
    else bar += c.cwd(side);
    if (!p.selection.empty()) bar += "  [" + std::to_string(p.selection.size()) + " marked]";
    screen_.drawText(1, x, fitColumns(bar, width), pathColor, active ? AttrBold | AttrReverse : AttrPlain);

    if (!local && !c.connected()) {
        screen_.drawText(2, x, fitColumns(" Not connected", width), palette::Error);
        screen_.drawText(3, x, fitColumns(" c: connect   s: set server", width), palette::Help);
        return;
    }
    if (p.entries.empty()) {
        screen_.drawText(2, x, fitColumns(" (empty)", width));
        return;
    }

    const int sizeCols = 10;
    for (int i = 0; i < rows; ++i) {
        const std::size_t idx = p.scroll + static_cast<std::size_t>(i);
        if (idx >= p.entries.size()) break;
        const DirEntry& e = p.entries[idx];
        const bool marked = p.isMarked(e.name);

        std::string size;
        if (e.name == "..") size = std::string(sizeCols, ' ');
        else if (e.isDir()) size = "     <DIR>";
        else size = formatSize(static_cast<double>(e.size_bytes));
        size = fitColumns(size, sizeCols);

        std::string name = std::string(marked ? " *" : "  ") + e.name + (e.isDir() && e.name != ".." ? "/" : "");
        std::string line = fitColumns(name, width - sizeCols - 1) + size + " ";

        int color = 0;
        int attrs = AttrPlain;
        if (idx == p.cursor && active) {
            color = selColor;
            attrs = AttrBold;
        } else if (marked) {
            color = palette::Marked;
            attrs = AttrBold;
        } else if (e.isDir()) {
            color = dirColor;
        }
        if (idx == p.cursor && !active) attrs |= AttrBold;
        screen_.drawText(2 + i, x, line, color, attrs);
    }
}

void Renderer::drawHelp(const SessionController& c, int row, int cols) {
    std::string help;
    if (c.transferring())
        help = " x:Cancel │ ↑↓:Nav │ Space:Mark │ /:Search │ q:Quit ";
    else if (!c.connected())
        help = " c:Connect │ s:Set Server │ Tab:Switch Pane │ q:Quit ";
    else if (c.activeSide() == Side::Remote)
        help = " ↑↓:Nav │ Enter:Open │ Space:Mark │ d:Down │ D:Del │ r:Rename │ m:Mkdir │ /:Search │ v:View │ e:Edit │ Tab:Local │ c:Disc │ q:Quit ";
    else
        help = " ↑↓:Nav │ Enter:Open │ Space:Mark │ u:Upload │ D:Del │ r:Rename │ m:Mkdir │ /:Search │ Tab:Remote │ c:Disc │ q:Quit ";
    screen_.drawText(row, 0, centered(help, cols - 1), palette::Help);
}

double Renderer::speed(const ProgressSnapshot& p) {
    const auto now = std::chrono::steady_clock::now();
    if (p.batch_token != speedToken_) {
        speedToken_ = p.batch_token;
        speedBytes_ = p.bytes_done;
        speedAt_ = now;
        speed_ = 0;
        return speed_;
    }
    const double dt = std::chrono::duration<double>(now - speedAt_).count();
    if (dt >= 0.5) {
        speed_ = static_cast<double>(p.bytes_done - speedBytes_) / dt;
        speedBytes_ = p.bytes_done;
        speedAt_ = now;
    }
    return speed_;
}

void Renderer::drawStatus(const SessionController& c, int row, int cols) {
    if (c.transferring() && c.progress()) {
        const ProgressSnapshot& p = *c.progress();
        double frac = 0;
        if (p.bytes_total > 0) frac = static_cast<double>(p.bytes_done) / static_cast<double>(p.bytes_total);
        else if (p.job_count > 0) frac = static_cast<double>(p.current_job_index) / static_cast<double>(p.job_count);
        frac = std::clamp(frac, 0.0, 1.0);

        std::string name = p.current_name;
        if (columns(name) > 18) name = fitColumns(name, 16) + "..";

        std::string text = std::string(" ") + verbFor(c.batchKind()) + ": " + name;
        const int barWidth = std::clamp(cols - 90, 0, 30);
        if (barWidth > 0) {
            const int filled = static_cast<int>(barWidth * frac);
            std::string bar;
            for (int i = 0; i < barWidth; ++i) bar += i < filled ? "█" : "░";
            text += "  [" + bar + "]";
        }
        char pct[16];
        std::snprintf(pct, sizeof(pct), " %5.1f%%", frac * 100.0);
        text += pct;
        if (p.bytes_total > 0) {
            text += "  " + formatSize(static_cast<double>(p.bytes_done), true) + "/" +
                    formatSize(static_cast<double>(p.bytes_total), true);
            text += "  " + formatSize(speed(p), true) + "/s";
        }
        text += "  (" + std::to_string(p.current_job_index) + "/" + std::to_string(p.job_count) + ")  (x to cancel)";
        screen_.drawText(row, 0, fitColumns(text, cols - 1), palette::Info, AttrBold);
        return;
    }

    const StatusMessage& m = c.message();
    int color = palette::Info;
    if (m.kind == MessageKind::Success) color = palette::Success;
    else if (m.kind == MessageKind::Error) color = palette::Error;
    screen_.drawText(row, 0, fitColumns(" " + m.text, cols - 1), color);
}

void Renderer::drawBox(int top, int left, int height, int width, int color) {
    std::string rule;
    for (int i = 0; i < width - 2; ++i) rule += "─";
    screen_.drawText(top, left, "┌" + rule + "┐", color);
    for (int r = 1; r < height - 1; ++r)
        screen_.drawText(top + r, left, "│" + std::string(static_cast<std::size_t>(width - 2), ' ') + "│", color);
    screen_.drawText(top + height - 1, left, "└" + rule + "┘", color);
}

void Renderer::drawModal(const SessionController& c, ScreenSize sz) {
    const ModalView& m = c.modal();
    if (m.kind == ModalKind::None || m.kind == ModalKind::Viewer) return;

    if (m.kind == ModalKind::ConfirmDelete || m.kind == ModalKind::ConfirmOverwrite) {
        int color = palette::DangerModal;
        if (m.kind == ModalKind::ConfirmOverwrite)
            color = c.activeSide() == Side::Local ? palette::UploadModal : palette::DownloadModal;
        const int w = std::clamp(columns(m.title) + 6, 40, sz.cols - 4);
        const int top = sz.rows / 2 - 3;
        const int left = (sz.cols - w) / 2;
        drawBox(top, left, 5, w, color);
        screen_.drawText(top + 1, left + 2, fitColumns(m.title, w - 4), color, AttrBold);
        screen_.drawText(top + 3, left + 2, centered("[Enter/y] Yes    [any other key] No", w - 4));
        return;
    }

    if (m.kind == ModalKind::TextInput) {
        const int w = std::clamp(std::max(columns(m.title), columns(m.input)) + 8, 50, sz.cols - 4);
        const int top = sz.rows / 2 - 3;
        const int left = (sz.cols - w) / 2;
        drawBox(top, left, 6, w, palette::Info);
        screen_.drawText(top + 1, left + 2, fitColumns(m.title, w - 4), palette::Info, AttrBold);
        screen_.drawText(top + 2, left + 2, "> " + tailColumns(m.input + "_", w - 6));
        if (!m.error.empty()) screen_.drawText(top + 3, left + 2, fitColumns(m.error, w - 4), palette::Error, AttrBold);
        screen_.drawText(top + 4, left + 2, fitColumns("Enter: OK   Esc: cancel", w - 4), palette::Help);
        return;
    }

    // Editor: the terminal is about to be handed over
    const int w = std::clamp(columns(m.title) + 8, 30, sz.cols - 4);
    const int top = sz.rows / 2 - 2;
    const int left = (sz.cols - w) / 2;
    drawBox(top, left, 3, w, palette::Info);
    screen_.drawText(top + 1, left + 2, fitColumns(m.title + "...", w - 4), palette::Info, AttrBold);
}

void Renderer::drawViewer(const ModalView& m, ScreenSize sz) {
    const int rows = listRows(sz);
    const std::size_t first = m.scroll;
    const std::size_t last = std::min(m.lines.size(), first + static_cast<std::size_t>(rows));
    std::string bar = " " + m.title + "   lines " + std::to_string(m.lines.empty() ? 0 : first + 1) + "-" +
                      std::to_string(last) + "/" + std::to_string(m.lines.size());
    screen_.drawText(1, 0, fitColumns(bar, sz.cols), palette::RemotePath, AttrBold | AttrReverse);
    for (std::size_t i = first; i < last; ++i)
        screen_.drawText(2 + static_cast<int>(i - first), 0, fitColumns(m.lines[i], sz.cols));
    screen_.drawText(sz.rows - 1, 0, centered("↑↓ PgUp PgDn Home End: scroll   q/Esc: close", sz.cols - 1),
                     palette::Help);
}
