// Drawing surface the renderer paints on; ncurses in the app, a recorder in tests.
#pragma once
#include <string>

struct ScreenSize {
    int rows;
    int cols;
};

enum ScreenAttr { AttrPlain = 0, AttrBold = 1, AttrReverse = 2 };

// Colour pair ids; 0 is the terminal default
namespace palette {
enum : int {
    Info = 1,
    Success,
    Error,
    Help,
    Header,
    RemotePath,
    RemoteSelected,
    RemoteDir,
    LocalPath,
    LocalSelected,
    LocalDir,
    DangerModal,
    UploadModal,
    DownloadModal,
    Marked
};
} // namespace palette

class Screen {
public:
    virtual ~Screen() = default;
    virtual ScreenSize size() const = 0;
    virtual void clear() = 0;
    // text is already fitted to the space it may use
    virtual void drawText(int row, int col, const std::string& text, int colorPair = 0, int attrs = AttrPlain) = 0;
    virtual void refresh() = 0;
};
