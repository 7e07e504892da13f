// Runs $EDITOR (or the configured command) on a file through QProcess.
#pragma once
#include "ftpdeck/SessionController.hpp"
#include <QString>

class ExternalEditor : public ftpdeck::EditorLauncher {
public:
    explicit ExternalEditor(const QString& command) : command_(command) {}

    // Blocks until the editor exits; the terminal must already be released.
    bool edit(const std::string& path, ftpdeck::Error& err) override;

private:
    QString command_;
};
