#include "ExternalEditor.hpp"
#include "ftpdeck/Log.hpp"

#include <QProcess>
#include <QStringList>

bool ExternalEditor::edit(const std::string& path, ftpdeck::Error& err) {
    // "code --wait" and similar carry their own arguments
    QStringList args = QProcess::splitCommand(command_);
    if (args.isEmpty()) {
        err.set(ftpdeck::ErrorCode::Validation, "no editor configured");
        return false;
    }
    const QString program = args.takeFirst();
    args << QString::fromStdString(path);

    QProcess p;
    p.setProcessChannelMode(QProcess::ForwardedChannels);
    p.setInputChannelMode(QProcess::ForwardedInputChannel);
    LOGI("editor: %s %s", program.toLocal8Bit().constData(), path.c_str());
    p.start(program, args);
    if (!p.waitForStarted()) {
        err.set(ftpdeck::ErrorCode::IOError, "cannot start " + program.toStdString() + ": " + p.errorString().toStdString());
        return false;
    }
    p.waitForFinished(-1);
    if (p.exitStatus() != QProcess::NormalExit) {
        err.set(ftpdeck::ErrorCode::IOError, program.toStdString() + " crashed");
        return false;
    }
    if (p.exitCode() != 0) {
        err.set(ftpdeck::ErrorCode::IOError, program.toStdString() + " exited with status " + std::to_string(p.exitCode()));
        return false;
    }
    return true;
}
