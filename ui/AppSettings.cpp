#include "AppSettings.hpp"
#include "ftpdeck/ConnectionStore.hpp"
#include "ftpdeck/Log.hpp"
#include "ftpdeck/Url.hpp"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>

QString AppSettings::defaultPath() {
    const QString base = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
    return QDir(base).filePath("ftpdeck/ftpdeck.ini");
}

static QString defaultStartDir() {
    const QString downloads = QDir::home().filePath("Downloads");
    return QDir(downloads).exists() ? downloads : QDir::homePath();
}

AppSettings AppSettings::load(const QString& path) {
    AppSettings a;
    a.default_address = ftpdeck::builtinDefaultAddress();
    a.local_start_dir = defaultStartDir();
    a.editor = qEnvironmentVariable("EDITOR", "nano");

    QSettings s(path, QSettings::IniFormat);

    const QString url = s.value("Defaults/url").toString();
    if (!url.isEmpty()) {
        ftpdeck::Address addr;
        ftpdeck::Error err;
        if (ftpdeck::parseUrl(url.toStdString(), addr, err)) a.default_address = addr;
        else LOGW("settings: Defaults/url ignored: %s", err.message.c_str());
    }

    bool ok = false;
    int v = s.value("Network/timeoutSec", a.timeout_sec).toInt(&ok);
    if (ok && v > 0) a.timeout_sec = v;
    v = s.value("Transfer/chunkKiB", static_cast<int>(a.chunk_kib)).toInt(&ok);
    if (ok && v > 0) a.chunk_kib = static_cast<std::size_t>(v);
    v = s.value("Transfer/progressIntervalMs", a.progress_interval_ms).toInt(&ok);
    if (ok && v >= 0) a.progress_interval_ms = v;

    const QString dir = s.value("UI/localStartDir").toString();
    if (!dir.isEmpty()) a.local_start_dir = QDir(dir).exists() ? dir : a.local_start_dir;
    a.show_hidden = s.value("UI/showHidden", false).toBool();
    const QString editor = s.value("UI/editor").toString().trimmed();
    if (!editor.isEmpty()) a.editor = editor;
    return a;
}
