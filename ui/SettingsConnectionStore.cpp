// Last-good connection record in an INI file next to the other settings.
#include "SettingsConnectionStore.hpp"
#include "ftpdeck/Log.hpp"

#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QStandardPaths>

using ftpdeck::ConnectionRecord;

QString SettingsConnectionStore::defaultPath() {
    // GenericConfigLocation follows XDG_CONFIG_HOME on Linux
    const QString base = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
    return QDir(base).filePath("ftpdeck/connection.ini");
}

SettingsConnectionStore::SettingsConnectionStore() : path_(defaultPath()) {}

SettingsConnectionStore::SettingsConnectionStore(const QString& path) : path_(path) {}

std::optional<ConnectionRecord> SettingsConnectionStore::load() {
    if (!QFileInfo::exists(path_)) return std::nullopt;
    QSettings s(path_, QSettings::IniFormat);
    s.beginGroup("LastConnection");
    ConnectionRecord rec;
    rec.last_host = s.value("host").toString().trimmed().toStdString();
    if (rec.last_host.empty()) return std::nullopt;

    if (!ftpdeck::protocolFromScheme(s.value("protocol", "ftp").toString().toLower().toStdString(),
                                     rec.last_protocol)) {
        LOGW("ignoring stored connection with unknown protocol");
        return std::nullopt;
    }
    bool ok = false;
    const uint port = s.value("port", ftpdeck::defaultPort(rec.last_protocol)).toUInt(&ok);
    if (!ok || port > 65535) {
        LOGW("ignoring stored connection with bad port");
        return std::nullopt;
    }
    rec.last_port = static_cast<std::uint16_t>(port);
    rec.last_user = s.value("user").toString().toStdString();
    rec.last_password = s.value("password").toString().toStdString();
    rec.saved_at = s.value("savedAt", 0).toULongLong();
    s.endGroup();
    return rec;
}

bool SettingsConnectionStore::save(const ConnectionRecord& rec, ftpdeck::Error& err) {
    const QString dir = QFileInfo(path_).absolutePath();
    if (!QDir().mkpath(dir)) {
        err.set(ftpdeck::ErrorCode::IOError, "cannot create " + dir.toStdString());
        return false;
    }
    QSettings s(path_, QSettings::IniFormat);
    s.beginGroup("LastConnection");
    s.setValue("host", QString::fromStdString(rec.last_host));
    s.setValue("port", static_cast<int>(rec.last_port));
    s.setValue("user", QString::fromStdString(rec.last_user));
    s.setValue("password", QString::fromStdString(rec.last_password));
    s.setValue("protocol", QString::fromLatin1(ftpdeck::protocolScheme(rec.last_protocol)));
    s.setValue("savedAt", static_cast<qulonglong>(rec.saved_at));
    s.endGroup();
    s.sync();
    if (s.status() != QSettings::NoError) {
        err.set(ftpdeck::ErrorCode::IOError, "cannot write " + path_.toStdString());
        return false;
    }
    LOGI("saved last connection %s:%u", rec.last_host.c_str(), (unsigned)rec.last_port);
    return true;
}
