// ConnectionStore persisted with QSettings (INI, group LastConnection).
#pragma once
#include "ftpdeck/ConnectionStore.hpp"
#include <QString>

class SettingsConnectionStore : public ftpdeck::ConnectionStore {
public:
    // $XDG_CONFIG_HOME/ftpdeck/connection.ini
    SettingsConnectionStore();
    explicit SettingsConnectionStore(const QString& path);

    std::optional<ftpdeck::ConnectionRecord> load() override;
    bool save(const ftpdeck::ConnectionRecord& rec, ftpdeck::Error& err) override;

    const QString& path() const { return path_; }
    static QString defaultPath();

private:
    QString path_;
};
