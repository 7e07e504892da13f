// User preferences from $XDG_CONFIG_HOME/ftpdeck/ftpdeck.ini.
#pragma once
#include "ftpdeck/Types.hpp"
#include <QString>
#include <cstddef>

struct AppSettings {
    ftpdeck::Address default_address;  // fallback tier after the stored record
    int         timeout_sec = 10;
    std::size_t chunk_kib = 64;
    int         progress_interval_ms = 100;
    QString     local_start_dir;
    bool        show_hidden = false;
    QString     editor;

    // Missing or invalid keys keep their defaults.
    static AppSettings load(const QString& path = defaultPath());
    static QString defaultPath();
};
