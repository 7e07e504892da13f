// Helpers shared by the test executables.
#pragma once
#include "ftpdeck/Connector.hpp"
#include "ftpdeck/MockSession.hpp"
#include <QByteArray>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QString>
#include <memory>
#include <string>

namespace testsupport {

inline bool writeFile(const QString& path, const QByteArray& data) {
    if (!QDir().mkpath(QFileInfo(path).path())) return false;
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly)) return false;
    return f.write(data) == data.size();
}

inline QByteArray readFile(const QString& path) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) return QByteArray();
    return f.readAll();
}

inline std::string str(const QString& s) {
    return s.toStdString();
}

// Every session created by the connector talks to the same in-memory server.
inline ftpdeck::SessionFactory mockFactory(std::shared_ptr<ftpdeck::MockRemote> remote) {
    return [remote](ftpdeck::Protocol) -> std::unique_ptr<ftpdeck::Session> {
        return std::make_unique<ftpdeck::MockSession>(remote);
    };
}

inline ftpdeck::Address mockAddress(const std::string& host = "mock.test", const std::string& path = std::string()) {
    ftpdeck::Address a;
    a.protocol = ftpdeck::Protocol::Mock;
    a.host = host;
    a.port = 2121;
    a.user = "tester";
    a.password = "pw";
    a.path = path;
    return a;
}

} // namespace testsupport
