// ftpdeck-send: upload files and folders to the last (or given) server from the command line.
#include <QCommandLineParser>
#include <QCoreApplication>
#include <cstdio>

#include "AppSettings.hpp"
#include "QuickSend.hpp"
#include "SettingsConnectionStore.hpp"
#include "ftpdeck/Endpoint.hpp"
#include "ftpdeck/Url.hpp"

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("ftpdeck-send");
    QCoreApplication::setOrganizationName("ftpdeck");
    QCoreApplication::setApplicationVersion(FTPDECK_VERSION);

    QCommandLineParser parser;
    parser.setApplicationDescription("Quick-send files and folders to an FTP/SFTP server.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("paths", "Files and folders to upload.", "PATH...");
    QCommandLineOption address(QStringList() << "a" << "address", "Upload to <url> instead of the last server.", "url");
    QCommandLineOption wait(QStringList() << "w" << "wait", "Wait for Enter before exiting.");
    parser.addOption(address);
    parser.addOption(wait);
    parser.process(app);

    const AppSettings settings = AppSettings::load();

    std::optional<ftpdeck::Address> url;
    if (parser.isSet(address)) {
        ftpdeck::Address a;
        ftpdeck::Error err;
        if (!ftpdeck::parseUrl(parser.value(address).toStdString(), a, err)) {
            std::fprintf(stderr, "ftpdeck-send: %s\n", err.message.c_str());
            return SendUsage;
        }
        url = a;
    }

    std::vector<std::string> paths;
    for (const QString& p : parser.positionalArguments()) paths.push_back(p.toStdString());

    SettingsConnectionStore store;
    ftpdeck::Connector connector(store);
    connector.setDefaultAddress(settings.default_address);
    connector.setTimeout(settings.timeout_sec * 1000);
    ftpdeck::LocalEndpoint local;
    ftpdeck::RemoteEndpoint remote(connector);

    ftpdeck::QueueOptions qopt;
    qopt.chunk_bytes = settings.chunk_kib * 1024;
    qopt.progress_interval_ms = settings.progress_interval_ms;

    QuickSend send(connector, local, remote, qopt);
    return send.run(paths, url, parser.isSet(wait));
}
