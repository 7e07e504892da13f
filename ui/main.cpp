// Application entry point: read settings, wire the core together and run the terminal UI.
#include <QCommandLineParser>
#include <QCoreApplication>
#include <cstdio>

#include "AppSettings.hpp"
#include "ExternalEditor.hpp"
#include "SettingsConnectionStore.hpp"
#include "TerminalApp.hpp"
#include "ftpdeck/Connector.hpp"
#include "ftpdeck/Endpoint.hpp"
#include "ftpdeck/SessionController.hpp"
#include "ftpdeck/TransferQueue.hpp"
#include "ftpdeck/Url.hpp"

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("ftpdeck");
    QCoreApplication::setOrganizationName("ftpdeck");
    QCoreApplication::setApplicationVersion(FTPDECK_VERSION);

    QCommandLineParser parser;
    parser.setApplicationDescription("Dual-pane terminal file manager for FTP and SFTP servers.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("url", "Server to connect to, e.g. ftp://user@host:21/pub", "[URL]");
    QCommandLineOption localDir(QStringList() << "l" << "local-dir", "Start the local pane in <dir>.", "dir");
    QCommandLineOption config("config", "Read settings from <file> instead of ftpdeck.ini.", "file");
    parser.addOption(localDir);
    parser.addOption(config);
    parser.process(app);

    const AppSettings settings = AppSettings::load(parser.isSet(config) ? parser.value(config) : AppSettings::defaultPath());

    std::optional<ftpdeck::Address> url;
    const QStringList args = parser.positionalArguments();
    if (!args.isEmpty()) {
        ftpdeck::Address a;
        ftpdeck::Error err;
        if (!ftpdeck::parseUrl(args.first().toStdString(), a, err)) {
            std::fprintf(stderr, "ftpdeck: %s\n", err.message.c_str());
            return 1;
        }
        url = a;
    }

    SettingsConnectionStore store;
    ftpdeck::Connector connector(store);
    connector.setDefaultAddress(settings.default_address);
    connector.setTimeout(settings.timeout_sec * 1000);

    const QString startDir = parser.isSet(localDir) ? parser.value(localDir) : settings.local_start_dir;
    ftpdeck::LocalEndpoint local(startDir.toStdString());
    ftpdeck::RemoteEndpoint remote(connector);

    ftpdeck::QueueOptions qopt;
    qopt.chunk_bytes = settings.chunk_kib * 1024;
    qopt.progress_interval_ms = settings.progress_interval_ms;
    ftpdeck::TransferQueue queue(local, remote, qopt);

    ftpdeck::ControllerOptions copt;
    copt.show_hidden = settings.show_hidden;
    ftpdeck::SessionController controller(connector, local, remote, queue, copt);
    ExternalEditor editor(settings.editor);
    controller.setEditorLauncher(&editor);

    TerminalApp ui(controller);
    return ui.run(url);
}
