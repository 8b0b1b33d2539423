#include <QCoreApplication>
#include <QCommandLineParser>
#include <QTextStream>
#include "services/clientconfig.h"
#include "services/errorhandler.h"
#include "services/ftpsession.h"
#include "services/tcpnetworkbackend.h"
#include "terminalsession.h"
#include "utils/logging.h"
#include "version.h"

#include <cstdio>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("raxftp");
    app.setApplicationVersion(RAXFTP_VERSION);
    app.setOrganizationName("raxftp");

    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription("Interactive client for the RAX FTP server");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption verboseOption(
        QStringList() << "V" << "verbose",
        "Enable verbose logging output");
    parser.addOption(verboseOption);

    QCommandLineOption configOption(
        QStringList() << "c" << "config",
        "Read configuration from <file>", "file");
    parser.addOption(configOption);

    QCommandLineOption hostOption(
        QStringList() << "H" << "host",
        "Server host, overrides configuration", "host");
    parser.addOption(hostOption);

    QCommandLineOption portOption(
        QStringList() << "p" << "port",
        "Server port, overrides configuration", "port");
    parser.addOption(portOption);

    parser.process(app);

    // Set verbose logging flag
    raxftp::verboseLogging = parser.isSet(verboseOption);

    if (raxftp::verboseLogging) {
        qDebug() << "Verbose logging enabled";
    }

    ErrorHandler errorHandler;
    QTextStream err(stderr);
    QObject::connect(&errorHandler, &ErrorHandler::statusMessage,
                     [&err](const QString &message) { err << "Error: " << message << Qt::endl; });

    QString configError;
    auto config = ClientConfigLoader::load(parser.value(configOption),
                                           QProcessEnvironment::systemEnvironment(),
                                           &configError);
    if (!config) {
        errorHandler.handleConfigurationError(configError);
        return 1;
    }

    if (parser.isSet(hostOption)) {
        config->host = parser.value(hostOption);
    }
    if (parser.isSet(portOption)) {
        bool ok = false;
        const uint port = parser.value(portOption).toUInt(&ok);
        if (!ok || port == 0 || port > 65535) {
            errorHandler.handleConfigurationError(
                QString("Invalid port: %1").arg(parser.value(portOption)));
            return 1;
        }
        config->port = static_cast<quint16>(port);
    }

    qInfo().noquote() << config->toString();

    TcpNetworkBackend backend;
    FtpSession session(&backend);
    session.configure(*config);

    QTextStream in(stdin);
    QTextStream out(stdout);
    TerminalSession terminal(&session, *config, &in, &out);
    return terminal.run();
}
