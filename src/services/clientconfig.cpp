#include "clientconfig.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QSettings>

namespace {

bool fail(QString *errorMessage, const QString &reason)
{
    if (errorMessage) {
        *errorMessage = reason;
    }
    return false;
}

// Reads an integer setting in [minimum, maximum] into @p target if present
bool readInt(const QSettings &settings, const QString &key, int minimum, int maximum,
             int &target, QString *errorMessage)
{
    if (!settings.contains(key)) {
        return true;
    }
    bool ok = false;
    const int value = settings.value(key).toString().trimmed().toInt(&ok);
    if (!ok || value < minimum || value > maximum) {
        return fail(errorMessage, QString("Invalid value for '%1': %2")
                                      .arg(key, settings.value(key).toString()));
    }
    target = value;
    return true;
}

bool readPort(const QSettings &settings, const QString &key, quint16 &target,
              QString *errorMessage)
{
    int value = target;
    if (!readInt(settings, key, 0, 65535, value, errorMessage)) {
        return false;
    }
    target = static_cast<quint16>(value);
    return true;
}

} // namespace

QString ClientConfig::displayName() const
{
    if (!hostName.isEmpty()) {
        return hostName;
    }
    return QString("%1:%2").arg(host).arg(port);
}

QString ClientConfig::dataPortRange() const
{
    return QString("%1-%2").arg(dataPortStart).arg(dataPortEnd);
}

QString ClientConfig::toString() const
{
    return QString("RAX FTP Config - Server: %1, Timeout: %2s, Data Ports: %3, "
                   "Max Retries: %4, Local Dir: %5")
        .arg(displayName())
        .arg(timeoutSecs)
        .arg(dataPortRange())
        .arg(maxRetries)
        .arg(localDirectory);
}

QStringList ClientConfigLoader::defaultSearchPaths()
{
    return {
        QStringLiteral("rax-ftp-client/config/client_config.ini"),
        QStringLiteral("config/client_config.ini"),
    };
}

bool ClientConfigLoader::loadFromFile(const QString &path, ClientConfig &config,
                                      QString *errorMessage)
{
    QFileInfo info(path);
    if (!info.exists() || !info.isFile()) {
        return fail(errorMessage, QString("Configuration file '%1' not found").arg(path));
    }
    if (!info.isReadable()) {
        return fail(errorMessage, QString("Configuration file '%1' is not readable").arg(path));
    }

    QSettings settings(path, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        return fail(errorMessage, QString("Cannot parse configuration file '%1'").arg(path));
    }

    ClientConfig loaded = config;

    if (settings.contains("server/host")) {
        loaded.host = settings.value("server/host").toString().trimmed();
    }
    if (settings.contains("server/host_name")) {
        loaded.hostName = settings.value("server/host_name").toString().trimmed();
    }
    if (!readPort(settings, "server/port", loaded.port, errorMessage)
        || !readInt(settings, "server/timeout", 0, 3600, loaded.timeoutSecs, errorMessage)
        || !readInt(settings, "server/data_timeout", 0, 3600, loaded.dataTimeoutSecs,
                    errorMessage)
        || !readInt(settings, "server/max_retries", 0, 100, loaded.maxRetries, errorMessage)
        || !readInt(settings, "server/retry_delay_ms", 0, 600000, loaded.retryBaseDelayMs,
                    errorMessage)
        || !readPort(settings, "client/data_port_start", loaded.dataPortStart, errorMessage)
        || !readPort(settings, "client/data_port_end", loaded.dataPortEnd, errorMessage)) {
        return false;
    }
    if (settings.contains("client/local_directory")) {
        loaded.localDirectory = settings.value("client/local_directory").toString().trimmed();
    }

    config = loaded;
    qDebug() << "Config: Loaded" << QDir::toNativeSeparators(info.absoluteFilePath());
    return true;
}

bool ClientConfigLoader::applyEnvironment(ClientConfig &config,
                                          const QProcessEnvironment &environment,
                                          QString *errorMessage)
{
    if (environment.contains("RAX_FTP_HOST")) {
        config.host = environment.value("RAX_FTP_HOST");
    }
    if (environment.contains("RAX_FTP_HOST_NAME")) {
        config.hostName = environment.value("RAX_FTP_HOST_NAME");
    }
    if (environment.contains("RAX_FTP_LOCAL_DIR")) {
        config.localDirectory = environment.value("RAX_FTP_LOCAL_DIR");
    }

    if (environment.contains("RAX_FTP_PORT")) {
        bool ok = false;
        const uint port = environment.value("RAX_FTP_PORT").toUInt(&ok);
        if (!ok || port > 65535) {
            return fail(errorMessage, QString("Invalid RAX_FTP_PORT: %1")
                                          .arg(environment.value("RAX_FTP_PORT")));
        }
        config.port = static_cast<quint16>(port);
    }
    if (environment.contains("RAX_FTP_TIMEOUT")) {
        bool ok = false;
        const int timeout = environment.value("RAX_FTP_TIMEOUT").toInt(&ok);
        if (!ok || timeout < 0) {
            return fail(errorMessage, QString("Invalid RAX_FTP_TIMEOUT: %1")
                                          .arg(environment.value("RAX_FTP_TIMEOUT")));
        }
        config.timeoutSecs = timeout;
    }
    if (environment.contains("RAX_FTP_MAX_RETRIES")) {
        bool ok = false;
        const int retries = environment.value("RAX_FTP_MAX_RETRIES").toInt(&ok);
        if (!ok || retries < 0) {
            return fail(errorMessage, QString("Invalid RAX_FTP_MAX_RETRIES: %1")
                                          .arg(environment.value("RAX_FTP_MAX_RETRIES")));
        }
        config.maxRetries = retries;
    }
    return true;
}

bool ClientConfigLoader::validate(const ClientConfig &config, QString *errorMessage)
{
    if (config.host.isEmpty()) {
        return fail(errorMessage, QStringLiteral("Host cannot be empty"));
    }
    if (config.port == 0) {
        return fail(errorMessage, QStringLiteral("Port cannot be 0"));
    }
    if (config.timeoutSecs == 0) {
        return fail(errorMessage, QStringLiteral("Timeout cannot be 0"));
    }
    if (config.dataTimeoutSecs == 0) {
        return fail(errorMessage, QStringLiteral("Data timeout cannot be 0"));
    }
    if (config.dataPortStart >= config.dataPortEnd) {
        return fail(errorMessage,
                    QStringLiteral("data_port_start must be less than data_port_end"));
    }
    if (config.dataPortEnd - config.dataPortStart < ClientConfig::MinDataPortSpan) {
        return fail(errorMessage, QString("Data port range too small (need at least %1 ports)")
                                      .arg(ClientConfig::MinDataPortSpan));
    }

    QFileInfo dir(config.localDirectory);
    if (!dir.exists()) {
        if (!QDir().mkpath(config.localDirectory)) {
            return fail(errorMessage, QString("Failed to create local directory '%1'")
                                          .arg(config.localDirectory));
        }
        qInfo() << "Config: Created local directory" << config.localDirectory;
    } else if (!dir.isDir()) {
        return fail(errorMessage,
                    QString("'%1' exists but is not a directory").arg(config.localDirectory));
    }
    return true;
}

std::optional<ClientConfig> ClientConfigLoader::load(const QString &path,
                                                     const QProcessEnvironment &environment,
                                                     QString *errorMessage)
{
    ClientConfig config;

    if (!path.isEmpty()) {
        if (!loadFromFile(path, config, errorMessage)) {
            return std::nullopt;
        }
    } else {
        bool found = false;
        for (const QString &candidate : defaultSearchPaths()) {
            if (QFileInfo::exists(candidate)) {
                if (!loadFromFile(candidate, config, errorMessage)) {
                    return std::nullopt;
                }
                found = true;
                break;
            }
        }
        if (!found) {
            qInfo() << "Config: No configuration file found, using defaults";
        }
    }

    if (!applyEnvironment(config, environment, errorMessage)) {
        return std::nullopt;
    }
    if (!validate(config, errorMessage)) {
        return std::nullopt;
    }
    return config;
}
