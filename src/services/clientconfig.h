/**
 * @file clientconfig.h
 * @brief Client configuration values and their loading from INI files and the environment.
 */

#ifndef CLIENTCONFIG_H
#define CLIENTCONFIG_H

#include <QProcessEnvironment>
#include <QString>
#include <QStringList>

#include <optional>

/**
 * @brief Connection and transfer settings for the client.
 */
struct ClientConfig {
    /// @name Defaults
    /// @{
    static constexpr quint16 DefaultPort = 2121;
    static constexpr int DefaultTimeoutSecs = 5;
    static constexpr int DefaultDataTimeoutSecs = 5;
    static constexpr int DefaultMaxRetries = 3;
    static constexpr int DefaultRetryBaseDelayMs = 1000;
    static constexpr quint16 DefaultDataPortStart = 2122;
    static constexpr quint16 DefaultDataPortEnd = 2130;
    static constexpr int MinDataPortSpan = 5;   ///< dataPortEnd - dataPortStart must reach this
    /// @}

    QString host = QStringLiteral("127.0.0.1");
    QString hostName;                           ///< Optional friendly name
    quint16 port = DefaultPort;
    int timeoutSecs = DefaultTimeoutSecs;       ///< Control connect and reply timeout
    int dataTimeoutSecs = DefaultDataTimeoutSecs;
    int maxRetries = DefaultMaxRetries;
    int retryBaseDelayMs = DefaultRetryBaseDelayMs;
    QString localDirectory = QStringLiteral("./client_root");
    quint16 dataPortStart = DefaultDataPortStart;
    quint16 dataPortEnd = DefaultDataPortEnd;

    /**
     * @brief Friendly host name if set, otherwise "host:port".
     */
    [[nodiscard]] QString displayName() const;

    /**
     * @brief "start-end" form of the active-mode port range.
     */
    [[nodiscard]] QString dataPortRange() const;

    [[nodiscard]] QString toString() const;
};

/**
 * @brief Builds a ClientConfig from defaults, an INI file and RAX_FTP_* variables.
 *
 * Recognised INI keys:
 * @code
 * [server]
 * host, host_name, port, timeout, data_timeout, max_retries, retry_delay_ms
 * [client]
 * local_directory, data_port_start, data_port_end
 * @endcode
 */
class ClientConfigLoader
{
public:
    /**
     * @brief Locations searched when no explicit file is given, in order.
     */
    [[nodiscard]] static QStringList defaultSearchPaths();

    /**
     * @brief Overlays values from an INI file onto @p config.
     * @return False with @p errorMessage set if the file is missing or unreadable,
     *         or holds a value of the wrong type.
     */
    static bool loadFromFile(const QString &path, ClientConfig &config,
                             QString *errorMessage = nullptr);

    /**
     * @brief Overlays RAX_FTP_HOST, RAX_FTP_HOST_NAME, RAX_FTP_PORT,
     *        RAX_FTP_TIMEOUT, RAX_FTP_MAX_RETRIES and RAX_FTP_LOCAL_DIR.
     * @return False if a numeric variable does not parse.
     */
    static bool applyEnvironment(ClientConfig &config, const QProcessEnvironment &environment,
                                 QString *errorMessage = nullptr);

    /**
     * @brief Checks value ranges and creates the local directory if missing.
     */
    static bool validate(const ClientConfig &config, QString *errorMessage = nullptr);

    /**
     * @brief Complete load: file (explicit or searched), environment, validation.
     *
     * An explicit @p path must exist. Without one, the first existing
     * default path is used, or defaults if there is none.
     *
     * @return The configuration, or std::nullopt with @p errorMessage set.
     */
    static std::optional<ClientConfig> load(
        const QString &path = QString(),
        const QProcessEnvironment &environment = QProcessEnvironment::systemEnvironment(),
        QString *errorMessage = nullptr);
};

#endif // CLIENTCONFIG_H
