/**
 * @file dataconnectionnegotiator.h
 * @brief Sets up the per-transfer data connection in active or passive mode.
 */

#ifndef DATACONNECTIONNEGOTIATOR_H
#define DATACONNECTIONNEGOTIATOR_H

#include <QHostAddress>
#include <QObject>

#include <memory>
#include <optional>

#include "ftperror.h"
#include "inetworkbackend.h"

class ControlChannel;
class RetryController;

/**
 * @brief Which side opens the data connection.
 */
enum class DataMode {
    Active,     ///< Client listens and announces it with PORT
    Passive     ///< Server listens and announces it in the PASV reply
};

/**
 * @brief Local role in the data connection, following from the DataMode.
 */
enum class DataConnectionRole {
    Listener,   ///< Waiting for the server to connect (active)
    Connector   ///< Dialling the server (passive)
};

Q_DECLARE_METATYPE(DataMode)

[[nodiscard]] QString dataModeToString(DataMode mode);

/**
 * @brief A negotiated, not yet connected, data endpoint.
 *
 * For Listener endpoints @c listener holds the bound socket; for Connector
 * endpoints @c address and @c port name the server's data port. The
 * listener is closed when the endpoint is closed or destroyed.
 */
struct DataEndpoint {
    DataConnectionRole role = DataConnectionRole::Connector;
    std::unique_ptr<IDataListener> listener;
    QHostAddress address;
    quint16 port = 0;

    DataEndpoint() = default;
    DataEndpoint(DataEndpoint &&) = default;
    DataEndpoint &operator=(DataEndpoint &&) = default;
    ~DataEndpoint() { close(); }

    void close();

    /// "host:port" for logs and signals
    [[nodiscard]] QString toString() const;
};

/**
 * @brief Negotiates data connections over a control channel.
 *
 * Negotiation happens in two steps around the transfer command:
 * prepare() performs the PORT or PASV exchange before STOR/RETR/LIST is
 * sent, and establish() completes the connection once the server has
 * answered that command with a 1xx reply.
 *
 * @par Example usage:
 * @code
 * DataConnectionNegotiator negotiator(backend, &retry);
 * negotiator.setPortRange(2122, 2130);
 *
 * FtpError error;
 * auto endpoint = negotiator.prepare(DataMode::Active, channel, &error);
 * // ... send STOR, expect 150 ...
 * ByteStreamPtr data = negotiator.establish(*endpoint, &error);
 * @endcode
 */
class DataConnectionNegotiator : public QObject
{
    Q_OBJECT

public:
    static constexpr quint16 DefaultPortRangeStart = 2122;
    static constexpr quint16 DefaultPortRangeEnd = 2130;
    static constexpr int DefaultDataTimeoutMs = 5000;

    /**
     * @param backend Socket factory. Not owned.
     * @param retry Retry wrapper for passive-mode dials. Not owned; may be null
     *              for a single attempt.
     * @param parent Optional parent QObject.
     */
    explicit DataConnectionNegotiator(INetworkBackend *backend, RetryController *retry = nullptr,
                                      QObject *parent = nullptr);

    /**
     * @brief Sets the inclusive range of local ports tried in active mode.
     */
    void setPortRange(quint16 first, quint16 last);
    [[nodiscard]] quint16 portRangeStart() const { return portRangeStart_; }
    [[nodiscard]] quint16 portRangeEnd() const { return portRangeEnd_; }

    void setDataTimeout(int timeoutMs) { dataTimeoutMs_ = timeoutMs; }
    [[nodiscard]] int dataTimeout() const { return dataTimeoutMs_; }

    /**
     * @brief Performs the PORT or PASV exchange.
     *
     * Active: binds the first free port of the range (NoPortAvailable if
     * none) and sends PORT with the control connection's local IPv4 address.
     * A non-2xx reply closes the listener and yields UnexpectedReply.
     *
     * Passive: sends PASV and decodes the host-port group (Malformed if it
     * cannot be decoded, UnexpectedReply for a non-2xx reply).
     *
     * @return The endpoint, or std::nullopt with @p error set.
     */
    std::optional<DataEndpoint> prepare(DataMode mode, ControlChannel *control, FtpError *error);

    /**
     * @brief Completes the data connection for a prepared endpoint.
     *
     * Listener endpoints accept one connection within the data timeout
     * (DataConnectTimeout otherwise); connector endpoints dial the server's
     * address with retries. The listener is closed on every path.
     *
     * @return The connected data stream, or nullptr with @p error set.
     */
    ByteStreamPtr establish(DataEndpoint &endpoint, FtpError *error);

private:
    std::optional<DataEndpoint> prepareActive(ControlChannel *control, FtpError *error);
    std::optional<DataEndpoint> preparePassive(ControlChannel *control, FtpError *error);

    INetworkBackend *backend_;
    RetryController *retry_;
    quint16 portRangeStart_ = DefaultPortRangeStart;
    quint16 portRangeEnd_ = DefaultPortRangeEnd;
    int dataTimeoutMs_ = DefaultDataTimeoutMs;
};

#endif // DATACONNECTIONNEGOTIATOR_H
