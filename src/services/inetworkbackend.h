/**
 * @file inetworkbackend.h
 * @brief Interfaces for the blocking sockets used by the FTP engine.
 *
 * Every socket the session touches goes through these interfaces, enabling
 * dependency injection of scripted streams in tests and of the Qt TCP
 * implementation in production.
 */

#ifndef INETWORKBACKEND_H
#define INETWORKBACKEND_H

#include <QByteArray>
#include <QHostAddress>
#include <QString>

#include <memory>

#include "ftperror.h"

/**
 * @brief A connected, blocking byte stream (control or data connection).
 */
class IByteStream
{
public:
    /**
     * @brief Outcome of the last read or write.
     */
    enum class Status {
        Ok,         ///< Stream usable
        Closed,     ///< Peer closed the stream or close() was called
        TimedOut,   ///< Last wait ran out of time
        Failed      ///< Socket error, see errorString()
    };

    virtual ~IByteStream() = default;

    /**
     * @brief Reads up to @p maxSize bytes, waiting at most @p timeoutMs.
     * @return Bytes read (>0), 0 on orderly close, -1 on timeout or error.
     */
    virtual qint64 read(char *data, qint64 maxSize, int timeoutMs) = 0;

    /**
     * @brief Writes all of @p data, waiting at most @p timeoutMs for it to drain.
     * @return True if every byte was written.
     */
    virtual bool write(const QByteArray &data, int timeoutMs) = 0;

    /**
     * @brief Flushes pending output and closes the stream. Idempotent.
     */
    virtual void close() = 0;

    [[nodiscard]] virtual bool isOpen() const = 0;
    [[nodiscard]] virtual Status status() const = 0;
    [[nodiscard]] virtual QString errorString() const = 0;
    [[nodiscard]] virtual QHostAddress localAddress() const = 0;
    [[nodiscard]] virtual QHostAddress peerAddress() const = 0;
    [[nodiscard]] virtual quint16 peerPort() const = 0;
};

using ByteStreamPtr = std::unique_ptr<IByteStream>;

/**
 * @brief A bound listening socket awaiting one inbound data connection.
 */
class IDataListener
{
public:
    virtual ~IDataListener() = default;

    [[nodiscard]] virtual quint16 serverPort() const = 0;
    [[nodiscard]] virtual bool isListening() const = 0;

    /**
     * @brief Waits at most @p timeoutMs for a peer to connect.
     * @param error Receives DataConnectTimeout or SocketError on failure.
     * @return The accepted stream, or nullptr on failure.
     */
    virtual ByteStreamPtr accept(int timeoutMs, FtpError *error) = 0;

    /**
     * @brief Stops listening and releases the port. Idempotent.
     */
    virtual void close() = 0;
};

/**
 * @brief Factory for outbound streams and listeners.
 */
class INetworkBackend
{
public:
    virtual ~INetworkBackend() = default;

    /**
     * @brief Dials @p host:@p port, waiting at most @p timeoutMs.
     * @param error Receives a transport error kind on failure.
     * @return The connected stream, or nullptr on failure.
     */
    virtual ByteStreamPtr connectToHost(const QString &host, quint16 port, int timeoutMs,
                                        FtpError *error) = 0;

    /**
     * @brief Binds a listener on @p address:@p port.
     * @param error Receives SocketError if the port cannot be bound.
     * @return The listener, or nullptr if binding failed.
     */
    virtual std::unique_ptr<IDataListener> listen(const QHostAddress &address, quint16 port,
                                                  FtpError *error) = 0;
};

#endif // INETWORKBACKEND_H
