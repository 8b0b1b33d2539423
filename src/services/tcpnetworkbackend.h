/**
 * @file tcpnetworkbackend.h
 * @brief Qt TCP implementation of the network backend interfaces.
 *
 * Sockets are driven in blocking mode with the waitFor* family, so the
 * engine needs no running event loop.
 */

#ifndef TCPNETWORKBACKEND_H
#define TCPNETWORKBACKEND_H

#include <QTcpServer>
#include <QTcpSocket>

#include <memory>

#include "inetworkbackend.h"

/**
 * @brief IByteStream over a connected QTcpSocket.
 */
class TcpByteStream : public IByteStream
{
public:
    /// Time allowed for buffered output to drain when closing
    static constexpr int CloseTimeoutMs = 3000;

    explicit TcpByteStream(std::unique_ptr<QTcpSocket> socket);
    ~TcpByteStream() override;

    qint64 read(char *data, qint64 maxSize, int timeoutMs) override;
    bool write(const QByteArray &data, int timeoutMs) override;
    void close() override;

    [[nodiscard]] bool isOpen() const override;
    [[nodiscard]] Status status() const override { return status_; }
    [[nodiscard]] QString errorString() const override { return errorString_; }
    [[nodiscard]] QHostAddress localAddress() const override;
    [[nodiscard]] QHostAddress peerAddress() const override;
    [[nodiscard]] quint16 peerPort() const override;

private:
    void recordSocketError();

    std::unique_ptr<QTcpSocket> socket_;
    Status status_ = Status::Ok;
    QString errorString_;
    bool closed_ = false;
};

/**
 * @brief IDataListener over a QTcpServer.
 */
class TcpDataListener : public IDataListener
{
public:
    explicit TcpDataListener(std::unique_ptr<QTcpServer> server);
    ~TcpDataListener() override;

    [[nodiscard]] quint16 serverPort() const override;
    [[nodiscard]] bool isListening() const override;
    ByteStreamPtr accept(int timeoutMs, FtpError *error) override;
    void close() override;

private:
    std::unique_ptr<QTcpServer> server_;
};

/**
 * @brief Production backend creating QTcpSocket streams and QTcpServer listeners.
 */
class TcpNetworkBackend : public INetworkBackend
{
public:
    ByteStreamPtr connectToHost(const QString &host, quint16 port, int timeoutMs,
                                FtpError *error) override;
    std::unique_ptr<IDataListener> listen(const QHostAddress &address, quint16 port,
                                          FtpError *error) override;

    /**
     * @brief Maps a Qt socket error onto the FTP error taxonomy.
     */
    [[nodiscard]] static FtpError::Kind kindForSocketError(QAbstractSocket::SocketError error);
};

#endif // TCPNETWORKBACKEND_H
