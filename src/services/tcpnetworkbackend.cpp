#include "tcpnetworkbackend.h"
#include "../utils/logging.h"

#include <QDebug>

TcpByteStream::TcpByteStream(std::unique_ptr<QTcpSocket> socket)
    : socket_(std::move(socket))
{
}

TcpByteStream::~TcpByteStream()
{
    close();
}

qint64 TcpByteStream::read(char *data, qint64 maxSize, int timeoutMs)
{
    if (closed_ || !socket_) {
        status_ = Status::Closed;
        return 0;
    }

    if (socket_->bytesAvailable() == 0) {
        if (socket_->state() != QAbstractSocket::ConnectedState) {
            status_ = Status::Closed;
            return 0;
        }
        if (!socket_->waitForReadyRead(timeoutMs)) {
            // Data may have arrived together with the FIN
            if (socket_->bytesAvailable() == 0) {
                if (socket_->error() == QAbstractSocket::RemoteHostClosedError
                    || socket_->state() != QAbstractSocket::ConnectedState) {
                    status_ = Status::Closed;
                    return 0;
                }
                recordSocketError();
                return -1;
            }
        }
    }

    qint64 n = socket_->read(data, maxSize);
    if (n < 0) {
        recordSocketError();
        return -1;
    }
    status_ = Status::Ok;
    return n;
}

bool TcpByteStream::write(const QByteArray &data, int timeoutMs)
{
    if (closed_ || !socket_ || socket_->state() != QAbstractSocket::ConnectedState) {
        status_ = Status::Closed;
        errorString_ = QStringLiteral("Socket is not connected");
        return false;
    }

    if (socket_->write(data) != data.size()) {
        recordSocketError();
        return false;
    }

    while (socket_->bytesToWrite() > 0) {
        if (!socket_->waitForBytesWritten(timeoutMs)) {
            recordSocketError();
            return false;
        }
    }
    status_ = Status::Ok;
    return true;
}

void TcpByteStream::close()
{
    if (closed_ || !socket_) {
        return;
    }
    closed_ = true;

    if (socket_->state() != QAbstractSocket::UnconnectedState) {
        socket_->disconnectFromHost();
        if (socket_->state() != QAbstractSocket::UnconnectedState) {
            socket_->waitForDisconnected(CloseTimeoutMs);
        }
    }
    socket_->close();
    if (status_ == Status::Ok) {
        status_ = Status::Closed;
    }
}

bool TcpByteStream::isOpen() const
{
    return !closed_ && socket_ && socket_->state() == QAbstractSocket::ConnectedState;
}

QHostAddress TcpByteStream::localAddress() const
{
    return socket_ ? socket_->localAddress() : QHostAddress();
}

QHostAddress TcpByteStream::peerAddress() const
{
    return socket_ ? socket_->peerAddress() : QHostAddress();
}

quint16 TcpByteStream::peerPort() const
{
    return socket_ ? socket_->peerPort() : 0;
}

void TcpByteStream::recordSocketError()
{
    errorString_ = socket_->errorString();
    switch (socket_->error()) {
    case QAbstractSocket::SocketTimeoutError:
        status_ = Status::TimedOut;
        break;
    case QAbstractSocket::RemoteHostClosedError:
        status_ = Status::Closed;
        break;
    default:
        status_ = Status::Failed;
        break;
    }
}

// --- TcpDataListener ---

TcpDataListener::TcpDataListener(std::unique_ptr<QTcpServer> server)
    : server_(std::move(server))
{
}

TcpDataListener::~TcpDataListener()
{
    close();
}

quint16 TcpDataListener::serverPort() const
{
    return server_ ? server_->serverPort() : 0;
}

bool TcpDataListener::isListening() const
{
    return server_ && server_->isListening();
}

ByteStreamPtr TcpDataListener::accept(int timeoutMs, FtpError *error)
{
    if (!isListening()) {
        if (error) {
            *error = FtpError(FtpError::Kind::SocketError, QStringLiteral("Listener is closed"));
        }
        return nullptr;
    }

    if (!server_->hasPendingConnections()) {
        bool timedOut = false;
        if (!server_->waitForNewConnection(timeoutMs, &timedOut)) {
            if (error) {
                if (timedOut) {
                    *error = FtpError(FtpError::Kind::DataConnectTimeout,
                                      QString("No data connection on port %1 within %2 ms")
                                          .arg(server_->serverPort())
                                          .arg(timeoutMs));
                } else {
                    *error = FtpError(FtpError::Kind::SocketError, server_->errorString());
                }
            }
            return nullptr;
        }
    }

    QTcpSocket *socket = server_->nextPendingConnection();
    if (!socket) {
        if (error) {
            *error = FtpError(FtpError::Kind::SocketError,
                              QStringLiteral("Pending data connection vanished"));
        }
        return nullptr;
    }

    // The stream must outlive the server
    socket->setParent(nullptr);
    qDebug() << "FTP: Accepted data connection from" << socket->peerAddress().toString()
             << ":" << socket->peerPort();
    return std::make_unique<TcpByteStream>(std::unique_ptr<QTcpSocket>(socket));
}

void TcpDataListener::close()
{
    if (server_ && server_->isListening()) {
        LOG_VERBOSE() << "FTP: Closing data listener on port" << server_->serverPort();
        server_->close();
    }
}

// --- TcpNetworkBackend ---

ByteStreamPtr TcpNetworkBackend::connectToHost(const QString &host, quint16 port, int timeoutMs,
                                               FtpError *error)
{
    auto socket = std::make_unique<QTcpSocket>();
    socket->connectToHost(host, port);

    if (!socket->waitForConnected(timeoutMs)) {
        if (error) {
            *error = FtpError(kindForSocketError(socket->error()),
                              QString("%1:%2: %3").arg(host).arg(port).arg(socket->errorString()));
        }
        socket->abort();
        return nullptr;
    }

    return std::make_unique<TcpByteStream>(std::move(socket));
}

std::unique_ptr<IDataListener> TcpNetworkBackend::listen(const QHostAddress &address, quint16 port,
                                                         FtpError *error)
{
    auto server = std::make_unique<QTcpServer>();
    server->setMaxPendingConnections(1);

    if (!server->listen(address, port)) {
        if (error) {
            *error = FtpError(FtpError::Kind::SocketError,
                              QString("Cannot bind %1:%2: %3")
                                  .arg(address.toString())
                                  .arg(port)
                                  .arg(server->errorString()));
        }
        return nullptr;
    }

    return std::make_unique<TcpDataListener>(std::move(server));
}

FtpError::Kind TcpNetworkBackend::kindForSocketError(QAbstractSocket::SocketError error)
{
    switch (error) {
    case QAbstractSocket::ConnectionRefusedError:
        return FtpError::Kind::ConnectionRefused;
    case QAbstractSocket::HostNotFoundError:
        return FtpError::Kind::HostNotFound;
    case QAbstractSocket::SocketTimeoutError:
        return FtpError::Kind::Timeout;
    case QAbstractSocket::RemoteHostClosedError:
        return FtpError::Kind::ConnectionLost;
    default:
        return FtpError::Kind::SocketError;
    }
}
