#include "dataconnectionnegotiator.h"
#include "controlchannel.h"
#include "ftpaddress.h"
#include "ftpcommand.h"
#include "retrycontroller.h"
#include "../utils/logging.h"

#include <QDebug>

namespace {

void setError(FtpError *error, const FtpError &value)
{
    if (error) {
        *error = value;
    }
}

FtpError unexpectedReply(const QString &command, const FtpReply &reply)
{
    FtpError error(FtpError::Kind::UnexpectedReply, reply.message);
    error.command = command;
    error.replyCode = reply.code;
    return error;
}

} // namespace

QString dataModeToString(DataMode mode)
{
    return mode == DataMode::Active ? QStringLiteral("Active") : QStringLiteral("Passive");
}

void DataEndpoint::close()
{
    if (listener) {
        listener->close();
        listener.reset();
    }
}

QString DataEndpoint::toString() const
{
    return QString("%1:%2").arg(address.toString()).arg(port);
}

DataConnectionNegotiator::DataConnectionNegotiator(INetworkBackend *backend,
                                                   RetryController *retry, QObject *parent)
    : QObject(parent)
    , backend_(backend)
    , retry_(retry)
{
}

void DataConnectionNegotiator::setPortRange(quint16 first, quint16 last)
{
    portRangeStart_ = first;
    portRangeEnd_ = last;
}

std::optional<DataEndpoint> DataConnectionNegotiator::prepare(DataMode mode,
                                                              ControlChannel *control,
                                                              FtpError *error)
{
    switch (mode) {
    case DataMode::Active:
        return prepareActive(control, error);
    case DataMode::Passive:
        return preparePassive(control, error);
    }
    return std::nullopt;
}

std::optional<DataEndpoint> DataConnectionNegotiator::prepareActive(ControlChannel *control,
                                                                    FtpError *error)
{
    bool isIpv4 = false;
    const QHostAddress localAddress = control->localAddress();
    localAddress.toIPv4Address(&isIpv4);
    if (!isIpv4) {
        FtpError e(FtpError::Kind::SocketError,
                   QString("Active mode needs an IPv4 control connection, local address is %1")
                       .arg(localAddress.toString()));
        e.command = QStringLiteral("PORT");
        setError(error, e);
        return std::nullopt;
    }

    DataEndpoint endpoint;
    endpoint.role = DataConnectionRole::Listener;
    endpoint.address = localAddress;

    for (int port = portRangeStart_; port <= portRangeEnd_; ++port) {
        FtpError bindError;
        auto listener = backend_->listen(QHostAddress::AnyIPv4, static_cast<quint16>(port),
                                         &bindError);
        if (listener) {
            endpoint.listener = std::move(listener);
            endpoint.port = static_cast<quint16>(port);
            break;
        }
        LOG_VERBOSE() << "FTP: Data port" << port << "unavailable:" << bindError.message;
    }

    if (!endpoint.listener) {
        FtpError e(FtpError::Kind::NoPortAvailable,
                   QString("All data ports %1-%2 are in use").arg(portRangeStart_).arg(portRangeEnd_));
        e.command = QStringLiteral("PORT");
        setError(error, e);
        return std::nullopt;
    }

    qDebug() << "FTP: Listening for data connection on port" << endpoint.port;

    const FtpCommand portCommand = FtpCommand::port(localAddress, endpoint.port);
    auto reply = control->sendCommand(portCommand);
    if (!reply) {
        endpoint.close();
        setError(error, control->lastError());
        return std::nullopt;
    }
    if (!reply->isSuccess()) {
        endpoint.close();
        setError(error, unexpectedReply(portCommand.toDisplayString(), *reply));
        return std::nullopt;
    }

    return std::optional<DataEndpoint>(std::move(endpoint));
}

std::optional<DataEndpoint> DataConnectionNegotiator::preparePassive(ControlChannel *control,
                                                                     FtpError *error)
{
    auto reply = control->sendCommand(FtpCommand(FtpCommand::Verb::Pasv));
    if (!reply) {
        setError(error, control->lastError());
        return std::nullopt;
    }
    if (!reply->isSuccess()) {
        setError(error, unexpectedReply(QStringLiteral("PASV"), *reply));
        return std::nullopt;
    }

    DataEndpoint endpoint;
    endpoint.role = DataConnectionRole::Connector;

    QString reason;
    if (!FtpAddressCodec::decode(reply->message, endpoint.address, endpoint.port, &reason)) {
        FtpError e(FtpError::Kind::Malformed, reason);
        e.command = QStringLiteral("PASV");
        e.replyCode = reply->code;
        setError(error, e);
        return std::nullopt;
    }

    // Servers behind NAT may announce 0.0.0.0; use the control peer instead
    if (endpoint.address == QHostAddress(QHostAddress::AnyIPv4)) {
        endpoint.address = control->peerAddress();
        qDebug() << "FTP: PASV announced 0.0.0.0, using" << endpoint.address.toString();
    }

    qDebug() << "FTP: PASV data endpoint" << endpoint.toString();
    return std::optional<DataEndpoint>(std::move(endpoint));
}

ByteStreamPtr DataConnectionNegotiator::establish(DataEndpoint &endpoint, FtpError *error)
{
    switch (endpoint.role) {
    case DataConnectionRole::Listener: {
        if (!endpoint.listener) {
            setError(error, FtpError(FtpError::Kind::SocketError,
                                     QStringLiteral("No listener for active data connection")));
            return nullptr;
        }
        FtpError acceptError;
        ByteStreamPtr stream = endpoint.listener->accept(dataTimeoutMs_, &acceptError);
        // One connection per listener
        endpoint.close();
        if (!stream) {
            setError(error, acceptError);
            return nullptr;
        }
        return stream;
    }

    case DataConnectionRole::Connector: {
        const QString host = endpoint.address.toString();
        const quint16 port = endpoint.port;
        auto dial = [this, &host, port](FtpError *e) {
            return backend_->connectToHost(host, port, dataTimeoutMs_, e);
        };

        ByteStreamPtr stream = retry_ ? retry_->attempt(dial, error) : dial(error);
        if (!stream) {
            qWarning() << "FTP: Data connection to" << endpoint.toString() << "failed";
        }
        return stream;
    }
    }
    return nullptr;
}
