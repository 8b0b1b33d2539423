#include "ftperror.h"

FtpError::FtpError(Kind kind, const QString &message)
    : kind(kind)
    , message(message)
{
}

bool FtpError::isTransportError() const
{
    switch (kind) {
    case Kind::ConnectionRefused:
    case Kind::HostNotFound:
    case Kind::Timeout:
    case Kind::ConnectionLost:
    case Kind::SocketError:
        return true;
    default:
        return false;
    }
}

QString FtpError::toString() const
{
    if (kind == Kind::None) {
        return QString();
    }

    QString text = kindToString(kind);
    if (replyCode != 0) {
        text += QString(" (%1)").arg(replyCode);
    }
    if (!message.isEmpty()) {
        text += QString(": %1").arg(message);
    }
    if (!command.isEmpty()) {
        text += QString(" [%1]").arg(command);
    }
    if (bytesTransferred > 0) {
        text += QString(" after %1 bytes").arg(bytesTransferred);
    }
    return text;
}

QString FtpError::kindToString(Kind kind)
{
    switch (kind) {
    case Kind::None:
        return QStringLiteral("No error");
    case Kind::ConnectionRefused:
        return QStringLiteral("Connection refused");
    case Kind::HostNotFound:
        return QStringLiteral("Host not found");
    case Kind::Timeout:
        return QStringLiteral("Timed out");
    case Kind::ConnectionLost:
        return QStringLiteral("Connection lost");
    case Kind::SocketError:
        return QStringLiteral("Socket error");
    case Kind::Malformed:
        return QStringLiteral("Malformed reply");
    case Kind::UnexpectedReply:
        return QStringLiteral("Unexpected reply");
    case Kind::InvalidState:
        return QStringLiteral("Invalid state");
    case Kind::AuthenticationFailed:
        return QStringLiteral("Authentication failed");
    case Kind::TransferFailed:
        return QStringLiteral("Transfer failed");
    case Kind::NoPortAvailable:
        return QStringLiteral("No data port available");
    case Kind::DataConnectTimeout:
        return QStringLiteral("Data connection timed out");
    case Kind::Cancelled:
        return QStringLiteral("Cancelled");
    }
    return QStringLiteral("Unknown error");
}
