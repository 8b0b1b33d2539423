#include "errorhandler.h"

#include <QDebug>

ErrorHandler::ErrorHandler(QObject *parent)
    : QObject(parent)
{
}

void ErrorHandler::handleError(ErrorCategory category,
                               ErrorSeverity severity,
                               const QString &title,
                               const QString &details)
{
    logError(category, severity, title, details);

    QString message = title;
    if (!details.isEmpty() && details != title) {
        message = QString("%1: %2").arg(title, details);
    }
    emit statusMessage(message);
}

void ErrorHandler::handleFtpError(const FtpError &error)
{
    if (!error.isError()) {
        return;
    }

    QString details = error.message;
    if (error.replyCode != 0) {
        details = QString("%1 %2").arg(error.replyCode).arg(details).trimmed();
    }
    if (!error.command.isEmpty()) {
        details += QString(" [%1]").arg(error.command);
    }
    if (error.bytesTransferred > 0) {
        details += tr(" after %1 bytes").arg(error.bytesTransferred);
    }

    handleError(categoryFor(error.kind),
                severityFor(error.kind),
                FtpError::kindToString(error.kind),
                details.trimmed());
}

void ErrorHandler::handleConfigurationError(const QString &message)
{
    handleError(ErrorCategory::Validation,
                ErrorSeverity::Critical,
                tr("Configuration error"),
                message);
}

ErrorCategory ErrorHandler::categoryFor(FtpError::Kind kind)
{
    switch (kind) {
    case FtpError::Kind::ConnectionRefused:
    case FtpError::Kind::HostNotFound:
    case FtpError::Kind::Timeout:
    case FtpError::Kind::ConnectionLost:
    case FtpError::Kind::SocketError:
    case FtpError::Kind::AuthenticationFailed:
        return ErrorCategory::Connection;
    case FtpError::Kind::Malformed:
    case FtpError::Kind::UnexpectedReply:
        return ErrorCategory::Protocol;
    case FtpError::Kind::TransferFailed:
    case FtpError::Kind::NoPortAvailable:
    case FtpError::Kind::DataConnectTimeout:
    case FtpError::Kind::Cancelled:
        return ErrorCategory::FileOperation;
    case FtpError::Kind::None:
    case FtpError::Kind::InvalidState:
        break;
    }
    return ErrorCategory::Validation;
}

ErrorSeverity ErrorHandler::severityFor(FtpError::Kind kind)
{
    switch (kind) {
    case FtpError::Kind::ConnectionRefused:
    case FtpError::Kind::HostNotFound:
    case FtpError::Kind::Timeout:
    case FtpError::Kind::ConnectionLost:
    case FtpError::Kind::SocketError:
        return ErrorSeverity::Critical;
    case FtpError::Kind::None:
    case FtpError::Kind::Cancelled:
        return ErrorSeverity::Info;
    default:
        return ErrorSeverity::Warning;
    }
}

void ErrorHandler::logError(ErrorCategory category,
                            ErrorSeverity severity,
                            const QString &title,
                            const QString &details)
{
    QString logMessage = QString("[%1/%2] %3")
        .arg(categoryToString(category),
             severityToString(severity),
             title);

    if (!details.isEmpty() && details != title) {
        logMessage += QString(": %1").arg(details);
    }

    switch (severity) {
    case ErrorSeverity::Info:
        qInfo().noquote() << logMessage;
        break;
    case ErrorSeverity::Warning:
        qWarning().noquote() << logMessage;
        break;
    case ErrorSeverity::Critical:
        qCritical().noquote() << logMessage;
        break;
    }

    emit errorLogged(category, severity, title, details);
}

QString ErrorHandler::categoryToString(ErrorCategory category)
{
    switch (category) {
    case ErrorCategory::Connection:
        return QStringLiteral("Connection");
    case ErrorCategory::FileOperation:
        return QStringLiteral("FileOp");
    case ErrorCategory::Validation:
        return QStringLiteral("Validation");
    case ErrorCategory::Protocol:
        return QStringLiteral("Protocol");
    }
    return QStringLiteral("Unknown");
}

QString ErrorHandler::severityToString(ErrorSeverity severity)
{
    switch (severity) {
    case ErrorSeverity::Info:
        return QStringLiteral("INFO");
    case ErrorSeverity::Warning:
        return QStringLiteral("WARN");
    case ErrorSeverity::Critical:
        return QStringLiteral("CRIT");
    }
    return QStringLiteral("UNKNOWN");
}
