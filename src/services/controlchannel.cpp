#include "controlchannel.h"
#include "../utils/logging.h"

#include <QDebug>

ControlChannel::ControlChannel(ByteStreamPtr stream, int timeoutMs, QObject *parent)
    : QObject(parent)
    , stream_(std::move(stream))
    , timeoutMs_(timeoutMs)
{
}

ControlChannel::~ControlChannel()
{
    close();
}

std::optional<FtpReply> ControlChannel::readGreeting()
{
    currentCommand_.clear();
    return readReply();
}

std::optional<FtpReply> ControlChannel::sendCommand(const FtpCommand &command)
{
    lastError_ = FtpError();
    currentCommand_ = command.toDisplayString();

    if (!command.isWireSafe()) {
        lastError_ = FtpError(FtpError::Kind::Malformed,
                              QStringLiteral("Command argument contains a line break"));
        lastError_.command = currentCommand_;
        qWarning() << "FTP:" << lastError_.toString();
        return std::nullopt;
    }

    if (!isOpen()) {
        fail(FtpError::Kind::ConnectionLost, QStringLiteral("Control connection is closed"));
        return std::nullopt;
    }

    qDebug() << "FTP: >>" << currentCommand_;
    if (!stream_->write(command.encode(), timeoutMs_)) {
        const QString reason = stream_->errorString();
        fail(stream_->status() == IByteStream::Status::TimedOut ? FtpError::Kind::Timeout
                                                                 : FtpError::Kind::ConnectionLost,
             reason.isEmpty() ? QStringLiteral("Write to control connection failed") : reason);
        return std::nullopt;
    }
    emit commandSent(currentCommand_);

    return readReply();
}

std::optional<FtpReply> ControlChannel::readReply()
{
    lastError_ = FtpError();

    char buffer[ReadChunkSize];
    while (true) {
        FtpReply reply;
        switch (parser_.next(&reply)) {
        case FtpReplyParser::Status::Complete:
            qDebug() << "FTP: <<" << reply.code << reply.message;
            emit replyReceived(reply);
            return reply;

        case FtpReplyParser::Status::Malformed:
            lastError_ = FtpError(FtpError::Kind::Malformed, parser_.errorString());
            lastError_.command = currentCommand_;
            qWarning() << "FTP:" << lastError_.toString();
            // The rest of the broken reply must not answer the next command
            parser_.reset();
            return std::nullopt;

        case FtpReplyParser::Status::NeedMoreData:
            break;
        }

        if (!isOpen()) {
            fail(FtpError::Kind::ConnectionLost, QStringLiteral("Control connection is closed"));
            return std::nullopt;
        }

        qint64 n = stream_->read(buffer, sizeof(buffer), timeoutMs_);
        if (n > 0) {
            LOG_VERBOSE() << "FTP: Control read" << n << "bytes";
            parser_.feed(QByteArray(buffer, static_cast<int>(n)));
            continue;
        }

        if (n == 0) {
            fail(FtpError::Kind::ConnectionLost,
                 parser_.hasPartialReply()
                     ? QStringLiteral("Connection closed in the middle of a reply")
                     : QStringLiteral("Connection closed by server"));
        } else if (stream_->status() == IByteStream::Status::TimedOut) {
            fail(FtpError::Kind::Timeout,
                 QString("No reply within %1 ms").arg(timeoutMs_));
        } else {
            fail(FtpError::Kind::ConnectionLost, stream_->errorString());
        }
        return std::nullopt;
    }
}

void ControlChannel::close()
{
    if (closed_) {
        return;
    }
    closed_ = true;
    if (stream_) {
        qDebug() << "FTP: Closing control connection";
        stream_->close();
    }
    parser_.reset();
}

bool ControlChannel::isOpen() const
{
    return !closed_ && stream_ && stream_->isOpen();
}

QHostAddress ControlChannel::localAddress() const
{
    return stream_ ? stream_->localAddress() : QHostAddress();
}

QHostAddress ControlChannel::peerAddress() const
{
    return stream_ ? stream_->peerAddress() : QHostAddress();
}

void ControlChannel::fail(FtpError::Kind kind, const QString &message)
{
    lastError_ = FtpError(kind, message);
    lastError_.command = currentCommand_;
    qWarning() << "FTP:" << lastError_.toString();
    close();
}
