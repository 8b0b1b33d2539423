#include "transferengine.h"
#include "controlchannel.h"
#include "../utils/logging.h"

#include <QBuffer>
#include <QDebug>
#include <QRegularExpression>

namespace {

void setError(FtpError *error, const FtpError &value)
{
    if (error) {
        *error = value;
    }
}

// Reads the reply that closes an aborted transfer so the control channel
// stays in lock-step.
void drainFinalReply(ControlChannel *control)
{
    if (!control->isOpen()) {
        return;
    }
    auto reply = control->readReply();
    if (reply) {
        qDebug() << "FTP: Final reply after aborted transfer:" << reply->toString();
    } else {
        qWarning() << "FTP: No final reply after aborted transfer:"
                   << control->lastError().toString();
    }
}

} // namespace

TransferEngine::TransferEngine(DataConnectionNegotiator *negotiator, QObject *parent)
    : QObject(parent)
    , negotiator_(negotiator)
{
}

std::optional<TransferResult> TransferEngine::upload(ControlChannel *control, DataMode mode,
                                                     QIODevice *source,
                                                     const QString &remoteName, FtpError *error)
{
    const FtpCommand command(FtpCommand::Verb::Stor, remoteName);

    if (!source || (!source->isOpen() && !source->open(QIODevice::ReadOnly))
        || !source->isReadable()) {
        FtpError e(FtpError::Kind::TransferFailed,
                   QString("Cannot read local source for '%1'%2")
                       .arg(remoteName, source ? QStringLiteral(": ") + source->errorString()
                                               : QString()));
        e.command = command.toDisplayString();
        setError(error, e);
        return std::nullopt;
    }

    const qint64 total = source->isSequential() ? TransferProgress::UnknownTotal
                                                : source->size() - source->pos();

    return execute(TransferResult::Direction::Upload, control, mode, command, total,
                   [this, source](IByteStream *stream, TransferProgress &progress, FtpError *e) {
                       return sendChunks(stream, source, progress, e);
                   },
                   error);
}

std::optional<TransferResult> TransferEngine::download(ControlChannel *control, DataMode mode,
                                                       const QString &remoteName,
                                                       QIODevice *sink, FtpError *error)
{
    const FtpCommand command(FtpCommand::Verb::Retr, remoteName);

    if (!sink || (!sink->isOpen() && !sink->open(QIODevice::WriteOnly)) || !sink->isWritable()) {
        FtpError e(FtpError::Kind::TransferFailed,
                   QString("Cannot write local target for '%1'%2")
                       .arg(remoteName, sink ? QStringLiteral(": ") + sink->errorString()
                                             : QString()));
        e.command = command.toDisplayString();
        setError(error, e);
        return std::nullopt;
    }

    return execute(TransferResult::Direction::Download, control, mode, command,
                   TransferProgress::UnknownTotal,
                   [this, sink](IByteStream *stream, TransferProgress &progress, FtpError *e) {
                       return receiveChunks(stream, sink, progress, e);
                   },
                   error);
}

std::optional<TransferResult> TransferEngine::list(ControlChannel *control, DataMode mode,
                                                   const QString &path, FtpError *error)
{
    const FtpCommand command(FtpCommand::Verb::List, path);

    QByteArray listingData;
    QBuffer buffer(&listingData);
    buffer.open(QIODevice::WriteOnly);

    auto result = execute(TransferResult::Direction::Listing, control, mode, command,
                          TransferProgress::UnknownTotal,
                          [this, &buffer](IByteStream *stream, TransferProgress &progress,
                                          FtpError *e) {
                              return receiveChunks(stream, &buffer, progress, e);
                          },
                          error);
    if (!result) {
        return std::nullopt;
    }

    const QStringList lines = QString::fromUtf8(listingData).split(QLatin1Char('\n'));
    for (const QString &line : lines) {
        const QString trimmed = line.trimmed();
        if (!trimmed.isEmpty()) {
            result->listing.append(trimmed);
        }
    }
    qDebug() << "FTP: LIST returned" << result->listing.size() << "entries";
    return result;
}

qint64 TransferEngine::sizeHint(const QString &replyText)
{
    static const QRegularExpression rx("\\((\\d+)\\s+bytes\\)");
    auto match = rx.match(replyText);
    if (!match.hasMatch()) {
        return TransferProgress::UnknownTotal;
    }
    bool ok = false;
    const qint64 size = match.captured(1).toLongLong(&ok);
    return ok ? size : TransferProgress::UnknownTotal;
}

std::optional<TransferResult> TransferEngine::execute(TransferResult::Direction direction,
                                                      ControlChannel *control, DataMode mode,
                                                      const FtpCommand &command,
                                                      qint64 expectedTotal,
                                                      const StreamFunction &streamer,
                                                      FtpError *error)
{
    const QString commandText = command.toDisplayString();
    timer_.start();

    TransferProgress progress;
    progress.remoteName = command.argument();
    progress.totalBytes = expectedTotal;

    // PORT/PASV exchange
    FtpError negotiateError;
    auto endpoint = negotiator_->prepare(mode, control, &negotiateError);
    if (!endpoint) {
        setError(error, negotiateError);
        return std::nullopt;
    }

    auto reply = control->sendCommand(command);
    if (!reply) {
        endpoint->close();
        setError(error, control->lastError());
        return std::nullopt;
    }
    if (!reply->isPreliminary()) {
        endpoint->close();
        FtpError e(FtpError::Kind::UnexpectedReply, reply->message);
        e.command = commandText;
        e.replyCode = reply->code;
        setError(error, e);
        return std::nullopt;
    }

    if (direction == TransferResult::Direction::Download) {
        const qint64 hint = sizeHint(reply->message);
        if (hint >= 0) {
            progress.totalBytes = hint;
        }
    }

    const QString endpointText = endpoint->toString();
    FtpError connectError;
    ByteStreamPtr data = negotiator_->establish(*endpoint, &connectError);
    endpoint->close();
    if (!data) {
        drainFinalReply(control);
        if (connectError.command.isEmpty()) {
            connectError.command = commandText;
        }
        setError(error, connectError);
        return std::nullopt;
    }

    qDebug() << "FTP: Data connection open for" << commandText << "via" << endpointText;
    emit dataConnectionOpened(endpointText);

    progress.elapsedMs = timer_.elapsed();
    emit progressChanged(progress);

    FtpError streamError;
    const bool streamed = streamer(data.get(), progress, &streamError);

    data->close();
    data.reset();
    emit dataConnectionClosed();

    if (!streamed) {
        drainFinalReply(control);
        streamError.command = commandText;
        streamError.bytesTransferred = progress.bytesTransferred;
        qWarning() << "FTP:" << streamError.toString();
        setError(error, streamError);
        return std::nullopt;
    }

    auto finalReply = control->readReply();
    if (!finalReply) {
        FtpError e = control->lastError();
        e.bytesTransferred = progress.bytesTransferred;
        setError(error, e);
        return std::nullopt;
    }
    if (!finalReply->isSuccess()) {
        FtpError e(FtpError::Kind::UnexpectedReply, finalReply->message);
        e.command = commandText;
        e.replyCode = finalReply->code;
        e.bytesTransferred = progress.bytesTransferred;
        setError(error, e);
        return std::nullopt;
    }

    TransferResult result;
    result.direction = direction;
    result.remoteName = command.argument();
    result.bytesTransferred = progress.bytesTransferred;
    result.elapsedMs = timer_.elapsed();
    result.finalReply = *finalReply;

    qDebug() << "FTP:" << commandText << "complete," << result.bytesTransferred << "bytes in"
             << result.elapsedMs << "ms";
    return result;
}

bool TransferEngine::sendChunks(IByteStream *stream, QIODevice *source,
                                TransferProgress &progress, FtpError *error)
{
    char buffer[ChunkSize];

    while (true) {
        if (isCancelled()) {
            *error = FtpError(FtpError::Kind::Cancelled, QStringLiteral("Upload cancelled"));
            return false;
        }

        const qint64 n = source->read(buffer, ChunkSize);
        if (n < 0) {
            *error = FtpError(FtpError::Kind::TransferFailed,
                              QString("Local read failed: %1").arg(source->errorString()));
            return false;
        }
        if (n == 0) {
            return true;
        }

        if (!stream->write(QByteArray(buffer, static_cast<int>(n)), negotiator_->dataTimeout())) {
            *error = FtpError(FtpError::Kind::TransferFailed,
                              QString("Data connection write failed: %1")
                                  .arg(stream->errorString()));
            return false;
        }

        progress.bytesTransferred += n;
        progress.elapsedMs = timer_.elapsed();
        LOG_VERBOSE() << "FTP: Sent" << n << "bytes, total" << progress.bytesTransferred;
        emit progressChanged(progress);
    }
}

bool TransferEngine::receiveChunks(IByteStream *stream, QIODevice *sink,
                                   TransferProgress &progress, FtpError *error)
{
    char buffer[ChunkSize];

    while (true) {
        if (isCancelled()) {
            *error = FtpError(FtpError::Kind::Cancelled, QStringLiteral("Download cancelled"));
            return false;
        }

        const qint64 n = stream->read(buffer, ChunkSize, negotiator_->dataTimeout());
        if (n == 0) {
            return true;
        }
        if (n < 0) {
            const QString reason = stream->status() == IByteStream::Status::TimedOut
                                       ? QStringLiteral("Data connection timed out")
                                       : stream->errorString();
            *error = FtpError(FtpError::Kind::TransferFailed,
                              QString("Data connection read failed: %1").arg(reason));
            return false;
        }

        if (sink->write(buffer, n) != n) {
            *error = FtpError(FtpError::Kind::TransferFailed,
                              QString("Local write failed: %1").arg(sink->errorString()));
            return false;
        }

        progress.bytesTransferred += n;
        progress.elapsedMs = timer_.elapsed();
        LOG_VERBOSE() << "FTP: Received" << n << "bytes, total" << progress.bytesTransferred;
        emit progressChanged(progress);
    }
}
