#include "ftpreply.h"

FtpReply::ReplyClass FtpReply::replyClass() const
{
    switch (code / 100) {
    case 1:
        return ReplyClass::Preliminary;
    case 2:
        return ReplyClass::Completion;
    case 3:
        return ReplyClass::Intermediate;
    case 4:
        return ReplyClass::TransientNegative;
    case 5:
        return ReplyClass::PermanentNegative;
    default:
        return ReplyClass::Invalid;
    }
}

QString FtpReply::toString() const
{
    if (message.isEmpty()) {
        return QString::number(code);
    }
    return QString("%1 %2").arg(code).arg(message);
}

void FtpReplyParser::feed(const QByteArray &data)
{
    buffer_.append(data);
}

FtpReplyParser::Status FtpReplyParser::next(FtpReply *reply)
{
    errorString_.clear();

    while (true) {
        int idx = buffer_.indexOf('\n');
        if (idx < 0) {
            return Status::NeedMoreData;
        }

        QByteArray raw = buffer_.left(idx);
        buffer_.remove(0, idx + 1);
        if (raw.endsWith('\r')) {
            raw.chop(1);
        }
        const QString line = QString::fromUtf8(raw);

        if (inMultiline_) {
            // Only "<code> " closes the reply; anything else is continuation text
            const QString terminator = QString::number(pendingCode_) + QLatin1Char(' ');
            if (line.startsWith(terminator)) {
                pendingLines_.append(line.mid(TextOffset));
                reply->code = pendingCode_;
                reply->message = pendingLines_.join(QLatin1Char('\n'));
                reply->isFinal = true;

                inMultiline_ = false;
                pendingCode_ = 0;
                pendingLines_.clear();
                return Status::Complete;
            }
            pendingLines_.append(line);
            continue;
        }

        if (!hasCode(line)) {
            errorString_ = QString("Malformed reply line: '%1'").arg(line);
            return Status::Malformed;
        }

        const int code = line.left(CodeLength).toInt();

        if (line.length() == CodeLength) {
            reply->code = code;
            reply->message.clear();
            reply->isFinal = true;
            return Status::Complete;
        }

        const QChar separator = line.at(CodeLength);
        if (separator == QLatin1Char(' ')) {
            reply->code = code;
            reply->message = line.mid(TextOffset);
            reply->isFinal = true;
            return Status::Complete;
        }

        if (separator == QLatin1Char('-')) {
            inMultiline_ = true;
            pendingCode_ = code;
            pendingLines_ = QStringList{line.mid(TextOffset)};
            continue;
        }

        errorString_ = QString("Malformed reply line: missing separator after code in '%1'").arg(line);
        return Status::Malformed;
    }
}

bool FtpReplyParser::hasPartialReply() const
{
    return inMultiline_ || !buffer_.isEmpty();
}

void FtpReplyParser::reset()
{
    buffer_.clear();
    inMultiline_ = false;
    pendingCode_ = 0;
    pendingLines_.clear();
    errorString_.clear();
}

bool FtpReplyParser::hasCode(const QString &line)
{
    if (line.length() < CodeLength) {
        return false;
    }
    for (int i = 0; i < CodeLength; ++i) {
        if (!line.at(i).isDigit()) {
            return false;
        }
    }
    // Reply codes start at 100
    return line.at(0) != QLatin1Char('0');
}
