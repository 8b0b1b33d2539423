/**
 * @file controlchannel.h
 * @brief Lock-step command/reply exchange over the FTP control connection.
 */

#ifndef CONTROLCHANNEL_H
#define CONTROLCHANNEL_H

#include <QObject>

#include <optional>

#include "ftpcommand.h"
#include "ftperror.h"
#include "ftpreply.h"
#include "inetworkbackend.h"

/**
 * @brief Owns the control stream and pairs each command with one reply.
 *
 * There is no pipelining: sendCommand() writes one command and blocks until
 * its reply has been read. A failed write, a zero-byte read, or a read
 * timeout closes the stream; the owner is expected to check isOpen() and
 * drop back to the disconnected state. Negative replies (4xx/5xx) are
 * returned normally.
 */
class ControlChannel : public QObject
{
    Q_OBJECT

public:
    static constexpr int ReadChunkSize = 4096;          ///< Bytes per read from the control stream
    static constexpr int DefaultTimeoutMs = 5000;       ///< Per-read and per-write wait

    /**
     * @brief Takes ownership of a connected stream.
     * @param stream Connected control stream.
     * @param timeoutMs Maximum wait for any single read or write.
     * @param parent Optional parent QObject.
     */
    explicit ControlChannel(ByteStreamPtr stream, int timeoutMs = DefaultTimeoutMs,
                            QObject *parent = nullptr);
    ~ControlChannel() override;

    void setTimeout(int timeoutMs) { timeoutMs_ = timeoutMs; }
    [[nodiscard]] int timeout() const { return timeoutMs_; }

    /**
     * @brief Reads the server's unsolicited opening reply.
     */
    std::optional<FtpReply> readGreeting();

    /**
     * @brief Writes @p command and reads exactly one reply.
     * @return The reply, or std::nullopt with lastError() set.
     */
    std::optional<FtpReply> sendCommand(const FtpCommand &command);

    /**
     * @brief Reads one more reply without sending anything.
     *
     * Used for the completion reply that follows a data transfer.
     */
    std::optional<FtpReply> readReply();

    /**
     * @brief Closes the control stream. Safe to call repeatedly.
     */
    void close();

    [[nodiscard]] bool isOpen() const;
    [[nodiscard]] FtpError lastError() const { return lastError_; }

    [[nodiscard]] QHostAddress localAddress() const;
    [[nodiscard]] QHostAddress peerAddress() const;

signals:
    /**
     * @brief Emitted after a command was written (password masked).
     */
    void commandSent(const QString &command);

    /**
     * @brief Emitted for every complete reply read.
     */
    void replyReceived(const FtpReply &reply);

private:
    void fail(FtpError::Kind kind, const QString &message);

    ByteStreamPtr stream_;
    int timeoutMs_;
    FtpReplyParser parser_;
    FtpError lastError_;
    QString currentCommand_;
    bool closed_ = false;
};

#endif // CONTROLCHANNEL_H
