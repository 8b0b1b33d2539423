/**
 * @file ftperror.h
 * @brief Typed error value reported by the session, channel and transfer engine.
 */

#ifndef FTPERROR_H
#define FTPERROR_H

#include <QMetaType>
#include <QString>

/**
 * @brief Describes why an FTP operation failed.
 *
 * Operations return bool or std::optional and hand the details back
 * through an FtpError out-parameter (or the session's lastError()).
 * Negative replies to ordinary commands are not errors; they are returned
 * as FtpReply values for the caller to inspect.
 */
struct FtpError {
    /**
     * @brief Error taxonomy.
     */
    enum class Kind {
        None,                   ///< No error
        // Transport
        ConnectionRefused,      ///< Peer refused the connection
        HostNotFound,           ///< Host name could not be resolved
        Timeout,                ///< A blocking wait ran out of time
        ConnectionLost,         ///< Peer closed the stream or a write failed
        SocketError,            ///< Any other socket-level failure
        // Protocol
        Malformed,              ///< Reply or PASV payload could not be parsed
        UnexpectedReply,        ///< Reply class did not fit the current step
        // Session
        InvalidState,           ///< Command not permitted in the current state
        AuthenticationFailed,   ///< USER/PASS rejected
        // Transfer
        TransferFailed,         ///< Local I/O or data stream failure while streaming
        NoPortAvailable,        ///< Whole active-mode port range is taken
        DataConnectTimeout,     ///< Server never connected to the active-mode listener
        Cancelled               ///< Caller requested cancellation
    };

    FtpError() = default;
    FtpError(Kind kind, const QString &message);

    Kind kind = Kind::None;
    QString message;            ///< Human-readable description
    QString command;            ///< Display form of the command in flight, if any
    int replyCode = 0;          ///< Reply code involved, 0 if none
    qint64 bytesTransferred = 0; ///< Bytes moved before a transfer failed

    [[nodiscard]] bool isError() const { return kind != Kind::None; }

    /**
     * @brief True for failures a retry may cure (refused, unresolved, timed out, lost).
     */
    [[nodiscard]] bool isTransportError() const;

    [[nodiscard]] bool isProtocolError() const
    {
        return kind == Kind::Malformed || kind == Kind::UnexpectedReply;
    }

    /**
     * @brief Full description including command, reply code and byte count.
     */
    [[nodiscard]] QString toString() const;

    [[nodiscard]] static QString kindToString(Kind kind);
};

Q_DECLARE_METATYPE(FtpError)
Q_DECLARE_METATYPE(FtpError::Kind)

#endif // FTPERROR_H
