/**
 * @file ftpreply.h
 * @brief FTP server reply value and incremental control-stream parser.
 */

#ifndef FTPREPLY_H
#define FTPREPLY_H

#include <QByteArray>
#include <QMetaType>
#include <QString>
#include <QStringList>

/**
 * @brief One logical reply from the FTP server.
 *
 * Multi-line replies are folded into a single value; the text of each
 * line is joined with '\n' in @c message.
 */
struct FtpReply {
    /// @name FTP Reply Codes (RFC 959)
    /// @{
    static constexpr int FileStatusOk = 150;        ///< File status okay, opening data connection
    static constexpr int CommandOk = 200;           ///< Command okay
    static constexpr int ServiceReady = 220;        ///< Service ready for new user
    static constexpr int ClosingControl = 221;      ///< Service closing control connection
    static constexpr int TransferComplete = 226;    ///< Closing data connection, transfer complete
    static constexpr int EnteringPassive = 227;     ///< Entering passive mode
    static constexpr int UserLoggedIn = 230;        ///< User logged in, proceed
    static constexpr int PasswordRequired = 331;    ///< User name okay, need password
    static constexpr int CannotOpenData = 425;      ///< Can't open data connection
    static constexpr int TransferAborted = 426;     ///< Connection closed, transfer aborted
    static constexpr int NotLoggedIn = 530;         ///< Not logged in
    static constexpr int FileUnavailable = 550;     ///< Requested action not taken
    /// @}

    /**
     * @brief Semantic class derived from the first digit of the code.
     */
    enum class ReplyClass {
        Invalid,            ///< Code outside 100-599
        Preliminary,        ///< 1xx
        Completion,         ///< 2xx
        Intermediate,       ///< 3xx
        TransientNegative,  ///< 4xx
        PermanentNegative   ///< 5xx
    };

    int code = 0;           ///< Three-digit status code
    QString message;        ///< Reply text without the code and separator
    bool isFinal = false;   ///< True once the terminating line has been seen

    [[nodiscard]] ReplyClass replyClass() const;
    [[nodiscard]] bool isPreliminary() const { return code >= 100 && code < 200; }
    [[nodiscard]] bool isSuccess() const { return code >= 200 && code < 300; }
    [[nodiscard]] bool isIntermediate() const { return code >= 300 && code < 400; }
    [[nodiscard]] bool isFailure() const { return code >= 400 && code < 600; }

    /**
     * @brief Returns the reply as "<code> <message>".
     */
    [[nodiscard]] QString toString() const;
};

Q_DECLARE_METATYPE(FtpReply)

/**
 * @brief Reassembles replies from bytes read off the control connection.
 *
 * Bytes are fed as they arrive; next() yields one complete reply at a time
 * and leaves any trailing bytes buffered for the following reply. The parser
 * never waits for data itself.
 *
 * A multi-line reply opens with "<code>-" and ends only at a line that
 * starts with exactly "<code> ". Every other line in between, including
 * lines that look like a different code or repeat "<code>-", is taken as
 * continuation text.
 *
 * @par Example usage:
 * @code
 * FtpReplyParser parser;
 * parser.feed("230-Welcome\r\n230 Logged in\r\n");
 *
 * FtpReply reply;
 * if (parser.next(&reply) == FtpReplyParser::Status::Complete) {
 *     // reply.code == 230, reply.message == "Welcome\nLogged in"
 * }
 * @endcode
 */
class FtpReplyParser
{
public:
    static constexpr int CodeLength = 3;   ///< Length of the reply code
    static constexpr int TextOffset = 4;   ///< Offset of text after code and separator

    enum class Status {
        Complete,       ///< A reply was produced
        NeedMoreData,   ///< No complete reply is buffered yet
        Malformed       ///< An opening line did not start with a valid code
    };

    /**
     * @brief Appends raw bytes read from the control stream.
     * @param data Bytes as received, possibly split mid-line.
     */
    void feed(const QByteArray &data);

    /**
     * @brief Extracts the next complete reply, if one is buffered.
     * @param reply Receives the reply when Complete is returned.
     * @return Parse status. After Malformed the offending line is dropped
     *         and errorString() describes it.
     */
    Status next(FtpReply *reply);

    /**
     * @brief True while a multi-line reply or a partial line is pending.
     */
    [[nodiscard]] bool hasPartialReply() const;

    [[nodiscard]] QString errorString() const { return errorString_; }

    /**
     * @brief Discards buffered bytes and any reply in progress.
     */
    void reset();

private:
    static bool hasCode(const QString &line);

    QByteArray buffer_;
    bool inMultiline_ = false;
    int pendingCode_ = 0;
    QStringList pendingLines_;
    QString errorString_;
};

#endif // FTPREPLY_H
