/**
 * @file ftpcommand.h
 * @brief Typed FTP command with wire encoding and user-input parsing.
 */

#ifndef FTPCOMMAND_H
#define FTPCOMMAND_H

#include <QByteArray>
#include <QHostAddress>
#include <QString>

/**
 * @brief One command as issued by the user or by the client itself.
 *
 * A command is a verb plus an optional argument. encode() yields the exact
 * bytes written to the control connection; toDisplayString() yields the
 * form used for logs and signals, with the password masked.
 */
class FtpCommand
{
public:
    enum class Verb {
        User,
        Pass,
        Port,
        Pasv,
        Stor,
        Retr,
        List,
        Del,
        Pwd,
        Cwd,
        Logout,
        Rax,
        Quit,
        Help,       ///< Handled by the client, never sent
        Unknown     ///< Parse failure; argument() holds the reason
    };

    FtpCommand() = default;
    explicit FtpCommand(Verb verb, const QString &argument = QString());

    [[nodiscard]] Verb verb() const { return verb_; }
    [[nodiscard]] QString argument() const { return argument_; }

    /**
     * @brief Wire form: verb, a single space and the argument, then CRLF.
     *
     * Commands without an argument encode as the verb and CRLF only.
     */
    [[nodiscard]] QByteArray encode() const;

    /**
     * @brief Loggable form without CRLF; PASS arguments are masked.
     */
    [[nodiscard]] QString toDisplayString() const;

    [[nodiscard]] bool isClientOnly() const { return verb_ == Verb::Help; }

    /**
     * @brief False if the argument holds CR or LF, which would put a
     *        second command line on the wire.
     */
    [[nodiscard]] bool isWireSafe() const;
    [[nodiscard]] bool isValid() const { return verb_ != Verb::Unknown; }

    /**
     * @brief True for commands the session accepts only once logged in.
     */
    [[nodiscard]] bool requiresAuthentication() const;

    /**
     * @brief Parses a line typed at the prompt.
     *
     * The verb is matched case-insensitively and separated from the
     * argument at the first run of whitespace. Missing required arguments,
     * arguments containing line breaks, empty input and unrecognised verbs
     * yield an Unknown command whose argument() explains the problem.
     */
    [[nodiscard]] static FtpCommand parse(const QString &input);

    /**
     * @brief Builds "PORT h1,h2,h3,h4,p1,p2" for an IPv4 endpoint.
     */
    [[nodiscard]] static FtpCommand port(const QHostAddress &address, quint16 port);

    [[nodiscard]] static QString verbToString(Verb verb);

    /**
     * @brief Help listing for the interactive prompt.
     * @param server Server display name.
     * @param state Current session state name.
     * @param localDirectory Local transfer directory.
     * @param portRange Active-mode data port range, e.g. "2122-2130".
     */
    [[nodiscard]] static QString helpText(const QString &server, const QString &state,
                                          const QString &localDirectory,
                                          const QString &portRange);

    bool operator==(const FtpCommand &other) const
    {
        return verb_ == other.verb_ && argument_ == other.argument_;
    }

private:
    Verb verb_ = Verb::Unknown;
    QString argument_;
};

#endif // FTPCOMMAND_H
