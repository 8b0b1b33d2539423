#include "ftpcommand.h"
#include "ftpaddress.h"

#include <QRegularExpression>

FtpCommand::FtpCommand(Verb verb, const QString &argument)
    : verb_(verb)
    , argument_(argument)
{
}

QByteArray FtpCommand::encode() const
{
    QByteArray wire = verbToString(verb_).toLatin1();
    if (!argument_.isEmpty()) {
        wire += ' ';
        wire += argument_.toUtf8();
    }
    wire += "\r\n";
    return wire;
}

QString FtpCommand::toDisplayString() const
{
    if (verb_ == Verb::Unknown) {
        return argument_;
    }
    if (verb_ == Verb::Pass) {
        return QStringLiteral("PASS ****");
    }
    if (argument_.isEmpty()) {
        return verbToString(verb_);
    }
    return verbToString(verb_) + QLatin1Char(' ') + argument_;
}

bool FtpCommand::isWireSafe() const
{
    return !argument_.contains(QLatin1Char('\r')) && !argument_.contains(QLatin1Char('\n'));
}

bool FtpCommand::requiresAuthentication() const
{
    switch (verb_) {
    case Verb::Stor:
    case Verb::Retr:
    case Verb::List:
    case Verb::Del:
    case Verb::Pwd:
    case Verb::Cwd:
    case Verb::Port:
    case Verb::Pasv:
    case Verb::Rax:
    case Verb::Logout:
        return true;
    default:
        return false;
    }
}

FtpCommand FtpCommand::parse(const QString &input)
{
    const QString trimmed = input.trimmed();
    if (trimmed.isEmpty()) {
        return FtpCommand(Verb::Unknown, QStringLiteral("Empty command"));
    }

    static const QRegularExpression whitespace("\\s+");
    const int split = trimmed.indexOf(whitespace);
    const QString name = (split < 0 ? trimmed : trimmed.left(split)).toUpper();
    const QString arg = split < 0 ? QString() : trimmed.mid(split).trimmed();
    if (arg.contains(QLatin1Char('\r')) || arg.contains(QLatin1Char('\n'))) {
        return FtpCommand(Verb::Unknown,
                          QString("%1 argument must not contain line breaks").arg(name));
    }

    // Verbs that cannot be sent without an argument, and what is missing
    struct Required {
        const char *name;
        Verb verb;
        const char *what;
    };
    static const Required required[] = {
        {"USER", Verb::User, "username"},
        {"PASS", Verb::Pass, "password"},
        {"STOR", Verb::Stor, "filename"},
        {"RETR", Verb::Retr, "filename"},
        {"DEL", Verb::Del, "filename"},
        {"CWD", Verb::Cwd, "directory"},
        {"PORT", Verb::Port, "address"},
    };
    for (const auto &entry : required) {
        if (name == QLatin1String(entry.name)) {
            if (arg.isEmpty()) {
                return FtpCommand(Verb::Unknown,
                                  QString("%1 requires %2").arg(name, QLatin1String(entry.what)));
            }
            return FtpCommand(entry.verb, arg);
        }
    }

    if (name == QLatin1String("LIST")) {
        return FtpCommand(Verb::List, arg);
    }
    if (name == QLatin1String("PWD")) {
        return FtpCommand(Verb::Pwd);
    }
    if (name == QLatin1String("PASV")) {
        return FtpCommand(Verb::Pasv);
    }
    if (name == QLatin1String("LOGOUT")) {
        return FtpCommand(Verb::Logout);
    }
    if (name == QLatin1String("RAX")) {
        return FtpCommand(Verb::Rax);
    }
    if (name == QLatin1String("QUIT")) {
        return FtpCommand(Verb::Quit);
    }
    if (name == QLatin1String("HELP")) {
        return FtpCommand(Verb::Help);
    }

    return FtpCommand(Verb::Unknown, QString("Unknown command: %1").arg(name));
}

FtpCommand FtpCommand::port(const QHostAddress &address, quint16 port)
{
    return FtpCommand(Verb::Port, FtpAddressCodec::encode(address, port));
}

QString FtpCommand::verbToString(Verb verb)
{
    switch (verb) {
    case Verb::User:
        return QStringLiteral("USER");
    case Verb::Pass:
        return QStringLiteral("PASS");
    case Verb::Port:
        return QStringLiteral("PORT");
    case Verb::Pasv:
        return QStringLiteral("PASV");
    case Verb::Stor:
        return QStringLiteral("STOR");
    case Verb::Retr:
        return QStringLiteral("RETR");
    case Verb::List:
        return QStringLiteral("LIST");
    case Verb::Del:
        return QStringLiteral("DEL");
    case Verb::Pwd:
        return QStringLiteral("PWD");
    case Verb::Cwd:
        return QStringLiteral("CWD");
    case Verb::Logout:
        return QStringLiteral("LOGOUT");
    case Verb::Rax:
        return QStringLiteral("RAX");
    case Verb::Quit:
        return QStringLiteral("QUIT");
    case Verb::Help:
        return QStringLiteral("HELP");
    case Verb::Unknown:
        break;
    }
    return QString();
}

QString FtpCommand::helpText(const QString &server, const QString &state,
                             const QString &localDirectory, const QString &portRange)
{
    return QStringLiteral(
               "Available commands:\n"
               "  USER <username>   - Authenticate with username\n"
               "  PASS <password>   - Provide password\n"
               "  STOR <filename>   - Upload file to server\n"
               "  RETR <filename>   - Download file from server\n"
               "  LIST [path]       - List directory contents\n"
               "  PORT <ip:port>    - Switch to active mode for data transfers\n"
               "  PASV              - Switch to passive mode for data transfers\n"
               "  PWD               - Print working directory\n"
               "  CWD <directory>   - Change working directory\n"
               "  DEL <filename>    - Delete file on server\n"
               "  LOGOUT            - Log out current user\n"
               "  RAX               - Custom server command\n"
               "  QUIT              - Disconnect and exit\n"
               "  HELP              - Show this help message\n"
               "\n"
               "Data Transfer Information:\n"
               "  Default mode: Passive (PASV)\n"
               "  Data commands (LIST, STOR, RETR) automatically establish data connections\n"
               "  Use PORT command to switch to active mode\n"
               "  Use PASV command to switch to passive mode\n"
               "\n"
               "Current server: %1\n"
               "Current state: %2\n"
               "Local directory: %3\n"
               "Data port range: %4")
        .arg(server, state, localDirectory, portRange);
}
