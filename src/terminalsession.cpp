#include "terminalsession.h"
#include "services/errorhandler.h"
#include "utils/logging.h"

#include <QDebug>

#include <atomic>
#include <csignal>

#ifdef Q_OS_UNIX
#include <signal.h>
#endif

namespace {

// Session cancelled by TerminalSession::interrupt()
std::atomic<FtpSession *> interruptTarget{nullptr};

// Routes SIGINT to the session for the lifetime of one blocking operation
class InterruptScope
{
public:
    explicit InterruptScope(FtpSession *session)
    {
        interruptTarget.store(session);
#ifdef Q_OS_UNIX
        struct sigaction action = {};
        action.sa_handler = &TerminalSession::interrupt;
        sigemptyset(&action.sa_mask);
        sigaction(SIGINT, &action, &previous_);
#else
        previous_ = std::signal(SIGINT, &TerminalSession::interrupt);
#endif
    }

    ~InterruptScope()
    {
#ifdef Q_OS_UNIX
        sigaction(SIGINT, &previous_, nullptr);
#else
        std::signal(SIGINT, previous_);
#endif
        interruptTarget.store(nullptr);
    }

    InterruptScope(const InterruptScope &) = delete;
    InterruptScope &operator=(const InterruptScope &) = delete;

private:
#ifdef Q_OS_UNIX
    struct sigaction previous_ = {};
#else
    void (*previous_)(int) = SIG_DFL;
#endif
};

} // namespace

TerminalSession::TerminalSession(FtpSession *session, const ClientConfig &config,
                                 QTextStream *input, QTextStream *output, QObject *parent)
    : QObject(parent)
    , session_(session)
    , config_(config)
    , in_(input)
    , out_(output)
    , errorHandler_(new ErrorHandler(this))
{
    connect(session_, &FtpSession::errorOccurred,
            errorHandler_, &ErrorHandler::handleFtpError);
    connect(errorHandler_, &ErrorHandler::statusMessage,
            this, &TerminalSession::printStatus);
    connect(session_, &FtpSession::transferProgress,
            this, &TerminalSession::onTransferProgress);
    connect(session_, &FtpSession::dataConnectionClosed,
            this, &TerminalSession::onDataConnectionClosed);
}

int TerminalSession::run()
{
    *out_ << "RAX FTP Client - Interactive Session\n"
          << "Server: " << config_.displayName() << "\n"
          << "Current state: " << FtpSession::stateToString(session_->state()) << "\n"
          << "Type 'HELP' for available commands or 'QUIT' to exit\n\n";

    connectToServer();

    while (true) {
        *out_ << prompt();
        out_->flush();

        const QString line = in_->readLine();
        if (line.isNull()) {
            *out_ << "\n";
            break;
        }
        if (line.trimmed().isEmpty()) {
            continue;
        }

        LOG_VERBOSE() << "Terminal: User entered" << FtpCommand::parse(line).toDisplayString();
        if (!handleLine(line)) {
            break;
        }
    }

    if (session_->isConnected()) {
        *out_ << "Closing remaining connection...\n";
        session_->quit();
    }
    out_->flush();
    return 0;
}

bool TerminalSession::handleLine(const QString &line)
{
    const bool wasConnected = session_->isConnected();
    const FtpCommand command = FtpCommand::parse(line);

    if (!executeCommand(command)) {
        return false;
    }

    if (wasConnected && !session_->isConnected()) {
        *out_ << "Connection closed by server. Closing session...\n";
        return false;
    }
    return true;
}

void TerminalSession::interrupt(int signal)
{
    Q_UNUSED(signal)
    // Only lock-free atomic stores here
    if (FtpSession *session = interruptTarget.load()) {
        session->requestCancel();
    }
}

QString TerminalSession::prompt() const
{
    return QString("rax-ftp-client (%1)> ").arg(FtpSession::stateToString(session_->state()));
}

void TerminalSession::printStatus(const QString &message)
{
    if (progressLineOpen_) {
        *out_ << "\n";
        progressLineOpen_ = false;
    }
    *out_ << "Error: " << message << "\n";
    out_->flush();
}

void TerminalSession::onTransferProgress(const TransferProgress &progress)
{
    *out_ << "\r" << progress.remoteName << ": ";
    if (progress.isTotalKnown()) {
        *out_ << QString::number(progress.percentage(), 'f', 1) << "% ";
    }
    *out_ << "(" << TransferProgress::formatBytes(progress.bytesTransferred) << ") "
          << TransferProgress::formatRate(progress.bytesPerSecond());
    out_->flush();
    progressLineOpen_ = true;
}

void TerminalSession::onDataConnectionClosed()
{
    if (progressLineOpen_) {
        *out_ << "\n";
        progressLineOpen_ = false;
    }
}

void TerminalSession::connectToServer()
{
    *out_ << "Attempting to connect to server...\n";
    out_->flush();

    bool connected = false;
    {
        InterruptScope scope(session_);
        connected = session_->connectToHost(config_.host, config_.port);
    }
    if (connected) {
        printReply(session_->lastReply());
        *out_ << "Connected successfully! State: "
              << FtpSession::stateToString(session_->state()) << "\n\n";
    } else {
        *out_ << "Continuing in disconnected mode...\n\n";
    }
}

void TerminalSession::printReply(const std::optional<FtpReply> &reply)
{
    if (reply) {
        *out_ << reply->toString() << "\n";
    }
}

void TerminalSession::printTransfer(const std::optional<TransferResult> &result)
{
    if (!result) {
        return;
    }

    switch (result->direction) {
    case TransferResult::Direction::Upload:
        *out_ << "Upload completed: " << result->remoteName << " ("
              << TransferProgress::formatBytes(result->bytesTransferred) << ")\n";
        break;
    case TransferResult::Direction::Download:
        *out_ << "Download completed: " << result->remoteName << " ("
              << TransferProgress::formatBytes(result->bytesTransferred) << ")\n";
        break;
    case TransferResult::Direction::Listing:
        for (const QString &entry : result->listing) {
            *out_ << entry << "\n";
        }
        *out_ << result->listing.size() << " entries\n";
        break;
    }
    printReply(result->finalReply);
}

bool TerminalSession::executeCommand(const FtpCommand &command)
{
    switch (command.verb()) {
    case FtpCommand::Verb::Unknown:
        errorHandler_->handleError(ErrorCategory::Validation, ErrorSeverity::Warning,
                                   tr("Invalid command"), command.argument());
        return true;

    case FtpCommand::Verb::Help:
        *out_ << FtpCommand::helpText(config_.displayName(),
                                      FtpSession::stateToString(session_->state()),
                                      config_.localDirectory, config_.dataPortRange())
              << "\n";
        return true;

    case FtpCommand::Verb::Quit:
        if (session_->isConnected()) {
            session_->quit();
            printReply(session_->lastReply());
        }
        *out_ << "Goodbye.\n";
        return false;

    case FtpCommand::Verb::User:
        printReply(session_->user(command.argument()));
        return true;

    case FtpCommand::Verb::Pass:
        printReply(session_->pass(command.argument()));
        return true;

    case FtpCommand::Verb::Logout:
        printReply(session_->logout());
        return true;

    case FtpCommand::Verb::Pwd:
        printReply(session_->printWorkingDirectory());
        return true;

    case FtpCommand::Verb::Cwd:
        printReply(session_->changeDirectory(command.argument()));
        return true;

    case FtpCommand::Verb::Del:
        printReply(session_->remove(command.argument()));
        return true;

    case FtpCommand::Verb::Rax:
        printReply(session_->rax());
        return true;

    case FtpCommand::Verb::Port:
        if (session_->setDataMode(DataMode::Active)) {
            *out_ << "Active mode (PORT) selected for data transfers, ports "
                  << config_.dataPortRange() << "\n";
        }
        return true;

    case FtpCommand::Verb::Pasv:
        if (session_->setDataMode(DataMode::Passive)) {
            *out_ << "Passive mode (PASV) selected for data transfers\n";
        }
        return true;

    case FtpCommand::Verb::Stor: {
        InterruptScope scope(session_);
        printTransfer(session_->uploadFile(command.argument()));
        return true;
    }

    case FtpCommand::Verb::Retr: {
        InterruptScope scope(session_);
        printTransfer(session_->downloadFile(command.argument()));
        return true;
    }

    case FtpCommand::Verb::List: {
        InterruptScope scope(session_);
        printTransfer(session_->list(command.argument()));
        return true;
    }
    }
    return true;
}
