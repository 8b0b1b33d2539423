#include "ftpsession.h"

#include <QDebug>
#include <QFileInfo>

FtpSession::FtpSession(INetworkBackend *backend, QObject *parent)
    : QObject(parent)
    , backend_(backend)
    , negotiator_(new DataConnectionNegotiator(backend, &retry_, this))
    , engine_(new TransferEngine(negotiator_, this))
{
    retry_.setCancelFlag(&cancelRequested_);
    engine_->setCancelFlag(&cancelRequested_);

    connect(engine_, &TransferEngine::progressChanged,
            this, &FtpSession::transferProgress);
    connect(engine_, &TransferEngine::dataConnectionOpened,
            this, &FtpSession::dataConnectionOpened);
    connect(engine_, &TransferEngine::dataConnectionClosed,
            this, &FtpSession::dataConnectionClosed);
}

FtpSession::~FtpSession()
{
    // No signals from a half-destroyed object
    if (control_) {
        control_->disconnect(this);
        control_->close();
    }
}

void FtpSession::configure(const ClientConfig &config)
{
    setControlTimeout(config.timeoutSecs * 1000);
    setDataTimeout(config.dataTimeoutSecs * 1000);
    setRetryPolicy(RetryPolicy{config.maxRetries, config.retryBaseDelayMs,
                               RetryPolicy::DefaultMaxDelayMs});
    setDataPortRange(config.dataPortStart, config.dataPortEnd);
    setLocalDirectory(config.localDirectory);
}

void FtpSession::setControlTimeout(int timeoutMs)
{
    controlTimeoutMs_ = timeoutMs;
    if (control_) {
        control_->setTimeout(timeoutMs);
    }
}

void FtpSession::setDataTimeout(int timeoutMs)
{
    negotiator_->setDataTimeout(timeoutMs);
}

void FtpSession::setDataPortRange(quint16 first, quint16 last)
{
    negotiator_->setPortRange(first, last);
}

bool FtpSession::connectToHost(const QString &host, quint16 port)
{
    beginOperation();

    if (state_ != State::Disconnected) {
        FtpError error(FtpError::Kind::InvalidState,
                       QString("Already connected to %1:%2").arg(host_).arg(port_));
        reportError(error);
        return false;
    }

    qDebug() << "FTP: Connecting to" << host << ":" << port;

    FtpError error;
    ByteStreamPtr stream = retry_.attempt(
        [this, &host, port](FtpError *e) {
            return backend_->connectToHost(host, port, controlTimeoutMs_, e);
        },
        &error);
    if (!stream) {
        reportError(error);
        return false;
    }

    control_ = std::make_unique<ControlChannel>(std::move(stream), controlTimeoutMs_);
    connect(control_.get(), &ControlChannel::commandSent, this, &FtpSession::commandSent);
    connect(control_.get(), &ControlChannel::replyReceived, this, &FtpSession::replyReceived);

    auto greeting = control_->readGreeting();
    if (!greeting) {
        FtpError greetingError = control_->lastError();
        closeControlChannel();
        reportError(greetingError);
        return false;
    }
    lastReply_ = *greeting;

    if (!greeting->isSuccess()) {
        FtpError greetingError(FtpError::Kind::UnexpectedReply,
                               QString("Server refused connection: %1").arg(greeting->message));
        greetingError.replyCode = greeting->code;
        closeControlChannel();
        reportError(greetingError);
        return false;
    }

    host_ = host;
    port_ = port;
    qDebug() << "FTP: Connected to" << host << ":" << port << "after"
             << retry_.lastAttemptCount() << "attempt(s)";
    setState(State::Connected);
    return true;
}

bool FtpSession::quit()
{
    if (state_ == State::Disconnected) {
        return true;
    }
    beginOperation();

    auto reply = control_->sendCommand(FtpCommand(FtpCommand::Verb::Quit));
    if (reply) {
        lastReply_ = *reply;
    } else {
        qWarning() << "FTP: QUIT not acknowledged:" << control_->lastError().toString();
    }

    closeControlChannel();
    return true;
}

void FtpSession::disconnectFromHost()
{
    if (state_ == State::Disconnected && !control_) {
        return;
    }
    closeControlChannel();
}

bool FtpSession::login(const QString &user, const QString &password)
{
    auto userReply = this->user(user);
    if (!userReply) {
        return false;
    }
    if (state_ == State::Authenticated) {
        return true;
    }
    if (stagedUser_.isEmpty()) {
        // Rejected, error already reported
        return false;
    }

    auto passReply = pass(password);
    return passReply && state_ == State::Authenticated;
}

std::optional<FtpReply> FtpSession::user(const QString &name)
{
    beginOperation();
    if (!requireState(State::Connected, QStringLiteral("USER ") + name)) {
        return std::nullopt;
    }

    stagedUser_.clear();
    auto reply = exchange(FtpCommand(FtpCommand::Verb::User, name));
    if (!reply) {
        return std::nullopt;
    }

    if (reply->isIntermediate()) {
        stagedUser_ = name;
    } else if (reply->isSuccess()) {
        qDebug() << "FTP: Logged in as" << name << "without password";
        setState(State::Authenticated);
    } else {
        authenticationFailed(QStringLiteral("USER ") + name, *reply);
    }
    return reply;
}

std::optional<FtpReply> FtpSession::pass(const QString &password)
{
    beginOperation();
    if (!requireState(State::Connected, QStringLiteral("PASS ****"))) {
        return std::nullopt;
    }
    if (stagedUser_.isEmpty()) {
        FtpError error(FtpError::Kind::InvalidState, QStringLiteral("Send USER before PASS"));
        error.command = QStringLiteral("PASS ****");
        reportError(error);
        return std::nullopt;
    }

    const QString name = stagedUser_;
    auto reply = exchange(FtpCommand(FtpCommand::Verb::Pass, password));
    stagedUser_.clear();
    if (!reply) {
        return std::nullopt;
    }

    if (reply->isSuccess()) {
        qDebug() << "FTP: Logged in as" << name;
        setState(State::Authenticated);
    } else {
        authenticationFailed(QStringLiteral("PASS ****"), *reply);
    }
    return reply;
}

std::optional<FtpReply> FtpSession::logout()
{
    beginOperation();
    if (!requireState(State::Authenticated, QStringLiteral("LOGOUT"))) {
        return std::nullopt;
    }

    auto reply = exchange(FtpCommand(FtpCommand::Verb::Logout));
    if (reply && reply->isSuccess()) {
        setState(State::Connected);
    }
    return reply;
}

std::optional<FtpReply> FtpSession::printWorkingDirectory()
{
    beginOperation();
    if (!requireState(State::Authenticated, QStringLiteral("PWD"))) {
        return std::nullopt;
    }
    return exchange(FtpCommand(FtpCommand::Verb::Pwd));
}

std::optional<FtpReply> FtpSession::changeDirectory(const QString &path)
{
    const FtpCommand command(FtpCommand::Verb::Cwd, path);
    beginOperation();
    if (!requireState(State::Authenticated, command.toDisplayString())) {
        return std::nullopt;
    }
    return exchange(command);
}

std::optional<FtpReply> FtpSession::remove(const QString &name)
{
    const FtpCommand command(FtpCommand::Verb::Del, name);
    beginOperation();
    if (!requireState(State::Authenticated, command.toDisplayString())) {
        return std::nullopt;
    }
    return exchange(command);
}

std::optional<FtpReply> FtpSession::rax()
{
    beginOperation();
    if (!requireState(State::Authenticated, QStringLiteral("RAX"))) {
        return std::nullopt;
    }
    return exchange(FtpCommand(FtpCommand::Verb::Rax));
}

bool FtpSession::setDataMode(DataMode mode)
{
    beginOperation();
    const QString command = mode == DataMode::Active ? QStringLiteral("PORT")
                                                     : QStringLiteral("PASV");
    if (!requireState(State::Authenticated, command)) {
        return false;
    }

    if (dataMode_ != mode) {
        dataMode_ = mode;
        qDebug() << "FTP: Data mode set to" << dataModeToString(mode);
        emit dataModeChanged(mode);
    }
    return true;
}

std::optional<TransferResult> FtpSession::upload(QIODevice *source, const QString &remoteName)
{
    const FtpCommand command(FtpCommand::Verb::Stor, remoteName);
    beginOperation();
    if (!requireState(State::Authenticated, command.toDisplayString())
        || !requireWireSafe(command)) {
        return std::nullopt;
    }

    FtpError error;
    auto result = engine_->upload(control_.get(), dataMode_, source, remoteName, &error);
    return finishTransfer(std::move(result), error);
}

std::optional<TransferResult> FtpSession::download(const QString &remoteName, QIODevice *sink)
{
    const FtpCommand command(FtpCommand::Verb::Retr, remoteName);
    beginOperation();
    if (!requireState(State::Authenticated, command.toDisplayString())
        || !requireWireSafe(command)) {
        return std::nullopt;
    }

    FtpError error;
    auto result = engine_->download(control_.get(), dataMode_, remoteName, sink, &error);
    return finishTransfer(std::move(result), error);
}

std::optional<TransferResult> FtpSession::list(const QString &path)
{
    const FtpCommand command(FtpCommand::Verb::List, path);
    beginOperation();
    if (!requireState(State::Authenticated, command.toDisplayString())
        || !requireWireSafe(command)) {
        return std::nullopt;
    }

    FtpError error;
    auto result = engine_->list(control_.get(), dataMode_, path, &error);
    return finishTransfer(std::move(result), error);
}

std::optional<TransferResult> FtpSession::uploadFile(const QString &localName,
                                                     const QString &remoteName)
{
    const QString target = remoteName.isEmpty() ? QFileInfo(localName).fileName() : remoteName;
    const FtpCommand command(FtpCommand::Verb::Stor, target);
    beginOperation();
    if (!requireState(State::Authenticated, command.toDisplayString())
        || !requireWireSafe(command)) {
        return std::nullopt;
    }

    FtpError openError;
    std::unique_ptr<QFile> file = fileStore_.openForReading(localName, &openError);
    if (!file) {
        openError.command = command.toDisplayString();
        reportError(openError);
        return std::nullopt;
    }

    return upload(file.get(), target);
}

std::optional<TransferResult> FtpSession::downloadFile(const QString &remoteName,
                                                       const QString &localName)
{
    const QString target = localName.isEmpty() ? QFileInfo(remoteName).fileName() : localName;
    const FtpCommand command(FtpCommand::Verb::Retr, remoteName);
    beginOperation();
    if (!requireState(State::Authenticated, command.toDisplayString())
        || !requireWireSafe(command)) {
        return std::nullopt;
    }

    FtpError openError;
    std::unique_ptr<QSaveFile> file = fileStore_.openForWriting(target, &openError);
    if (!file) {
        openError.command = command.toDisplayString();
        reportError(openError);
        return std::nullopt;
    }

    auto result = download(remoteName, file.get());
    if (!result) {
        file->cancelWriting();
        return std::nullopt;
    }

    if (!file->commit()) {
        FtpError saveError(FtpError::Kind::TransferFailed,
                           QString("Cannot save local file '%1': %2")
                               .arg(file->fileName(), file->errorString()));
        saveError.command = command.toDisplayString();
        saveError.bytesTransferred = result->bytesTransferred;
        reportError(saveError);
        return std::nullopt;
    }
    return result;
}

QString FtpSession::stateToString(State state)
{
    switch (state) {
    case State::Disconnected:
        return QStringLiteral("disconnected");
    case State::Connected:
        return QStringLiteral("connected");
    case State::Authenticated:
        return QStringLiteral("authenticated");
    }
    return QString();
}

void FtpSession::setState(State state)
{
    if (state_ != state) {
        qDebug() << "FTP: State" << stateToString(state_) << "->" << stateToString(state);
        state_ = state;
        emit stateChanged(state);
    }
}

void FtpSession::beginOperation()
{
    cancelRequested_.store(false);
    lastError_ = FtpError();
}

bool FtpSession::requireState(State required, const QString &command)
{
    if (state_ == required) {
        return true;
    }

    FtpError error(FtpError::Kind::InvalidState,
                   QString("Requires %1 session, current state is %2")
                       .arg(stateToString(required), stateToString(state_)));
    error.command = command;
    reportError(error);
    return false;
}

bool FtpSession::requireWireSafe(const FtpCommand &command)
{
    if (command.isWireSafe()) {
        return true;
    }

    FtpError error(FtpError::Kind::Malformed,
                   QStringLiteral("Command argument contains a line break"));
    error.command = command.toDisplayString();
    reportError(error);
    return false;
}

std::optional<FtpReply> FtpSession::exchange(const FtpCommand &command)
{
    auto reply = control_->sendCommand(command);
    if (!reply) {
        const FtpError error = control_->lastError();
        checkControlChannel();
        reportError(error);
        return std::nullopt;
    }
    lastReply_ = *reply;
    return reply;
}

std::optional<TransferResult> FtpSession::finishTransfer(std::optional<TransferResult> result,
                                                         const FtpError &error)
{
    checkControlChannel();
    if (!result) {
        reportError(error);
        return std::nullopt;
    }
    lastReply_ = result->finalReply;
    return result;
}

void FtpSession::checkControlChannel()
{
    if (control_ && !control_->isOpen()) {
        qWarning() << "FTP: Control connection lost";
        closeControlChannel();
    }
}

void FtpSession::closeControlChannel()
{
    if (control_) {
        control_->close();
        control_.reset();
    }
    stagedUser_.clear();
    setState(State::Disconnected);
}

void FtpSession::reportError(const FtpError &error)
{
    lastError_ = error;
    qWarning() << "FTP:" << error.toString();
    emit errorOccurred(error);
}

void FtpSession::authenticationFailed(const QString &command, const FtpReply &reply)
{
    stagedUser_.clear();
    FtpError error(FtpError::Kind::AuthenticationFailed, reply.message);
    error.command = command;
    error.replyCode = reply.code;
    reportError(error);
}
