/**
 * @file ftpsession.h
 * @brief FTP session state machine over a single control connection.
 *
 * Provides blocking FTP operations: connection, authentication, directory
 * commands and file transfers in active or passive data mode.
 */

#ifndef FTPSESSION_H
#define FTPSESSION_H

#include <QIODevice>
#include <QObject>

#include <atomic>
#include <memory>
#include <optional>

#include "clientconfig.h"
#include "controlchannel.h"
#include "dataconnectionnegotiator.h"
#include "ftperror.h"
#include "ftpreply.h"
#include "inetworkbackend.h"
#include "localfilestore.h"
#include "retrycontroller.h"
#include "transferengine.h"
#include "transferprogress.h"

/**
 * @brief Stateful FTP client session.
 *
 * The session owns the control channel and gates every command on its
 * state. All operations block until the server has answered or a timeout
 * expires; results are returned directly and mirrored in Qt signals for
 * logging and presentation.
 *
 * Negative server replies to ordinary commands (PWD, CWD, DEL, RAX) are
 * returned as replies, not errors. Operations that fail return false or
 * std::nullopt and leave the reason in lastError(). A transport failure on
 * the control connection always drops the session to Disconnected.
 *
 * @par Example usage:
 * @code
 * TcpNetworkBackend backend;
 * FtpSession session(&backend);
 * session.configure(config);
 *
 * if (session.connectToHost("127.0.0.1", 2121) && session.login("alice", "secret")) {
 *     session.setDataMode(DataMode::Active);
 *     auto result = session.uploadFile("a.txt");
 *     session.quit();
 * }
 * @endcode
 */
class FtpSession : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Lifecycle state of the session.
     */
    enum class State {
        Disconnected,   ///< No control connection
        Connected,      ///< Control connection up, greeting read
        Authenticated   ///< USER/PASS accepted
    };
    Q_ENUM(State)

    /**
     * @brief Constructs a disconnected session.
     * @param backend Socket factory. Not owned, must outlive the session.
     * @param parent Optional parent QObject for memory management.
     */
    explicit FtpSession(INetworkBackend *backend, QObject *parent = nullptr);

    /**
     * @brief Destructor. Closes the control connection without sending QUIT.
     */
    ~FtpSession() override;

    /// @name Configuration
    /// @{
    void configure(const ClientConfig &config);
    void setControlTimeout(int timeoutMs);
    void setDataTimeout(int timeoutMs);
    void setRetryPolicy(const RetryPolicy &policy) { retry_.setPolicy(policy); }
    void setDataPortRange(quint16 first, quint16 last);
    void setLocalDirectory(const QString &path) { fileStore_.setRootPath(path); }

    [[nodiscard]] int controlTimeout() const { return controlTimeoutMs_; }
    [[nodiscard]] int dataTimeout() const { return negotiator_->dataTimeout(); }
    [[nodiscard]] QString localDirectory() const { return fileStore_.rootPath(); }
    [[nodiscard]] RetryController *retryController() { return &retry_; }
    [[nodiscard]] DataConnectionNegotiator *negotiator() const { return negotiator_; }
    /// @}

    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] bool isConnected() const { return state_ != State::Disconnected; }
    [[nodiscard]] bool isAuthenticated() const { return state_ == State::Authenticated; }
    [[nodiscard]] DataMode dataMode() const { return dataMode_; }
    [[nodiscard]] QString host() const { return host_; }
    [[nodiscard]] quint16 port() const { return port_; }

    /// @name Connection Management
    /// @{

    /**
     * @brief Opens the control connection and reads the greeting.
     *
     * The dial is retried according to the retry policy. A non-2xx
     * greeting closes the connection and fails with UnexpectedReply.
     *
     * @return True if the session is now Connected.
     */
    bool connectToHost(const QString &host, quint16 port);

    /**
     * @brief Sends QUIT and closes the control connection.
     *
     * The connection is closed whatever the reply, even if QUIT could not
     * be sent. Calling it while disconnected is a successful no-op.
     */
    bool quit();

    /**
     * @brief Closes the control connection without sending QUIT.
     */
    void disconnectFromHost();
    /// @}

    /// @name Authentication
    /// @{

    /**
     * @brief Runs USER and, if the server asks for it, PASS.
     * @return True if the session is now Authenticated. On rejection the
     *         session stays Connected and lastError() is AuthenticationFailed.
     */
    bool login(const QString &user, const QString &password);

    /**
     * @brief Sends USER alone. A 3xx reply stages the name for pass().
     * @return The server reply, or std::nullopt if none was read.
     */
    std::optional<FtpReply> user(const QString &name);

    /**
     * @brief Sends PASS for the name staged by user().
     * @return The server reply, or std::nullopt if none was read or no
     *         user is staged (InvalidState).
     */
    std::optional<FtpReply> pass(const QString &password);

    /**
     * @brief Sends LOGOUT; a 2xx reply returns the session to Connected.
     */
    std::optional<FtpReply> logout();
    /// @}

    /// @name Commands
    /// @{
    std::optional<FtpReply> printWorkingDirectory();
    std::optional<FtpReply> changeDirectory(const QString &path);
    std::optional<FtpReply> remove(const QString &name);
    std::optional<FtpReply> rax();

    /**
     * @brief Selects the data mode used by subsequent transfers.
     *
     * The mode is sticky until changed again. No command is sent; PORT or
     * PASV goes out with each transfer.
     *
     * @return False with InvalidState unless Authenticated.
     */
    bool setDataMode(DataMode mode);
    /// @}

    /// @name Transfers
    /// @{
    std::optional<TransferResult> upload(QIODevice *source, const QString &remoteName);
    std::optional<TransferResult> download(const QString &remoteName, QIODevice *sink);
    std::optional<TransferResult> list(const QString &path = QString());

    /**
     * @brief Uploads a file from the local directory.
     * @param localName File inside the local directory.
     * @param remoteName Remote name, defaults to @p localName.
     */
    std::optional<TransferResult> uploadFile(const QString &localName,
                                             const QString &remoteName = QString());

    /**
     * @brief Downloads into the local directory.
     *
     * The data goes to a temporary file that replaces the local file only
     * after the server confirms the transfer; on failure an existing local
     * file is left as it was.
     * @param remoteName Remote file.
     * @param localName Local name, defaults to the file name of @p remoteName.
     */
    std::optional<TransferResult> downloadFile(const QString &remoteName,
                                               const QString &localName = QString());
    /// @}

    /// @name Cancellation
    /// @{

    /**
     * @brief Asks the running transfer or retry wait to stop.
     *
     * Safe to call from another thread. The flag is cleared when the next
     * operation starts.
     */
    void requestCancel() { cancelRequested_.store(true); }
    [[nodiscard]] bool isCancelRequested() const { return cancelRequested_.load(); }
    /// @}

    [[nodiscard]] FtpError lastError() const { return lastError_; }
    [[nodiscard]] QString errorString() const { return lastError_.toString(); }
    [[nodiscard]] FtpReply lastReply() const { return lastReply_; }
    [[nodiscard]] ControlChannel *controlChannel() const { return control_.get(); }

    [[nodiscard]] static QString stateToString(State state);

signals:
    void stateChanged(FtpSession::State state);
    void dataModeChanged(DataMode mode);
    void commandSent(const QString &command);
    void replyReceived(const FtpReply &reply);
    void dataConnectionOpened(const QString &endpoint);
    void dataConnectionClosed();
    void transferProgress(const TransferProgress &progress);
    void errorOccurred(const FtpError &error);

private:
    void setState(State state);
    void beginOperation();
    bool requireState(State required, const QString &command);
    bool requireWireSafe(const FtpCommand &command);
    std::optional<FtpReply> exchange(const FtpCommand &command);
    std::optional<TransferResult> finishTransfer(std::optional<TransferResult> result,
                                                 const FtpError &error);
    void checkControlChannel();
    void closeControlChannel();
    void reportError(const FtpError &error);
    void authenticationFailed(const QString &command, const FtpReply &reply);

    INetworkBackend *backend_;
    std::unique_ptr<ControlChannel> control_;
    RetryController retry_;
    DataConnectionNegotiator *negotiator_ = nullptr;
    TransferEngine *engine_ = nullptr;
    LocalFileStore fileStore_;

    State state_ = State::Disconnected;
    DataMode dataMode_ = DataMode::Passive;
    QString host_;
    quint16 port_ = 0;
    QString stagedUser_;
    int controlTimeoutMs_ = ControlChannel::DefaultTimeoutMs;

    std::atomic_bool cancelRequested_{false};
    FtpError lastError_;
    FtpReply lastReply_;
};

#endif // FTPSESSION_H
