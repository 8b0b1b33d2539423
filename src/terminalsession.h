/**
 * @file terminalsession.h
 * @brief Interactive prompt driving an FtpSession from typed commands.
 */

#ifndef TERMINALSESSION_H
#define TERMINALSESSION_H

#include <QObject>
#include <QTextStream>

#include "services/clientconfig.h"
#include "services/ftpcommand.h"
#include "services/ftpsession.h"

class ErrorHandler;

/**
 * @brief Reads commands line by line and prints replies and transfer summaries.
 *
 * The streams are injected so the loop can run against stdin/stdout or
 * against in-memory buffers.
 */
class TerminalSession : public QObject
{
    Q_OBJECT

public:
    TerminalSession(FtpSession *session, const ClientConfig &config, QTextStream *input,
                    QTextStream *output, QObject *parent = nullptr);

    /**
     * @brief Connects to the configured server, then runs the prompt until QUIT or EOF.
     * @return Process exit code.
     */
    int run();

    /**
     * @brief Executes one input line.
     * @return False when the session should end.
     */
    bool handleLine(const QString &line);

    [[nodiscard]] QString prompt() const;

    /**
     * @brief SIGINT handler: asks the session that is transferring to cancel.
     *
     * Installed only while a transfer or connection attempt runs; at the
     * prompt the previous handler is back in place, so Ctrl+C there ends
     * the program as usual.
     */
    static void interrupt(int signal);

public slots:
    void printStatus(const QString &message);

private slots:
    void onTransferProgress(const TransferProgress &progress);
    void onDataConnectionClosed();

private:
    void connectToServer();
    void printReply(const std::optional<FtpReply> &reply);
    void printTransfer(const std::optional<TransferResult> &result);
    bool executeCommand(const FtpCommand &command);

    FtpSession *session_;
    ClientConfig config_;
    QTextStream *in_;
    QTextStream *out_;
    ErrorHandler *errorHandler_;
    bool progressLineOpen_ = false;
};

#endif // TERMINALSESSION_H
