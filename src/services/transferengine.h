/**
 * @file transferengine.h
 * @brief Runs one upload, download or listing over a negotiated data connection.
 */

#ifndef TRANSFERENGINE_H
#define TRANSFERENGINE_H

#include <QElapsedTimer>
#include <QIODevice>
#include <QObject>
#include <QStringList>

#include <atomic>
#include <functional>
#include <optional>

#include "dataconnectionnegotiator.h"
#include "ftpcommand.h"
#include "ftperror.h"
#include "ftpreply.h"
#include "transferprogress.h"

class ControlChannel;

/**
 * @brief Outcome of a completed transfer.
 */
struct TransferResult {
    enum class Direction {
        Upload,
        Download,
        Listing
    };

    Direction direction = Direction::Download;
    QString remoteName;
    qint64 bytesTransferred = 0;
    qint64 elapsedMs = 0;
    FtpReply finalReply;        ///< The 2xx completion reply
    QStringList listing;        ///< Non-empty trimmed lines, listings only
};

/**
 * @brief Drives the data-transfer sequence for STOR, RETR and LIST.
 *
 * Each call performs, in order: the PORT/PASV exchange, the transfer
 * command (which must be answered with 1xx), the data connection, chunked
 * streaming with a progress signal per chunk, closing the data connection,
 * and reading the completion reply. The data connection and any listener
 * are closed on every path before the call returns.
 *
 * The engine does not check the session state; FtpSession gates calls.
 */
class TransferEngine : public QObject
{
    Q_OBJECT

public:
    static constexpr int ChunkSize = 8192;     ///< Bytes per read/write on the data stream

    /**
     * @param negotiator Data connection negotiator. Not owned.
     * @param parent Optional parent QObject.
     */
    explicit TransferEngine(DataConnectionNegotiator *negotiator, QObject *parent = nullptr);

    /**
     * @brief Flag polled between chunks. Not owned.
     */
    void setCancelFlag(const std::atomic_bool *flag) { cancelFlag_ = flag; }

    /**
     * @brief Sends @p source to the server as @p remoteName (STOR).
     *
     * @p source is opened for reading if it is not open yet; failure to do so
     * is reported as TransferFailed before any command is sent.
     */
    std::optional<TransferResult> upload(ControlChannel *control, DataMode mode,
                                         QIODevice *source, const QString &remoteName,
                                         FtpError *error);

    /**
     * @brief Retrieves @p remoteName into @p sink (RETR).
     *
     * @p sink is opened for writing if it is not open yet. The expected size
     * is taken from a "(N bytes)" hint in the 1xx reply when present.
     */
    std::optional<TransferResult> download(ControlChannel *control, DataMode mode,
                                           const QString &remoteName, QIODevice *sink,
                                           FtpError *error);

    /**
     * @brief Lists @p path, or the working directory if empty (LIST).
     */
    std::optional<TransferResult> list(ControlChannel *control, DataMode mode,
                                       const QString &path, FtpError *error);

    /**
     * @brief Extracts the size from a "(N bytes)" hint, -1 if absent.
     */
    [[nodiscard]] static qint64 sizeHint(const QString &replyText);

signals:
    void progressChanged(const TransferProgress &progress);
    void dataConnectionOpened(const QString &endpoint);
    void dataConnectionClosed();

private:
    /// Moves the payload; returns false with @p error set on failure
    using StreamFunction =
        std::function<bool(IByteStream *stream, TransferProgress &progress, FtpError *error)>;

    std::optional<TransferResult> execute(TransferResult::Direction direction,
                                          ControlChannel *control, DataMode mode,
                                          const FtpCommand &command, qint64 expectedTotal,
                                          const StreamFunction &streamer, FtpError *error);

    bool sendChunks(IByteStream *stream, QIODevice *source, TransferProgress &progress,
                    FtpError *error);
    bool receiveChunks(IByteStream *stream, QIODevice *sink, TransferProgress &progress,
                       FtpError *error);

    [[nodiscard]] bool isCancelled() const { return cancelFlag_ && cancelFlag_->load(); }

    DataConnectionNegotiator *negotiator_;
    const std::atomic_bool *cancelFlag_ = nullptr;
    QElapsedTimer timer_;
};

#endif // TRANSFERENGINE_H
