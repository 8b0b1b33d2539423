/**
 * @file transferprogress.h
 * @brief Progress snapshot for a single data transfer.
 */

#ifndef TRANSFERPROGRESS_H
#define TRANSFERPROGRESS_H

#include <QMetaType>
#include <QString>

/**
 * @brief Bytes moved so far in one upload, download or listing.
 *
 * Emitted after every chunk. @c totalBytes is -1 when the size is not
 * known in advance (listings, downloads without a size hint).
 */
struct TransferProgress {
    static constexpr qint64 UnknownTotal = -1;

    QString remoteName;                 ///< Remote file or listing path
    qint64 bytesTransferred = 0;
    qint64 totalBytes = UnknownTotal;
    qint64 elapsedMs = 0;

    [[nodiscard]] bool isTotalKnown() const { return totalBytes >= 0; }

    /**
     * @brief Completion in percent.
     * @return 100 for an empty transfer, 0 when the total is unknown,
     *         otherwise the ratio capped at 100.
     */
    [[nodiscard]] double percentage() const;

    [[nodiscard]] double bytesPerSecond() const;

    [[nodiscard]] bool isComplete() const
    {
        return isTotalKnown() && bytesTransferred >= totalBytes;
    }

    /**
     * @brief Formats a byte count as "512 B", "1.5 KB", "2.0 MB" or "1.2 GB".
     */
    [[nodiscard]] static QString formatBytes(qint64 bytes);

    /**
     * @brief Formats a rate as formatBytes() followed by "/s".
     */
    [[nodiscard]] static QString formatRate(double bytesPerSecond);
};

Q_DECLARE_METATYPE(TransferProgress)

#endif // TRANSFERPROGRESS_H
