/**
 * @file localfilestore.h
 * @brief Local directory that uploads are read from and downloads written to.
 */

#ifndef LOCALFILESTORE_H
#define LOCALFILESTORE_H

#include <QFile>
#include <QSaveFile>
#include <QString>

#include <memory>

#include "ftperror.h"

/**
 * @brief Resolves transfer names inside one local directory.
 *
 * Only the file name component of a remote name is used, so "dir/a.txt"
 * maps to "<root>/a.txt".
 */
class LocalFileStore
{
public:
    explicit LocalFileStore(const QString &rootPath = QString());

    void setRootPath(const QString &rootPath) { rootPath_ = rootPath; }
    [[nodiscard]] QString rootPath() const { return rootPath_; }

    /**
     * @brief Absolute path for @p name inside the root directory.
     */
    [[nodiscard]] QString resolve(const QString &name) const;

    [[nodiscard]] bool exists(const QString &name) const;

    /**
     * @brief Opens @p name for reading.
     * @param error Receives TransferFailed if the file cannot be opened.
     * @return The open file, or nullptr.
     */
    std::unique_ptr<QFile> openForReading(const QString &name, FtpError *error) const;

    /**
     * @brief Opens @p name for writing through a temporary file.
     *
     * An existing file is left untouched until the caller commits; without
     * a commit the temporary is discarded.
     *
     * @param error Receives TransferFailed if the file cannot be created.
     * @return The open file, or nullptr.
     */
    std::unique_ptr<QSaveFile> openForWriting(const QString &name, FtpError *error) const;

private:
    QString rootPath_;
};

#endif // LOCALFILESTORE_H
