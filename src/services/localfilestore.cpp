#include "localfilestore.h"

#include <QDir>
#include <QFileInfo>

LocalFileStore::LocalFileStore(const QString &rootPath)
    : rootPath_(rootPath)
{
}

QString LocalFileStore::resolve(const QString &name) const
{
    const QString fileName = QFileInfo(name).fileName();
    QDir root(rootPath_.isEmpty() ? QDir::currentPath() : rootPath_);
    return QDir::cleanPath(root.absoluteFilePath(fileName));
}

bool LocalFileStore::exists(const QString &name) const
{
    return QFileInfo::exists(resolve(name));
}

std::unique_ptr<QFile> LocalFileStore::openForReading(const QString &name, FtpError *error) const
{
    auto file = std::make_unique<QFile>(resolve(name));
    if (!file->open(QIODevice::ReadOnly)) {
        if (error) {
            *error = FtpError(FtpError::Kind::TransferFailed,
                              QString("Cannot open local file '%1': %2")
                                  .arg(file->fileName(), file->errorString()));
        }
        return nullptr;
    }
    return file;
}

std::unique_ptr<QSaveFile> LocalFileStore::openForWriting(const QString &name,
                                                          FtpError *error) const
{
    auto file = std::make_unique<QSaveFile>(resolve(name));
    if (!file->open(QIODevice::WriteOnly)) {
        if (error) {
            *error = FtpError(FtpError::Kind::TransferFailed,
                              QString("Cannot create local file '%1': %2")
                                  .arg(file->fileName(), file->errorString()));
        }
        return nullptr;
    }
    return file;
}
