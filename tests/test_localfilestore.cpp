/**
 * @file test_localfilestore.cpp
 * @brief Unit tests for LocalFileStore.
 */

#include <QtTest>
#include <QDir>
#include <QTemporaryDir>

#include "services/localfilestore.h"

class TestLocalFileStore : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir *dir = nullptr;

private slots:
    void init()
    {
        dir = new QTemporaryDir();
        QVERIFY(dir->isValid());
    }

    void cleanup()
    {
        delete dir;
        dir = nullptr;
    }

    void resolve_UsesFileNameOnly()
    {
        LocalFileStore store(dir->path());
        QCOMPARE(store.resolve("a.txt"), QDir(dir->path()).absoluteFilePath("a.txt"));
        QCOMPARE(store.resolve("remote/sub/a.txt"), QDir(dir->path()).absoluteFilePath("a.txt"));
        QCOMPARE(store.resolve("../../etc/passwd"), QDir(dir->path()).absoluteFilePath("passwd"));
    }

    void openForWriting_ReplacesOnCommit()
    {
        LocalFileStore store(dir->path());
        FtpError error;

        {
            auto file = store.openForWriting("a.txt", &error);
            QVERIFY(file);
            file->write("first version");
            QVERIFY(file->commit());
        }
        {
            auto file = store.openForWriting("a.txt", &error);
            QVERIFY(file);
            file->write("second");
            QVERIFY(file->commit());
        }

        auto file = store.openForReading("a.txt", &error);
        QVERIFY(file);
        QCOMPARE(file->readAll(), QByteArray("second"));
    }

    void openForWriting_ExistingFileUntouchedWithoutCommit()
    {
        LocalFileStore store(dir->path());
        FtpError error;
        {
            auto file = store.openForWriting("keep.txt", &error);
            QVERIFY(file);
            file->write("original");
            QVERIFY(file->commit());
        }

        {
            auto file = store.openForWriting("keep.txt", &error);
            QVERIFY(file);
            file->write("partial");
            file->cancelWriting();
        }

        auto file = store.openForReading("keep.txt", &error);
        QVERIFY(file);
        QCOMPARE(file->readAll(), QByteArray("original"));
        QCOMPARE(QDir(dir->path()).entryList(QDir::Files), QStringList{"keep.txt"});
    }

    void openForWriting_NothingCreatedWithoutCommit()
    {
        LocalFileStore store(dir->path());
        FtpError error;
        {
            auto file = store.openForWriting("partial.bin", &error);
            QVERIFY(file);
            file->write("abc");
        }
        QVERIFY(!store.exists("partial.bin"));
        QCOMPARE(QDir(dir->path()).entryList(QDir::Files), QStringList());
    }

    void openForReading_MissingFile()
    {
        LocalFileStore store(dir->path());
        FtpError error;

        auto file = store.openForReading("absent.bin", &error);
        QVERIFY(file == nullptr);
        QCOMPARE(error.kind, FtpError::Kind::TransferFailed);
        QVERIFY(error.message.contains("absent.bin"));
        QVERIFY(!store.exists("absent.bin"));
    }

    void openForWriting_MissingDirectory()
    {
        LocalFileStore store(dir->filePath("does/not/exist"));
        FtpError error;

        auto file = store.openForWriting("a.txt", &error);
        QVERIFY(file == nullptr);
        QCOMPARE(error.kind, FtpError::Kind::TransferFailed);
    }
};

QTEST_MAIN(TestLocalFileStore)
#include "test_localfilestore.moc"
