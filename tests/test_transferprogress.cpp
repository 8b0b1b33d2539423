/**
 * @file test_transferprogress.cpp
 * @brief Unit tests for TransferProgress.
 */

#include <QtTest>

#include "services/transferprogress.h"

class TestTransferProgress : public QObject
{
    Q_OBJECT

private slots:
    void percentage_KnownTotal()
    {
        TransferProgress progress;
        progress.totalBytes = 200;
        progress.bytesTransferred = 50;
        QCOMPARE(progress.percentage(), 25.0);
        QVERIFY(!progress.isComplete());

        progress.bytesTransferred = 200;
        QCOMPARE(progress.percentage(), 100.0);
        QVERIFY(progress.isComplete());
    }

    void percentage_UnknownTotal()
    {
        TransferProgress progress;
        progress.bytesTransferred = 1000;
        QVERIFY(!progress.isTotalKnown());
        QCOMPARE(progress.percentage(), 0.0);
        QVERIFY(!progress.isComplete());
    }

    void percentage_EmptyFileIsComplete()
    {
        TransferProgress progress;
        progress.totalBytes = 0;
        QCOMPARE(progress.percentage(), 100.0);
        QVERIFY(progress.isComplete());
    }

    void percentage_ClampedWhenHintTooSmall()
    {
        TransferProgress progress;
        progress.totalBytes = 10;
        progress.bytesTransferred = 25;
        QCOMPARE(progress.percentage(), 100.0);
    }

    void bytesPerSecond()
    {
        TransferProgress progress;
        progress.bytesTransferred = 4096;
        progress.elapsedMs = 2000;
        QCOMPARE(progress.bytesPerSecond(), 2048.0);

        progress.elapsedMs = 0;
        QCOMPARE(progress.bytesPerSecond(), 0.0);
    }

    void formatBytes()
    {
        QCOMPARE(TransferProgress::formatBytes(0), QString("0 B"));
        QCOMPARE(TransferProgress::formatBytes(1023), QString("1023 B"));
        QCOMPARE(TransferProgress::formatBytes(1536), QString("1.5 KB"));
        QCOMPARE(TransferProgress::formatBytes(5 * 1024 * 1024), QString("5.0 MB"));
        QCOMPARE(TransferProgress::formatBytes(qint64(3) * 1024 * 1024 * 1024), QString("3.0 GB"));
    }

    void formatRate()
    {
        QCOMPARE(TransferProgress::formatRate(2048.0), QString("2.0 KB/s"));
    }
};

QTEST_MAIN(TestTransferProgress)
#include "test_transferprogress.moc"
