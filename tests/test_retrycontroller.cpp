/**
 * @file test_retrycontroller.cpp
 * @brief Unit tests for RetryPolicy and RetryController.
 *
 * Tests verify:
 * - Backoff doubles per attempt and is capped
 * - Exhausted retries report the last transport error after N attempts
 * - Success on attempt k stops after k attempts with k-1 waits
 * - Non-transport errors are not retried
 * - Cancellation during a wait ends the loop with Cancelled
 */

#include <QtTest>
#include <QElapsedTimer>

#include <atomic>
#include <memory>
#include <optional>

#include "services/retrycontroller.h"

class TestRetryController : public QObject
{
    Q_OBJECT

private:
    RetryController *retry = nullptr;
    QList<int> sleeps;

    // Fails with @p kind until attempt @p succeedOn, then returns a value
    static std::function<std::unique_ptr<int>(FtpError *)>
    operation(int *calls, int succeedOn, FtpError::Kind kind)
    {
        return [calls, succeedOn, kind](FtpError *error) -> std::unique_ptr<int> {
            ++*calls;
            if (succeedOn > 0 && *calls >= succeedOn) {
                return std::make_unique<int>(*calls);
            }
            *error = FtpError(kind, QString("attempt %1 failed").arg(*calls));
            return nullptr;
        };
    }

private slots:
    void init()
    {
        sleeps.clear();
        retry = new RetryController(RetryPolicy{3, 1000, 30000});
        retry->setSleeper([this](int delayMs) {
            sleeps.append(delayMs);
            return true;
        });
    }

    void cleanup()
    {
        delete retry;
        retry = nullptr;
    }

    // === Policy ===

    void policy_DelayCurve()
    {
        RetryPolicy policy{5, 1000, 30000};
        QCOMPARE(policy.delayBeforeAttempt(1), 0);
        QCOMPARE(policy.delayBeforeAttempt(2), 1000);
        QCOMPARE(policy.delayBeforeAttempt(3), 2000);
        QCOMPARE(policy.delayBeforeAttempt(4), 4000);
        QCOMPARE(policy.delayBeforeAttempt(5), 8000);
        QCOMPARE(policy.totalDelayMs(), qint64(15000));
    }

    void policy_DelayCapped()
    {
        RetryPolicy policy{10, 1000, 5000};
        QCOMPARE(policy.delayBeforeAttempt(4), 4000);
        QCOMPARE(policy.delayBeforeAttempt(5), 5000);
        QCOMPARE(policy.delayBeforeAttempt(10), 5000);
    }

    void policy_ZeroAttemptsActAsOne()
    {
        RetryPolicy policy{0, 1000, 30000};
        QCOMPARE(policy.effectiveMaxAttempts(), 1);
        QCOMPARE(policy.totalDelayMs(), qint64(0));
    }

    // === Attempts ===

    void exhausted_ReportsLastErrorAfterAllAttempts()
    {
        int calls = 0;
        FtpError error;
        auto result = retry->attempt(operation(&calls, 0, FtpError::Kind::ConnectionRefused),
                                     &error);

        QVERIFY(!result);
        QCOMPARE(calls, 3);
        QCOMPARE(retry->lastAttemptCount(), 3);
        QCOMPARE(error.kind, FtpError::Kind::ConnectionRefused);
        QCOMPARE(error.message, QString("attempt 3 failed"));
        QCOMPARE(sleeps, (QList<int>{1000, 2000}));
        QCOMPARE(retry->lastTotalDelayMs(), qint64(3000));
    }

    void success_OnSecondAttempt()
    {
        int calls = 0;
        FtpError error;
        auto result = retry->attempt(operation(&calls, 2, FtpError::Kind::Timeout), &error);

        QVERIFY(result);
        QCOMPARE(*result, 2);
        QCOMPARE(retry->lastAttemptCount(), 2);
        QCOMPARE(sleeps, (QList<int>{1000}));
        QVERIFY(!error.isError());
    }

    void success_FirstAttemptNoWait()
    {
        int calls = 0;
        FtpError error;
        auto result = retry->attempt(operation(&calls, 1, FtpError::Kind::Timeout), &error);

        QVERIFY(result);
        QCOMPARE(retry->lastAttemptCount(), 1);
        QVERIFY(sleeps.isEmpty());
        QCOMPARE(retry->lastTotalDelayMs(), qint64(0));
    }

    void protocolError_NotRetried()
    {
        int calls = 0;
        FtpError error;
        auto result = retry->attempt(operation(&calls, 0, FtpError::Kind::UnexpectedReply),
                                     &error);

        QVERIFY(!result);
        QCOMPARE(calls, 1);
        QCOMPARE(error.kind, FtpError::Kind::UnexpectedReply);
        QVERIFY(sleeps.isEmpty());
    }

    void singleAttemptPolicy()
    {
        retry->setPolicy(RetryPolicy{1, 1000, 30000});

        int calls = 0;
        FtpError error;
        auto result = retry->attempt(operation(&calls, 0, FtpError::Kind::HostNotFound), &error);

        QVERIFY(!result);
        QCOMPARE(calls, 1);
        QCOMPARE(error.kind, FtpError::Kind::HostNotFound);
        QVERIFY(sleeps.isEmpty());
    }

    void optionalResultsSupported()
    {
        int calls = 0;
        FtpError error;
        auto result = retry->attempt(
            [&calls](FtpError *e) -> std::optional<QString> {
                if (++calls < 3) {
                    *e = FtpError(FtpError::Kind::ConnectionLost, "dropped");
                    return std::nullopt;
                }
                return QString("ok");
            },
            &error);

        QVERIFY(result.has_value());
        QCOMPARE(*result, QString("ok"));
        QCOMPARE(retry->lastAttemptCount(), 3);
    }

    // === Cancellation ===

    void cancelDuringWait()
    {
        std::atomic_bool cancel{false};
        retry->setCancelFlag(&cancel);
        retry->setSleeper([&cancel](int) {
            cancel.store(true);
            return false;
        });

        int calls = 0;
        FtpError error;
        auto result = retry->attempt(operation(&calls, 0, FtpError::Kind::ConnectionRefused),
                                     &error);

        QVERIFY(!result);
        QCOMPARE(calls, 1);
        QCOMPARE(error.kind, FtpError::Kind::Cancelled);
    }

    void defaultSleeperHonoursCancelFlag()
    {
        std::atomic_bool cancel{true};
        RetryController plain(RetryPolicy{3, 10000, 30000});
        plain.setCancelFlag(&cancel);

        QElapsedTimer timer;
        timer.start();

        int calls = 0;
        FtpError error;
        auto result = plain.attempt(operation(&calls, 0, FtpError::Kind::Timeout), &error);

        QVERIFY(!result);
        QCOMPARE(error.kind, FtpError::Kind::Cancelled);
        QVERIFY(timer.elapsed() < 5000);
    }
};

QTEST_MAIN(TestRetryController)
#include "test_retrycontroller.moc"
