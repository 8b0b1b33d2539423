/**
 * @file retrycontroller.h
 * @brief Bounded exponential backoff around connection establishment.
 */

#ifndef RETRYCONTROLLER_H
#define RETRYCONTROLLER_H

#include <QDebug>

#include <atomic>
#include <functional>

#include "ftperror.h"

/**
 * @brief Retry limits and backoff curve.
 */
struct RetryPolicy {
    static constexpr int DefaultMaxAttempts = 3;
    static constexpr int DefaultBaseDelayMs = 1000;
    static constexpr int DefaultMaxDelayMs = 30000;   ///< Ceiling for a single wait

    int maxAttempts = DefaultMaxAttempts;   ///< Total attempts, values below 1 act as 1
    int baseDelayMs = DefaultBaseDelayMs;   ///< Wait before the second attempt
    int maxDelayMs = DefaultMaxDelayMs;

    [[nodiscard]] int effectiveMaxAttempts() const { return maxAttempts < 1 ? 1 : maxAttempts; }

    /**
     * @brief Wait preceding attempt @p attempt (1-based).
     *
     * Zero for the first attempt, then baseDelayMs * 2^(attempt-2) capped
     * at maxDelayMs.
     */
    [[nodiscard]] int delayBeforeAttempt(int attempt) const;

    /**
     * @brief Sum of all waits when every attempt fails.
     */
    [[nodiscard]] qint64 totalDelayMs() const;
};

/**
 * @brief Runs an operation until it succeeds, fails permanently or runs out of attempts.
 *
 * Only transport failures (FtpError::isTransportError()) are retried;
 * protocol failures are returned at once. The sleep between attempts can be
 * interrupted through the cancellation flag, which ends the loop with
 * FtpError::Kind::Cancelled.
 *
 * @par Example usage:
 * @code
 * RetryController retry(RetryPolicy{3, 1000});
 * FtpError error;
 * ByteStreamPtr stream = retry.attempt([&](FtpError *e) {
 *     return backend->connectToHost(host, port, timeoutMs, e);
 * }, &error);
 * @endcode
 */
class RetryController
{
public:
    /// Performs a wait; returns false if it was cut short by cancellation
    using Sleeper = std::function<bool(int delayMs)>;

    /// Granularity at which the default sleeper checks for cancellation
    static constexpr int SleepSliceMs = 50;

    explicit RetryController(const RetryPolicy &policy = RetryPolicy());

    void setPolicy(const RetryPolicy &policy) { policy_ = policy; }
    [[nodiscard]] RetryPolicy policy() const { return policy_; }

    /**
     * @brief Replaces the wait used between attempts (tests inject a recorder).
     */
    void setSleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

    /**
     * @brief Flag polled while sleeping. Not owned.
     */
    void setCancelFlag(const std::atomic_bool *flag) { cancelFlag_ = flag; }

    /// Attempts made by the most recent attempt() call
    [[nodiscard]] int lastAttemptCount() const { return lastAttemptCount_; }

    /// Milliseconds spent waiting during the most recent attempt() call
    [[nodiscard]] qint64 lastTotalDelayMs() const { return lastTotalDelayMs_; }

    /**
     * @brief Runs @p op with retries.
     * @param op Callable taking FtpError* and returning a value that tests
     *           false on failure (pointer or std::optional).
     * @param error Receives the last error on failure.
     * @return The first successful result, or an empty value.
     */
    template <typename Operation>
    auto attempt(Operation op, FtpError *error) -> decltype(op(error))
    {
        using Result = decltype(op(error));

        const int maxAttempts = policy_.effectiveMaxAttempts();
        lastAttemptCount_ = 0;
        lastTotalDelayMs_ = 0;
        FtpError lastError;

        for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
            const int delayMs = policy_.delayBeforeAttempt(attempt);
            if (delayMs > 0) {
                qDebug() << "FTP: Retrying in" << delayMs << "ms (attempt" << attempt << "of"
                         << maxAttempts << ")";
                lastTotalDelayMs_ += delayMs;
                if (!sleep(delayMs)) {
                    FtpError cancelled(FtpError::Kind::Cancelled,
                                       QStringLiteral("Cancelled while waiting to retry"));
                    cancelled.command = lastError.command;
                    if (error) {
                        *error = cancelled;
                    }
                    return Result();
                }
            }

            lastAttemptCount_ = attempt;
            lastError = FtpError();
            Result result = op(&lastError);
            if (result) {
                return result;
            }

            if (!lastError.isTransportError()) {
                break;
            }
            qDebug() << "FTP: Attempt" << attempt << "failed:" << lastError.toString();
        }

        if (error) {
            *error = lastError;
        }
        return Result();
    }

private:
    bool sleep(int delayMs);
    [[nodiscard]] bool isCancelled() const;

    RetryPolicy policy_;
    Sleeper sleeper_;
    const std::atomic_bool *cancelFlag_ = nullptr;
    int lastAttemptCount_ = 0;
    qint64 lastTotalDelayMs_ = 0;
};

#endif // RETRYCONTROLLER_H
