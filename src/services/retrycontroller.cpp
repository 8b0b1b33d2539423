#include "retrycontroller.h"

#include <QThread>

#include <algorithm>

int RetryPolicy::delayBeforeAttempt(int attempt) const
{
    if (attempt < 2 || baseDelayMs <= 0) {
        return 0;
    }

    qint64 delay = baseDelayMs;
    for (int i = 2; i < attempt && delay < maxDelayMs; ++i) {
        delay *= 2;
    }
    return static_cast<int>(std::min<qint64>(delay, maxDelayMs));
}

qint64 RetryPolicy::totalDelayMs() const
{
    qint64 total = 0;
    for (int attempt = 2; attempt <= effectiveMaxAttempts(); ++attempt) {
        total += delayBeforeAttempt(attempt);
    }
    return total;
}

RetryController::RetryController(const RetryPolicy &policy)
    : policy_(policy)
{
}

bool RetryController::sleep(int delayMs)
{
    if (sleeper_) {
        return sleeper_(delayMs) && !isCancelled();
    }

    int remaining = delayMs;
    while (remaining > 0) {
        if (isCancelled()) {
            return false;
        }
        const int slice = std::min(remaining, SleepSliceMs);
        QThread::msleep(static_cast<unsigned long>(slice));
        remaining -= slice;
    }
    return !isCancelled();
}

bool RetryController::isCancelled() const
{
    return cancelFlag_ && cancelFlag_->load();
}
