#include "transferprogress.h"

#include <QStringList>

#include <algorithm>

double TransferProgress::percentage() const
{
    if (totalBytes == 0) {
        return 100.0;
    }
    if (totalBytes < 0) {
        return 0.0;
    }
    return std::min(100.0, (static_cast<double>(bytesTransferred) * 100.0)
                               / static_cast<double>(totalBytes));
}

double TransferProgress::bytesPerSecond() const
{
    if (elapsedMs <= 0) {
        return 0.0;
    }
    return (static_cast<double>(bytesTransferred) * 1000.0) / static_cast<double>(elapsedMs);
}

QString TransferProgress::formatBytes(qint64 bytes)
{
    static const QStringList units = {"B", "KB", "MB", "GB"};

    double size = static_cast<double>(bytes);
    int unit = 0;
    while (size >= 1024.0 && unit < units.size() - 1) {
        size /= 1024.0;
        ++unit;
    }

    if (unit == 0) {
        return QString("%1 B").arg(bytes);
    }
    return QString("%1 %2").arg(size, 0, 'f', 1).arg(units.at(unit));
}

QString TransferProgress::formatRate(double bytesPerSecond)
{
    return formatBytes(static_cast<qint64>(bytesPerSecond)) + QStringLiteral("/s");
}
