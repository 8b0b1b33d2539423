#include "ftpaddress.h"

#include <QRegularExpression>
#include <QStringList>

namespace {

bool fail(QString *errorMessage, const QString &reason)
{
    if (errorMessage) {
        *errorMessage = reason;
    }
    return false;
}

} // namespace

QString FtpAddressCodec::encode(const QHostAddress &address, quint16 port)
{
    bool isIpv4 = false;
    const quint32 ip = address.toIPv4Address(&isIpv4);
    if (!isIpv4) {
        return QString();
    }

    return QString("%1,%2,%3,%4,%5,%6")
        .arg((ip >> 24) & 0xFF)
        .arg((ip >> 16) & 0xFF)
        .arg((ip >> 8) & 0xFF)
        .arg(ip & 0xFF)
        .arg(port / PortMultiplier)
        .arg(port % PortMultiplier);
}

bool FtpAddressCodec::decode(const QString &text, QHostAddress &address, quint16 &port,
                             QString *errorMessage)
{
    QString group;

    static const QRegularExpression parenRx("\\(([^()]*)\\)");
    auto parenMatch = parenRx.match(text);
    if (parenMatch.hasMatch()) {
        group = parenMatch.captured(1);
    } else {
        // Bare form: "227 Entering Passive Mode 127,0,0,1,8,79"
        static const QRegularExpression bareRx("\\d+(?:\\s*,\\s*\\d+)+");
        auto it = bareRx.globalMatch(text);
        while (it.hasNext()) {
            group = it.next().captured(0);
        }
    }

    if (group.isEmpty()) {
        return fail(errorMessage, QString("No host-port group in '%1'").arg(text));
    }

    const QStringList fields = group.split(QLatin1Char(','));
    if (fields.size() != SextetSize) {
        return fail(errorMessage, QString("Expected %1 values in host-port group, got %2")
                                      .arg(SextetSize)
                                      .arg(fields.size()));
    }

    int values[SextetSize];
    for (int i = 0; i < SextetSize; ++i) {
        bool ok = false;
        const QString field = fields.at(i).trimmed();
        values[i] = field.toInt(&ok);
        if (!ok || field.startsWith(QLatin1Char('-')) || field.startsWith(QLatin1Char('+'))
            || values[i] < 0 || values[i] > MaxOctet) {
            return fail(errorMessage, QString("Invalid host-port value '%1'").arg(fields.at(i)));
        }
    }

    const quint32 ip = (static_cast<quint32>(values[0]) << 24)
                       | (static_cast<quint32>(values[1]) << 16)
                       | (static_cast<quint32>(values[2]) << 8)
                       | static_cast<quint32>(values[3]);
    address = QHostAddress(ip);
    port = static_cast<quint16>((values[4] * PortMultiplier) + values[5]);
    return true;
}
