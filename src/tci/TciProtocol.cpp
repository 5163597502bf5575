/*
 * TciProtocol.cpp
 *
 * TCI command helpers
 * Part of SWL View
 */

#include "TciProtocol.h"
#include <algorithm>

namespace TciProtocol {

const QStringList& knownModes()
{
    static const QStringList modes = {
        "am", "sam", "dsb", "lsb", "usb", "ssb", "cw",
        "nfm", "wfm", "fm", "digl", "digu", "drm"
    };
    return modes;
}

QString normalizeMode(const QString& mode)
{
    QString token = mode.trimmed().toLower();
    if (token.isEmpty() || !knownModes().contains(token)) {
        return QString();
    }
    return token;
}

bool isValidCallsign(const QString& callsign)
{
    if (callsign.trimmed().isEmpty()) {
        return false;
    }
    return !callsign.contains(',') && !callsign.contains(TERMINATOR);
}

QString stripFieldSeparators(const QString& text)
{
    QString cleaned = text;
    cleaned.replace(',', ' ');
    cleaned.replace(TERMINATOR, ' ');
    return cleaned.trimmed();
}

QString endpointUrl(const QString& host, quint16 port)
{
    return QString("ws://%1:%2").arg(host).arg(port);
}

QJsonObject buildSwlSpotPayload(const QString& mode, int ttlSeconds, bool timed,
                                const QDateTime& utcNow)
{
    QString modeLabel = mode.trimmed().toLower();
    if (modeLabel.isEmpty()) {
        modeLabel = DEFAULT_MODE;
    }

    QJsonObject payload;
    payload["spotter"] = SPOTTER_NAME;
    payload["comment"] = QString("SWL schedule %1").arg(modeLabel);
    payload["heading"] = 0;
    payload["continent"] = QString();
    payload["country"] = QString();
    payload["utctime"] = utcNow.toUTC().toString("yyyy-MM-dd'T'HH:mm:ss'Z'");
    payload["TextColor"] = QStringLiteral("#FF00FF00");
    payload["IsSWL"] = timed;
    payload["SWLSecondsToLive"] = timed ? std::max(1, ttlSeconds) : 0;
    return payload;
}

} // namespace TciProtocol
