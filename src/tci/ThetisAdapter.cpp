/*
 * ThetisAdapter.cpp
 *
 * TCI command dialect for Thetis
 * Part of SWL View
 */

#include "ThetisAdapter.h"
#include "TciProtocol.h"
#include <QJsonDocument>

FormattedCommand ThetisAdapter::buildSetMode(const QString& mode) const
{
    // Some Thetis builds flip an audio routing flag on the fully qualified
    // mode command. Only the channel-scoped modulation command is sent.
    // This narrows the side effect but does not remove it.
    return FormattedCommand::make(
        QString("modulation:%1,%2,%3;")
            .arg(TciProtocol::TRX_INDEX)
            .arg(TciProtocol::CHANNEL_INDEX)
            .arg(mode),
        "Thetis may toggle audio routing when the mode is forced");
}

FormattedCommand ThetisAdapter::buildMute(bool muted) const
{
    return FormattedCommand::make(QString("mute:%1;")
                                  .arg(muted ? QStringLiteral("true") : QStringLiteral("false")));
}

FormattedCommand ThetisAdapter::buildSpot(const QString& callsign, const QString& modeToken,
                                          int64_t frequencyHz, const QJsonObject& payload) const
{
    // SPOT:<call>,<MODE>,<hz>,20381,[json]<payload>;
    QString json = QString::fromUtf8(QJsonDocument(payload).toJson(QJsonDocument::Compact));
    if (json.contains(TciProtocol::TERMINATOR)) {
        return FormattedCommand::invalid("Spot payload contains a ';' terminator");
    }

    return FormattedCommand::make(QString("SPOT:%1,%2,%3,%4,[json]%5;")
                                  .arg(callsign, modeToken,
                                       QString::number(frequencyHz),
                                       QString::number(TciProtocol::THETIS_SPOT_CHANNEL),
                                       json));
}
