/*
 * ExpertSunSdrAdapter.cpp
 *
 * TCI command dialect for ExpertSDR (SunSDR radios)
 * Part of SWL View
 */

#include "ExpertSunSdrAdapter.h"
#include "TciProtocol.h"

FormattedCommand ExpertSunSdrAdapter::buildSetMode(const QString& mode) const
{
    // modulation:<trx>,<mode>;
    return FormattedCommand::make(
        QString("modulation:%1,%2;").arg(TciProtocol::TRX_INDEX).arg(mode),
        "ExpertSDR mode forcing side effects are unconfirmed");
}

FormattedCommand ExpertSunSdrAdapter::buildMute(bool muted) const
{
    // Receiver-scoped mute: rx_mute:<trx>,<bool>;
    return FormattedCommand::make(QString("rx_mute:%1,%2;")
                                  .arg(TciProtocol::TRX_INDEX)
                                  .arg(muted ? QStringLiteral("true") : QStringLiteral("false")));
}

FormattedCommand ExpertSunSdrAdapter::buildSpot(const QString& callsign, const QString& modeToken,
                                                int64_t frequencyHz,
                                                const QJsonObject& payload) const
{
    // SPOT:<call>,<MODE>,<hz>,<argb>,<text>;
    // ExpertSDR shows plain text, so only the payload comment is carried
    QString text = TciProtocol::stripFieldSeparators(payload.value("comment").toString());
    if (text.isEmpty()) {
        text = TciProtocol::SPOTTER_NAME;
    }

    return FormattedCommand::make(QString("SPOT:%1,%2,%3,%4,%5;")
                                  .arg(callsign, modeToken,
                                       QString::number(frequencyHz),
                                       QString::number(TciProtocol::EXPERT_SPOT_ARGB),
                                       text),
                                  "ExpertSDR spot grammar is unconfirmed (experimental)");
}
