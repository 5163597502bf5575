/*
 * ProfileAdapter.cpp
 *
 * Shared intent validation and the dialect factory
 * Part of SWL View
 */

#include "ProfileAdapter.h"
#include "ThetisAdapter.h"
#include "ExpertSunSdrAdapter.h"
#include "TciProtocol.h"

Intent Intent::tune(int64_t frequencyHz)
{
    Intent intent;
    intent.kind = Tune;
    intent.frequencyHz = frequencyHz;
    return intent;
}

Intent Intent::setMode(const QString& mode)
{
    Intent intent;
    intent.kind = SetMode;
    intent.mode = mode;
    return intent;
}

Intent Intent::mute(bool muted)
{
    Intent intent;
    intent.kind = Mute;
    intent.muted = muted;
    return intent;
}

Intent Intent::spot(const QString& callsign, const QString& mode, int64_t frequencyHz,
                    int ttlSeconds, const QJsonObject& payload)
{
    Intent intent;
    intent.kind = Spot;
    intent.callsign = callsign;
    intent.mode = mode;
    intent.frequencyHz = frequencyHz;
    intent.ttlSeconds = ttlSeconds;
    intent.payload = payload;
    return intent;
}

Intent Intent::clearSpot(const QString& callsign)
{
    Intent intent;
    intent.kind = ClearSpot;
    intent.callsign = callsign;
    return intent;
}

std::unique_ptr<ProfileAdapter> ProfileAdapter::create(Profile profile)
{
    switch (profile) {
        case Profile::ExpertSunSDR:
            return std::make_unique<ExpertSunSdrAdapter>();
        case Profile::Thetis:
            break;
    }
    return std::make_unique<ThetisAdapter>();
}

FormattedCommand ProfileAdapter::format(const Intent& intent) const
{
    switch (intent.kind) {
        case Intent::Tune:
            return formatTune(intent.frequencyHz);
        case Intent::SetMode:
            return formatSetMode(intent.mode);
        case Intent::Mute:
            return formatMute(intent.muted);
        case Intent::Spot:
            return formatSpot(intent.callsign, intent.mode, intent.frequencyHz,
                              intent.ttlSeconds, intent.payload);
        case Intent::ClearSpot:
            return formatClearSpot(intent.callsign);
    }
    return FormattedCommand::invalid("Unknown intent kind");
}

FormattedCommand ProfileAdapter::formatTune(int64_t frequencyHz) const
{
    if (frequencyHz < 0) {
        return FormattedCommand::invalid(QString("Negative frequency: %1 Hz").arg(frequencyHz));
    }

    // Same VFO command on every dialect: vfo:<trx>,<channel>,<hz>;
    return FormattedCommand::make(QString("vfo:%1,%2,%3;")
                                  .arg(TciProtocol::TRX_INDEX)
                                  .arg(TciProtocol::CHANNEL_INDEX)
                                  .arg(frequencyHz));
}

FormattedCommand ProfileAdapter::formatSetMode(const QString& mode) const
{
    QString token = TciProtocol::normalizeMode(mode);
    if (token.isEmpty()) {
        return FormattedCommand::invalid(QString("Unknown mode: '%1'").arg(mode));
    }
    return buildSetMode(token);
}

FormattedCommand ProfileAdapter::formatMute(bool muted) const
{
    return buildMute(muted);
}

FormattedCommand ProfileAdapter::formatSpot(const QString& callsign, const QString& mode,
                                            int64_t frequencyHz, int ttlSeconds,
                                            const QJsonObject& payload) const
{
    if (!TciProtocol::isValidCallsign(callsign)) {
        return FormattedCommand::invalid(QString("Invalid callsign: '%1'").arg(callsign));
    }
    if (frequencyHz < 0) {
        return FormattedCommand::invalid(QString("Negative frequency: %1 Hz").arg(frequencyHz));
    }
    if (ttlSeconds < 0) {
        return FormattedCommand::invalid(QString("Negative spot TTL: %1 s").arg(ttlSeconds));
    }

    QString token = TciProtocol::normalizeMode(mode);
    if (token.isEmpty()) {
        return FormattedCommand::invalid(QString("Unknown mode: '%1'").arg(mode));
    }

    return buildSpot(callsign.trimmed(), token.toUpper(), frequencyHz, payload);
}

FormattedCommand ProfileAdapter::formatClearSpot(const QString& callsign) const
{
    if (!TciProtocol::isValidCallsign(callsign)) {
        return FormattedCommand::invalid(QString("Invalid callsign: '%1'").arg(callsign));
    }
    return buildClearSpot(callsign.trimmed());
}

FormattedCommand ProfileAdapter::buildClearSpot(const QString& callsign) const
{
    return FormattedCommand::make(QString("spot_delete:%1;").arg(callsign));
}
