/*
 * ExpertSunSdrAdapter.h
 *
 * TCI command dialect for ExpertSDR (SunSDR radios)
 * Part of SWL View
 */

#ifndef EXPERTSUNSDRADAPTER_H
#define EXPERTSUNSDRADAPTER_H

#include "ProfileAdapter.h"

/**
 * @brief ExpertSDR dialect
 *
 * EXPERIMENTAL: the vendor has not confirmed the SPOT grammar nor the side
 * effects of the mode command. Spot and mode commands are reported with a
 * protocol quirk. buildSpot() is the only place to change once the grammar
 * is confirmed.
 */
class ExpertSunSdrAdapter : public ProfileAdapter
{
public:
    Profile profile() const override { return Profile::ExpertSunSDR; }

protected:
    FormattedCommand buildSetMode(const QString& mode) const override;
    FormattedCommand buildMute(bool muted) const override;
    FormattedCommand buildSpot(const QString& callsign, const QString& modeToken,
                               int64_t frequencyHz, const QJsonObject& payload) const override;
};

#endif // EXPERTSUNSDRADAPTER_H
