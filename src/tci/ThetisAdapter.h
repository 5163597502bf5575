/*
 * ThetisAdapter.h
 *
 * TCI command dialect for Thetis
 * Part of SWL View
 */

#ifndef THETISADAPTER_H
#define THETISADAPTER_H

#include "ProfileAdapter.h"

class ThetisAdapter : public ProfileAdapter
{
public:
    Profile profile() const override { return Profile::Thetis; }

protected:
    FormattedCommand buildSetMode(const QString& mode) const override;
    FormattedCommand buildMute(bool muted) const override;
    FormattedCommand buildSpot(const QString& callsign, const QString& modeToken,
                               int64_t frequencyHz, const QJsonObject& payload) const override;
};

#endif // THETISADAPTER_H
