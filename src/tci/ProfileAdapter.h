/*
 * ProfileAdapter.h
 *
 * Abstract interface for TCI command dialects
 * Supports Thetis and ExpertSDR (SunSDR) command variants
 * Part of SWL View
 */

#ifndef PROFILEADAPTER_H
#define PROFILEADAPTER_H

#include "TciTypes.h"
#include <QJsonObject>
#include <QString>
#include <cstdint>
#include <memory>

/**
 * @brief Radio-control intent, independent of any dialect
 */
struct Intent {
    enum Kind {
        Tune,
        SetMode,
        Mute,
        Spot,
        ClearSpot
    };

    Kind kind = Tune;
    int64_t frequencyHz = 0;
    QString mode;
    bool muted = false;
    QString callsign;
    int ttlSeconds = 0;
    QJsonObject payload;

    static Intent tune(int64_t frequencyHz);
    static Intent setMode(const QString& mode);
    static Intent mute(bool muted);
    static Intent spot(const QString& callsign, const QString& mode, int64_t frequencyHz,
                       int ttlSeconds, const QJsonObject& payload);
    static Intent clearSpot(const QString& callsign);
};

/**
 * @brief Pure translation of intents into wire commands for one dialect
 *
 * Input validation is shared; each dialect only supplies the command
 * tokens. Output depends on nothing but the profile and the intent.
 */
class ProfileAdapter
{
public:
    virtual ~ProfileAdapter() = default;

    virtual Profile profile() const = 0;

    FormattedCommand format(const Intent& intent) const;

    FormattedCommand formatTune(int64_t frequencyHz) const;
    FormattedCommand formatSetMode(const QString& mode) const;
    FormattedCommand formatMute(bool muted) const;
    FormattedCommand formatSpot(const QString& callsign, const QString& mode,
                                int64_t frequencyHz, int ttlSeconds,
                                const QJsonObject& payload) const;
    FormattedCommand formatClearSpot(const QString& callsign) const;

    // Static factory, one adapter per profile
    static std::unique_ptr<ProfileAdapter> create(Profile profile);

protected:
    // Dialect hooks, called with already validated arguments
    virtual FormattedCommand buildSetMode(const QString& mode) const = 0;
    virtual FormattedCommand buildMute(bool muted) const = 0;
    virtual FormattedCommand buildSpot(const QString& callsign, const QString& modeToken,
                                       int64_t frequencyHz,
                                       const QJsonObject& payload) const = 0;
    virtual FormattedCommand buildClearSpot(const QString& callsign) const;
};

#endif // PROFILEADAPTER_H
