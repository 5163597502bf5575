/*
 * SpotLifecycleManager.h
 *
 * Tracks active spot announcements and clears them when they expire
 * Part of SWL View
 */

#ifndef SPOTLIFECYCLEMANAGER_H
#define SPOTLIFECYCLEMANAGER_H

#include "TciTypes.h"
#include "SessionConnection.h"
#include <QObject>
#include <QHash>
#include <QList>
#include <QTimer>
#include <QDateTime>
#include <functional>

class CommandDispatcher;

/**
 * @brief Owns the active SpotRecords
 *
 * Timed spots are cleared by a periodic sweep once their deadline has
 * passed. Persistent spots are only cleared by clearSpot().
 * While the session is not connected no network intents are issued, but
 * the records are kept. Nothing is re-sent after a reconnect.
 */
class SpotLifecycleManager : public QObject
{
    Q_OBJECT

public:
    using Clock = std::function<QDateTime()>;

    SpotLifecycleManager(CommandDispatcher* dispatcher, SessionConnection* connection,
                         QObject* parent = nullptr);
    ~SpotLifecycleManager();

    /**
     * Announce a station and remember it
     * @param station Station to spot (identity = callsign + frequency)
     * @param policy Timed or Persistent
     * @param ttlSeconds Requested lifetime for timed spots
     * @param payload Structured payload embedded in the spot command
     * @return Dispatcher outcome; the record is stored only if the spot was sent
     */
    CommandOutcome sendSpot(const StationRef& station, SpotPolicy policy, int ttlSeconds,
                            const QJsonObject& payload = QJsonObject());

    /**
     * Remove a spot and tell the radio. Harmless if the station is not spotted.
     * When not connected the record is only removed locally.
     * The radio deletes spots by callsign, so records of the same callsign on
     * other frequencies are removed as well.
     */
    CommandOutcome clearSpot(const StationRef& station);

    /**
     * deadline = min(now + ttl, scheduledEnd), never earlier than now
     */
    static QDateTime computeDeadline(const QDateTime& now, int ttlSeconds,
                                     const QDateTime& scheduledEnd);

    // Periodic sweep control
    void startSweep(int intervalMs = 1000);
    void stopSweep();
    bool isSweeping() const { return m_sweepTimer->isActive(); }

    // Replace the time source (tests)
    void setClock(Clock clock);
    QDateTime now() const;

    QList<SpotRecord> activeSpots() const { return m_records.values(); }
    bool hasSpot(const StationRef& station) const { return m_records.contains(station.key()); }
    SpotRecord spot(const StationRef& station) const { return m_records.value(station.key()); }
    int spotCount() const { return m_records.size(); }
    int timedSpotCount() const;

public slots:
    /**
     * Clear every timed spot whose deadline has passed
     * @return Number of spots cleared
     */
    int sweep();

signals:
    void spotAdded(const SpotRecord& record);
    void spotExpired(const SpotRecord& record);
    void spotCleared(const SpotRecord& record);
    void activeSpotsChanged(int count);

private slots:
    void onConnectionStateChanged(SessionConnection::ConnectionState state);

private:
    // Remove records sharing a callsign, returns how many were removed
    int dropSiblings(const QString& callsign);

    CommandDispatcher* m_dispatcher;
    SessionConnection* m_connection;
    QHash<QString, SpotRecord> m_records;
    QTimer* m_sweepTimer;
    Clock m_clock;
};

#endif // SPOTLIFECYCLEMANAGER_H
