/*
 * RadioControlSession.h
 *
 * Facade over the TCI session components for the presentation layer
 * Part of SWL View
 */

#ifndef RADIOCONTROLSESSION_H
#define RADIOCONTROLSESSION_H

#include "TciTypes.h"
#include "SessionConnection.h"
#include <QObject>
#include <QJsonObject>
#include <QString>

class CommandDispatcher;
class SpotLifecycleManager;
class Settings;

/**
 * @brief Snapshot of the session, published to observers
 */
struct SessionStatus {
    bool enabled = true;
    bool connected = false;
    SessionConnection::ConnectionState state = SessionConnection::Disconnected;
    QString host;
    int port = 0;
    Profile profile = Profile::Thetis;
    QString lastError;
    QString lastCommand;
    bool muted = false;
    int activeSpots = 0;

    QJsonObject toJson() const;
};

/**
 * @brief Wires connection, dispatcher and spot lifecycle into one session
 *
 * Owns the session AudioState. Only one endpoint is used at a time;
 * configure() while connected takes effect on the next connectToRadio().
 */
class RadioControlSession : public QObject
{
    Q_OBJECT

public:
    explicit RadioControlSession(QObject* parent = nullptr);
    ~RadioControlSession();

    /**
     * Set the endpoint and dialect
     * An empty host falls back to 127.0.0.1.
     */
    void configure(const QString& host, quint16 port, Profile profile);

    /**
     * Take endpoint, dialect, timeouts and spot defaults from the settings store
     */
    void applySettings(const Settings& settings);

    /**
     * Write endpoint and dialect back into the settings store
     * @return true if a value changed
     */
    bool storeSettings(Settings& settings) const;

    bool connectToRadio();
    void disconnectFromRadio();

    /**
     * Tune to a station, force its mode, then optionally spot it with the
     * default policy. The spot is only sent if tuning succeeded.
     */
    CommandOutcome tuneStation(const StationRef& station, bool sendSpot);

    CommandOutcome sendSpot(const StationRef& station, SpotPolicy policy, int ttlSeconds);
    CommandOutcome clearSpot(const StationRef& station);

    // AudioState changes only when the mute command was sent
    CommandOutcome setMuted(bool muted);
    CommandOutcome toggleMute();
    bool isMuted() const { return m_muted; }

    CommandOutcome sendRaw(const QString& command);

    SessionStatus status() const;

    // Spot defaults used by tuneStation()
    void setDefaultSpotPolicy(SpotPolicy policy) { m_defaultSpotPolicy = policy; }
    SpotPolicy defaultSpotPolicy() const { return m_defaultSpotPolicy; }
    void setDefaultSpotTtl(int seconds) { m_defaultSpotTtlSeconds = seconds; }
    int defaultSpotTtl() const { return m_defaultSpotTtlSeconds; }

    QString host() const { return m_host; }
    quint16 port() const { return m_port; }
    Profile profile() const { return m_profile; }

    SessionConnection* connection() const { return m_connection; }
    CommandDispatcher* dispatcher() const { return m_dispatcher; }
    SpotLifecycleManager* spots() const { return m_spots; }

signals:
    void statusChanged(const SessionStatus& status);
    void commandCompleted(const CommandOutcome& outcome);

private slots:
    void publishStatus();

private:
    SessionConnection* m_connection;
    CommandDispatcher* m_dispatcher;
    SpotLifecycleManager* m_spots;

    QString m_host;
    quint16 m_port;
    Profile m_profile;
    bool m_muted;
    SpotPolicy m_defaultSpotPolicy;
    int m_defaultSpotTtlSeconds;
};

Q_DECLARE_METATYPE(SessionStatus)

#endif // RADIOCONTROLSESSION_H
