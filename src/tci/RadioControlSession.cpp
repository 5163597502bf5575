/*
 * RadioControlSession.cpp
 *
 * Facade over the TCI session components for the presentation layer
 * Part of SWL View
 */

#include "RadioControlSession.h"
#include "CommandDispatcher.h"
#include "SpotLifecycleManager.h"
#include "TciProtocol.h"
#include "config/Settings.h"
#include <QMetaEnum>
#include <QDebug>

QJsonObject SessionStatus::toJson() const
{
    QJsonObject json;
    json["enabled"] = enabled;
    json["connected"] = connected;
    json["state"] = QString::fromLatin1(
        QMetaEnum::fromType<SessionConnection::ConnectionState>().valueToKey(state));
    json["host"] = host;
    json["port"] = port;
    json["profile"] = profileToString(profile);
    json["last_error"] = lastError;
    json["last_command"] = lastCommand;
    json["muted"] = muted;
    json["active_spots"] = activeSpots;
    return json;
}

RadioControlSession::RadioControlSession(QObject* parent)
    : QObject(parent)
    , m_connection(new SessionConnection(this))
    , m_dispatcher(nullptr)
    , m_spots(nullptr)
    , m_host(TciProtocol::DEFAULT_HOST)
    , m_port(TciProtocol::DEFAULT_PORT)
    , m_profile(Profile::Thetis)
    , m_muted(false)
    , m_defaultSpotPolicy(SpotPolicy::Timed)
    , m_defaultSpotTtlSeconds(TciProtocol::DEFAULT_SPOT_TTL_SECONDS)
{
    m_dispatcher = new CommandDispatcher(m_connection, m_profile, this);
    m_spots = new SpotLifecycleManager(m_dispatcher, m_connection, this);

    connect(m_connection, &SessionConnection::connectionStateChanged,
            this, &RadioControlSession::publishStatus);
    connect(m_connection, &SessionConnection::commandSent,
            this, &RadioControlSession::publishStatus);
    connect(m_connection, &SessionConnection::errorOccurred,
            this, &RadioControlSession::publishStatus);
    connect(m_spots, &SpotLifecycleManager::activeSpotsChanged,
            this, &RadioControlSession::publishStatus);
    connect(m_dispatcher, &CommandDispatcher::commandCompleted,
            this, &RadioControlSession::commandCompleted);

    m_spots->startSweep(TciProtocol::SWEEP_INTERVAL_MS);
}

RadioControlSession::~RadioControlSession()
{
    m_spots->stopSweep();
    m_connection->disconnect();
}

void RadioControlSession::configure(const QString& host, quint16 port, Profile profile)
{
    QString trimmed = host.trimmed();
    m_host = trimmed.isEmpty() ? TciProtocol::DEFAULT_HOST : trimmed;
    m_port = port;
    m_profile = profile;

    // The dispatcher refuses a new dialect mid-session; connectToRadio() applies it
    m_dispatcher->setProfile(profile);

    qDebug() << "RadioControlSession: Configured" << TciProtocol::endpointUrl(m_host, m_port)
             << "profile" << profileToString(m_profile);
    publishStatus();
}

void RadioControlSession::applySettings(const Settings& settings)
{
    const Settings::TciSettings& tci = settings.tci();
    m_connection->setConnectTimeout(tci.connectTimeoutMs);
    m_connection->setCommandInterval(tci.commandIntervalMs);
    m_defaultSpotPolicy = tci.defaultSpotPolicy;
    m_defaultSpotTtlSeconds = tci.spotTtlSeconds;
    configure(tci.host, static_cast<quint16>(tci.port), tci.profile);
}

bool RadioControlSession::storeSettings(Settings& settings) const
{
    Settings::TciSettings& tci = settings.tci();
    bool changed = tci.host != m_host
                || tci.port != m_port
                || tci.profile != m_profile
                || tci.defaultSpotPolicy != m_defaultSpotPolicy
                || tci.spotTtlSeconds != m_defaultSpotTtlSeconds;

    if (changed) {
        tci.host = m_host;
        tci.port = m_port;
        tci.profile = m_profile;
        tci.defaultSpotPolicy = m_defaultSpotPolicy;
        tci.spotTtlSeconds = m_defaultSpotTtlSeconds;
        settings.markDirty();
    }
    return changed;
}

bool RadioControlSession::connectToRadio()
{
    if (m_connection->state() != SessionConnection::Disconnected) {
        m_connection->disconnect();
    }
    m_dispatcher->setProfile(m_profile);

    bool ok = m_connection->connect(m_host, m_port);
    if (!ok) {
        qWarning() << "RadioControlSession: Connect failed -" << m_connection->lastError();
    }
    publishStatus();
    return ok;
}

void RadioControlSession::disconnectFromRadio()
{
    m_connection->disconnect();
}

CommandOutcome RadioControlSession::tuneStation(const StationRef& station, bool sendSpot)
{
    CommandOutcome tuned = station.mode.trimmed().isEmpty()
        ? m_dispatcher->tune(station.frequencyHz)
        : m_dispatcher->tuneWithMode(station.frequencyHz, station.mode);

    if (!tuned.succeeded() || !sendSpot) {
        return tuned;
    }

    CommandOutcome spotted = this->sendSpot(station, m_defaultSpotPolicy, m_defaultSpotTtlSeconds);

    // Combined result: tune frames first, worst status wins
    CommandOutcome combined = spotted;
    combined.frames = tuned.frames + spotted.frames;
    if (spotted.succeeded() && tuned.isDegraded()) {
        combined.status = CommandOutcome::Degraded;
        combined.message = spotted.isDegraded() ? tuned.message + "; " + spotted.message
                                                : tuned.message;
    } else if (combined.status == CommandOutcome::Sent) {
        combined.message = combined.frames.join(' ');
    }
    return combined;
}

CommandOutcome RadioControlSession::sendSpot(const StationRef& station, SpotPolicy policy,
                                             int ttlSeconds)
{
    // Stations without a mode are spotted as AM
    StationRef spotted = station;
    if (spotted.mode.trimmed().isEmpty()) {
        spotted.mode = TciProtocol::DEFAULT_MODE;
    }

    // The radio expires the spot on its own, so it gets the clamped lifetime
    QDateTime now = m_spots->now();
    bool timed = (policy == SpotPolicy::Timed);
    int lifetimeSeconds = ttlSeconds;
    if (timed) {
        QDateTime deadline = SpotLifecycleManager::computeDeadline(now, ttlSeconds,
                                                                   station.scheduledEnd);
        lifetimeSeconds = static_cast<int>(now.secsTo(deadline));
    }

    QJsonObject payload = TciProtocol::buildSwlSpotPayload(spotted.mode, lifetimeSeconds,
                                                           timed, now);
    return m_spots->sendSpot(spotted, policy, ttlSeconds, payload);
}

CommandOutcome RadioControlSession::clearSpot(const StationRef& station)
{
    return m_spots->clearSpot(station);
}

CommandOutcome RadioControlSession::setMuted(bool muted)
{
    CommandOutcome outcome = m_dispatcher->setMute(muted);
    if (outcome.succeeded() && m_muted != muted) {
        m_muted = muted;
        qDebug() << "RadioControlSession: Audio" << (muted ? "muted" : "unmuted");
        publishStatus();
    }
    return outcome;
}

CommandOutcome RadioControlSession::toggleMute()
{
    return setMuted(!m_muted);
}

CommandOutcome RadioControlSession::sendRaw(const QString& command)
{
    return m_dispatcher->sendRaw(command);
}

SessionStatus RadioControlSession::status() const
{
    SessionStatus status;
    status.connected = m_connection->isConnected();
    status.state = m_connection->state();
    status.host = m_host;
    status.port = m_port;
    status.profile = m_dispatcher->profile();
    status.lastCommand = m_connection->lastCommand();
    status.muted = m_muted;
    status.activeSpots = m_spots->spotCount();

    const CommandOutcome& last = m_dispatcher->lastOutcome();
    if (m_connection->lastErrorCode() != TciError::None) {
        status.lastError = m_connection->lastError();
    } else if (!last.succeeded() && last.error != TciError::None) {
        status.lastError = last.message;
    }
    return status;
}

void RadioControlSession::publishStatus()
{
    emit statusChanged(status());
}
