/*
 * SpotLifecycleManager.cpp
 *
 * Tracks active spot announcements and clears them when they expire
 * Part of SWL View
 */

#include "SpotLifecycleManager.h"
#include "CommandDispatcher.h"
#include <QDebug>

SpotLifecycleManager::SpotLifecycleManager(CommandDispatcher* dispatcher,
                                           SessionConnection* connection,
                                           QObject* parent)
    : QObject(parent)
    , m_dispatcher(dispatcher)
    , m_connection(connection)
    , m_sweepTimer(new QTimer(this))
    , m_clock([]() { return QDateTime::currentDateTimeUtc(); })
{
    QObject::connect(m_sweepTimer, &QTimer::timeout, this, &SpotLifecycleManager::sweep);

    if (m_connection) {
        QObject::connect(m_connection, &SessionConnection::connectionStateChanged,
                         this, &SpotLifecycleManager::onConnectionStateChanged);
    }
}

SpotLifecycleManager::~SpotLifecycleManager()
{
    stopSweep();
}

CommandOutcome SpotLifecycleManager::sendSpot(const StationRef& station, SpotPolicy policy,
                                              int ttlSeconds, const QJsonObject& payload)
{
    SpotRecord record;
    record.station = station;
    record.policy = policy;
    record.payload = payload;
    record.createdAt = now();

    if (policy == SpotPolicy::Timed) {
        record.deadline = computeDeadline(record.createdAt, ttlSeconds, station.scheduledEnd);
    }

    // Persistent spots advertise no lifetime to the radio
    int ttlForRadio = (policy == SpotPolicy::Timed) ? ttlSeconds : 0;
    CommandOutcome outcome = m_dispatcher->spot(station.callsign, station.mode,
                                                station.frequencyHz, ttlForRadio, payload);
    if (!outcome.succeeded()) {
        qWarning() << "SpotLifecycleManager: Spot for" << station.key()
                   << "not sent -" << outcome.message;
        return outcome;
    }

    m_records.insert(station.key(), record);

    if (record.hasDeadline()) {
        qDebug() << "SpotLifecycleManager: Spotted" << station.key()
                 << "until" << record.deadline.toString(Qt::ISODate);
    } else {
        qDebug() << "SpotLifecycleManager: Spotted" << station.key() << "(persistent)";
    }

    emit spotAdded(record);
    emit activeSpotsChanged(m_records.size());
    return outcome;
}

CommandOutcome SpotLifecycleManager::clearSpot(const StationRef& station)
{
    bool hadRecord = m_records.contains(station.key());
    SpotRecord record = m_records.take(station.key());

    CommandOutcome outcome;
    if (m_connection && !m_connection->isConnected()) {
        // Bookkeeping only, the radio is unreachable
        outcome = CommandOutcome::failure(TciError::NotConnectedError,
                                          "Not connected - spot removed locally");
    } else {
        outcome = m_dispatcher->clearSpot(station.callsign);
    }

    if (hadRecord) {
        qDebug() << "SpotLifecycleManager: Cleared" << station.key();
        emit spotCleared(record);
    }
    int siblings = outcome.succeeded() ? dropSiblings(station.callsign) : 0;
    if (hadRecord || siblings > 0) {
        emit activeSpotsChanged(m_records.size());
    }
    return outcome;
}

QDateTime SpotLifecycleManager::computeDeadline(const QDateTime& now, int ttlSeconds,
                                                const QDateTime& scheduledEnd)
{
    QDateTime deadline = now.addSecs(qMax(0, ttlSeconds));

    if (scheduledEnd.isValid() && scheduledEnd < deadline) {
        deadline = scheduledEnd;
    }

    // A broadcast that is already over expires immediately
    if (deadline < now) {
        deadline = now;
    }
    return deadline;
}

void SpotLifecycleManager::startSweep(int intervalMs)
{
    m_sweepTimer->start(intervalMs);
    qDebug() << "SpotLifecycleManager: Sweeping every" << intervalMs << "ms";
}

void SpotLifecycleManager::stopSweep()
{
    m_sweepTimer->stop();
}

void SpotLifecycleManager::setClock(Clock clock)
{
    m_clock = clock ? clock : Clock([]() { return QDateTime::currentDateTimeUtc(); });
}

QDateTime SpotLifecycleManager::now() const
{
    return m_clock();
}

int SpotLifecycleManager::timedSpotCount() const
{
    int count = 0;
    for (const SpotRecord& record : m_records) {
        if (!record.isPersistent()) {
            count++;
        }
    }
    return count;
}

int SpotLifecycleManager::sweep()
{
    if (m_records.isEmpty()) {
        return 0;
    }

    if (m_connection && !m_connection->isConnected()) {
        return 0;
    }

    QDateTime current = now();
    QStringList expiredKeys;
    for (auto it = m_records.cbegin(); it != m_records.cend(); ++it) {
        const SpotRecord& record = it.value();
        if (record.isPersistent() || !record.hasDeadline()) {
            continue;
        }
        if (record.deadline <= current) {
            expiredKeys.append(it.key());
        }
    }

    int cleared = 0;
    for (const QString& key : expiredKeys) {
        // Already removed together with an expired sibling
        if (!m_records.contains(key)) {
            continue;
        }
        SpotRecord record = m_records.value(key);
        CommandOutcome outcome = m_dispatcher->clearSpot(record.station.callsign);
        if (!outcome.succeeded()) {
            // Keep the record, the next sweep retries once connected again
            qWarning() << "SpotLifecycleManager: Could not clear" << key << "-" << outcome.message;
            continue;
        }

        m_records.remove(key);
        cleared++;
        qDebug() << "SpotLifecycleManager: Expired" << key;
        emit spotExpired(record);
        cleared += dropSiblings(record.station.callsign);
    }

    if (cleared > 0) {
        emit activeSpotsChanged(m_records.size());
    }
    return cleared;
}

int SpotLifecycleManager::dropSiblings(const QString& callsign)
{
    // spot_delete removes every spot of a callsign on the radio
    QList<SpotRecord> dropped;
    for (auto it = m_records.begin(); it != m_records.end(); ) {
        if (it.value().station.callsign == callsign) {
            dropped.append(it.value());
            it = m_records.erase(it);
        } else {
            ++it;
        }
    }

    for (const SpotRecord& record : dropped) {
        qDebug() << "SpotLifecycleManager: Cleared" << record.station.key()
                 << "with its callsign";
        emit spotCleared(record);
    }
    return dropped.size();
}

void SpotLifecycleManager::onConnectionStateChanged(SessionConnection::ConnectionState state)
{
    if (state == SessionConnection::Connected) {
        if (!m_records.isEmpty()) {
            qDebug() << "SpotLifecycleManager: Reconnected with" << m_records.size()
                     << "tracked spots (not re-sent)";
        }
    } else if (!m_records.isEmpty()) {
        qDebug() << "SpotLifecycleManager: Session not connected - holding"
                 << m_records.size() << "spots";
    }
}
