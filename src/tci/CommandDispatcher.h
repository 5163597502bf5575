/*
 * CommandDispatcher.h
 *
 * Turns intents into dialect commands and forwards them to the session
 * Part of SWL View
 */

#ifndef COMMANDDISPATCHER_H
#define COMMANDDISPATCHER_H

#include "ProfileAdapter.h"
#include "TciTypes.h"
#include <QObject>
#include <QString>
#include <QList>
#include <memory>

class SessionConnection;

class CommandDispatcher : public QObject
{
    Q_OBJECT

public:
    CommandDispatcher(SessionConnection* connection, Profile profile, QObject* parent = nullptr);
    ~CommandDispatcher();

    Profile profile() const { return m_adapter->profile(); }

    /**
     * Change dialect. Refused while the session is connected,
     * the profile is fixed for the lifetime of a session.
     * @return true if the profile is now active
     */
    bool setProfile(Profile profile);

    // One operation per intent kind
    CommandOutcome tune(int64_t frequencyHz);
    CommandOutcome setMode(const QString& mode);
    CommandOutcome setMute(bool muted);
    CommandOutcome spot(const QString& callsign, const QString& mode, int64_t frequencyHz,
                        int ttlSeconds, const QJsonObject& payload);
    CommandOutcome clearSpot(const QString& callsign);

    // Tune first, then force the mode (mode commands depend on the VFO context)
    CommandOutcome tuneWithMode(int64_t frequencyHz, const QString& mode);

    /**
     * Send a command verbatim, bypassing the dialect adapter (diagnostics).
     * Only surrounding whitespace is trimmed and a missing ';' appended.
     */
    CommandOutcome sendRaw(const QString& command);

    const CommandOutcome& lastOutcome() const { return m_lastOutcome; }

signals:
    void commandCompleted(const CommandOutcome& outcome);

private:
    CommandOutcome dispatch(const QList<FormattedCommand>& commands);
    CommandOutcome finish(const CommandOutcome& outcome);

    SessionConnection* m_connection;
    std::unique_ptr<ProfileAdapter> m_adapter;
    CommandOutcome m_lastOutcome;
};

#endif // COMMANDDISPATCHER_H
