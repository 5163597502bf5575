/*
 * CommandDispatcher.cpp
 *
 * Turns intents into dialect commands and forwards them to the session
 * Part of SWL View
 */

#include "CommandDispatcher.h"
#include "SessionConnection.h"
#include "TciProtocol.h"
#include <QDebug>

CommandDispatcher::CommandDispatcher(SessionConnection* connection, Profile profile, QObject* parent)
    : QObject(parent)
    , m_connection(connection)
    , m_adapter(ProfileAdapter::create(profile))
{
}

CommandDispatcher::~CommandDispatcher() = default;

bool CommandDispatcher::setProfile(Profile profile)
{
    if (profile == m_adapter->profile()) {
        return true;
    }

    if (m_connection && m_connection->isConnected()) {
        qWarning() << "CommandDispatcher: Cannot change profile while connected";
        return false;
    }

    m_adapter = ProfileAdapter::create(profile);
    qDebug() << "CommandDispatcher: Profile set to" << profileToString(profile);
    return true;
}

CommandOutcome CommandDispatcher::tune(int64_t frequencyHz)
{
    return dispatch({ m_adapter->formatTune(frequencyHz) });
}

CommandOutcome CommandDispatcher::setMode(const QString& mode)
{
    return dispatch({ m_adapter->formatSetMode(mode) });
}

CommandOutcome CommandDispatcher::setMute(bool muted)
{
    return dispatch({ m_adapter->formatMute(muted) });
}

CommandOutcome CommandDispatcher::spot(const QString& callsign, const QString& mode,
                                       int64_t frequencyHz, int ttlSeconds,
                                       const QJsonObject& payload)
{
    return dispatch({ m_adapter->formatSpot(callsign, mode, frequencyHz, ttlSeconds, payload) });
}

CommandOutcome CommandDispatcher::clearSpot(const QString& callsign)
{
    return dispatch({ m_adapter->formatClearSpot(callsign) });
}

CommandOutcome CommandDispatcher::tuneWithMode(int64_t frequencyHz, const QString& mode)
{
    // Both are formatted before anything is sent, so a bad mode never
    // leaves the receiver tuned without the requested mode
    return dispatch({ m_adapter->formatTune(frequencyHz), m_adapter->formatSetMode(mode) });
}

CommandOutcome CommandDispatcher::sendRaw(const QString& command)
{
    QString cmd = command.trimmed();
    if (cmd.isEmpty()) {
        return finish(CommandOutcome::failure(TciError::InvalidIntentError, "Empty command"));
    }
    if (!cmd.endsWith(TciProtocol::TERMINATOR)) {
        cmd.append(TciProtocol::TERMINATOR);
    }

    return dispatch({ FormattedCommand::make(cmd) });
}

CommandOutcome CommandDispatcher::dispatch(const QList<FormattedCommand>& commands)
{
    QStringList quirks;
    for (const FormattedCommand& cmd : commands) {
        if (!cmd.isValid()) {
            qWarning() << "CommandDispatcher: Invalid intent -" << cmd.errorString;
            return finish(CommandOutcome::failure(cmd.error, cmd.errorString));
        }
        if (cmd.hasQuirk()) {
            quirks.append(cmd.quirk);
        }
    }

    CommandOutcome outcome;
    for (const FormattedCommand& cmd : commands) {
        if (!m_connection || !m_connection->send(cmd.frame)) {
            TciError error = m_connection ? m_connection->lastErrorCode()
                                          : TciError::NotConnectedError;
            QString message = m_connection ? m_connection->lastError()
                                           : QString("No connection");
            return finish(CommandOutcome::failure(error, message, outcome.frames));
        }
        outcome.frames.append(cmd.frame);
    }

    if (quirks.isEmpty()) {
        outcome.status = CommandOutcome::Sent;
        outcome.message = outcome.frames.join(' ');
    } else {
        outcome.status = CommandOutcome::Degraded;
        outcome.message = quirks.join("; ");
        qDebug() << "CommandDispatcher: Sent with known limitation -" << outcome.message;
    }
    return finish(outcome);
}

CommandOutcome CommandDispatcher::finish(const CommandOutcome& outcome)
{
    m_lastOutcome = outcome;
    emit commandCompleted(outcome);
    return outcome;
}
