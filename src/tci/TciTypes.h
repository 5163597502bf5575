/*
 * TciTypes.h
 *
 * Value types shared by the radio-control session components
 * Part of SWL View
 */

#ifndef TCITYPES_H
#define TCITYPES_H

#include <QDateTime>
#include <QJsonObject>
#include <QMetaType>
#include <QString>
#include <QStringList>
#include <cstdint>

/**
 * @brief Control-protocol dialect, fixed for the lifetime of a session
 */
enum class Profile {
    Thetis,
    ExpertSunSDR
};

/**
 * @brief Spot expiry policy
 */
enum class SpotPolicy {
    Timed,      // Cleared automatically at its deadline
    Persistent  // Cleared only by explicit action
};

/**
 * @brief Error taxonomy of the session subsystem
 *
 * A ProtocolQuirk is not an error: it is reported as a degraded CommandOutcome.
 */
enum class TciError {
    None,
    ConnectionError,     // Transport unreachable or timed out
    HandshakeError,      // WebSocket upgrade rejected or timed out
    NotConnectedError,   // Send attempted while not connected
    InvalidIntentError   // Malformed intent, nothing was formatted
};

QString profileToString(Profile profile);
Profile profileFromString(const QString& value, bool* ok = nullptr);
QString spotPolicyToString(SpotPolicy policy);
SpotPolicy spotPolicyFromString(const QString& value, bool* ok = nullptr);
QString tciErrorToString(TciError error);

/**
 * @brief A scheduled station, supplied by the schedule collaborator
 */
struct StationRef {
    QString callsign;
    int64_t frequencyHz = 0;
    QString mode;
    QDateTime scheduledEnd;   // Null when the end of the broadcast is unknown

    StationRef() {}

    StationRef(const QString& callsign, int64_t frequencyHz, const QString& mode,
               const QDateTime& scheduledEnd = QDateTime())
        : callsign(callsign)
        , frequencyHz(frequencyHz)
        , mode(mode)
        , scheduledEnd(scheduledEnd)
    {}

    bool hasScheduledEnd() const { return scheduledEnd.isValid(); }

    // Identity used to key spot records
    QString key() const { return QString("%1@%2").arg(callsign).arg(frequencyHz); }

    bool operator==(const StationRef& other) const { return key() == other.key(); }
};

/**
 * @brief An active spot announcement
 */
struct SpotRecord {
    StationRef station;
    SpotPolicy policy = SpotPolicy::Timed;
    QDateTime deadline;       // Always null for persistent spots
    QJsonObject payload;
    QDateTime createdAt;

    bool hasDeadline() const { return deadline.isValid(); }
    bool isPersistent() const { return policy == SpotPolicy::Persistent; }
};

/**
 * @brief Result of translating one intent into a wire command
 */
struct FormattedCommand {
    QString frame;            // Complete command including the ';' terminator
    TciError error = TciError::None;
    QString errorString;
    QString quirk;            // Known dialect limitation, empty if none

    bool isValid() const { return error == TciError::None; }
    bool hasQuirk() const { return !quirk.isEmpty(); }

    static FormattedCommand make(const QString& frame, const QString& quirk = QString())
    {
        FormattedCommand cmd;
        cmd.frame = frame;
        cmd.quirk = quirk;
        return cmd;
    }

    static FormattedCommand invalid(const QString& reason)
    {
        FormattedCommand cmd;
        cmd.error = TciError::InvalidIntentError;
        cmd.errorString = reason;
        return cmd;
    }
};

/**
 * @brief Outcome of a dispatched intent
 *
 * Sent means the frames were accepted by the connection write queue,
 * not that the peer application confirmed the behavior.
 */
struct CommandOutcome {
    enum Status {
        Sent,
        Degraded,   // Sent, but affected by a documented protocol quirk
        Failed
    };

    Status status = Failed;
    TciError error = TciError::None;
    QString message;
    QStringList frames;

    bool succeeded() const { return status != Failed; }
    bool isDegraded() const { return status == Degraded; }

    static CommandOutcome failure(TciError error, const QString& message,
                                  const QStringList& frames = QStringList())
    {
        CommandOutcome outcome;
        outcome.status = Failed;
        outcome.error = error;
        outcome.message = message;
        outcome.frames = frames;
        return outcome;
    }
};

Q_DECLARE_METATYPE(StationRef)
Q_DECLARE_METATYPE(SpotRecord)
Q_DECLARE_METATYPE(CommandOutcome)

#endif // TCITYPES_H
