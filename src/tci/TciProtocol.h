/*
 * TciProtocol.h
 *
 * TCI (Transceiver Control Interface) command constants and helpers
 * Part of SWL View
 */

#ifndef TCIPROTOCOL_H
#define TCIPROTOCOL_H

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <cstdint>

namespace TciProtocol {

// Frame terminator - every command is one text frame ending with ';'
constexpr char TERMINATOR = ';';

// Receiver addressing used by tune and mode commands
constexpr int TRX_INDEX = 0;
constexpr int CHANNEL_INDEX = 0;

// Fixed numeric field of the SPOT command
constexpr int THETIS_SPOT_CHANNEL = 20381;
constexpr int64_t EXPERT_SPOT_ARGB = 16711680;   // 0x00FF0000

// Defaults shared by the session and the settings store
constexpr quint16 DEFAULT_PORT = 40001;
constexpr int DEFAULT_SPOT_TTL_SECONDS = 120;
constexpr int DEFAULT_CONNECT_TIMEOUT_MS = 2000;
constexpr int DEFAULT_COMMAND_INTERVAL_MS = 30;
constexpr int SWEEP_INTERVAL_MS = 1000;

inline const QString DEFAULT_HOST = QStringLiteral("127.0.0.1");
inline const QString SPOTTER_NAME = QStringLiteral("SWL_View");

// Used when a schedule entry carries no mode or station name
inline const QString DEFAULT_MODE = QStringLiteral("am");
inline const QString DEFAULT_STATION = QStringLiteral("SWL");

/**
 * Demodulation tokens accepted by both dialects (lower case)
 */
const QStringList& knownModes();

/**
 * Normalize a mode token (trim + lower case)
 * @return Normalized token, or empty string if the mode is not known
 */
QString normalizeMode(const QString& mode);

/**
 * Check that a callsign can be embedded in a comma separated command
 */
bool isValidCallsign(const QString& callsign);

/**
 * Remove characters that would break command framing (',' and ';')
 */
QString stripFieldSeparators(const QString& text);

/**
 * Build a WebSocket URL for the control endpoint
 * @return "ws://host:port"
 */
QString endpointUrl(const QString& host, quint16 port);

/**
 * Build the SWL JSON payload carried by Thetis spots
 * @param mode Mode label shown in the comment (e.g. "am")
 * @param ttlSeconds Requested time to live (ignored when not timed)
 * @param timed True for SWL timed spots, false for persistent spots
 * @param utcNow Timestamp written to "utctime"
 */
QJsonObject buildSwlSpotPayload(const QString& mode, int ttlSeconds, bool timed,
                                const QDateTime& utcNow);

} // namespace TciProtocol

#endif // TCIPROTOCOL_H
