#include <QCoreApplication>
#include <QCommandLineParser>
#include <QJsonDocument>
#include <QTextStream>
#include <QTimer>
#include <QDebug>

#include "SwlView/Version.h"
#include "config/Settings.h"
#include "tci/RadioControlSession.h"
#include "tci/CommandDispatcher.h"
#include "tci/SpotLifecycleManager.h"
#include "tci/TciProtocol.h"

namespace {

void printStatus(const SessionStatus& status)
{
    QTextStream out(stdout);
    out << QJsonDocument(status.toJson()).toJson(QJsonDocument::Indented);
    out.flush();
}

bool report(const QString& action, const CommandOutcome& outcome)
{
    if (!outcome.succeeded()) {
        qCritical().noquote() << action << "failed:" << tciErrorToString(outcome.error)
                              << "-" << outcome.message;
        return false;
    }
    if (outcome.isDegraded()) {
        qWarning().noquote() << action << "sent with known limitation:" << outcome.message;
    } else {
        qDebug().noquote() << action << "sent:" << outcome.frames.join(' ');
    }
    return true;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Set application info
    app.setApplicationName(SWLVIEW_APP_NAME);
    app.setApplicationVersion(SWLVIEW_VERSION_STRING);
    app.setOrganizationName(SWLVIEW_ORG_NAME);

    QCommandLineParser parser;
    parser.setApplicationDescription("Drive a TCI radio-control endpoint (Thetis / ExpertSDR) "
                                     "from a shortwave schedule entry");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOption("config", "Settings file to use instead of the default.", "file");
    QCommandLineOption hostOption("host", "Control endpoint host.", "host");
    QCommandLineOption portOption("port", "Control endpoint port.", "port");
    QCommandLineOption profileOption("profile", "Command dialect: thetis or expert.", "profile");
    QCommandLineOption tuneOption("tune", "Tune the VFO to this frequency.", "hz");
    QCommandLineOption modeOption("mode", "Demodulation mode to force after tuning.", "mode");
    QCommandLineOption callsignOption("callsign", "Station name used for the spot.", "name");
    QCommandLineOption endOption("end", "Scheduled end of the broadcast (ISO 8601, UTC).", "time");
    QCommandLineOption spotOption("spot", "Spot the tuned station.");
    QCommandLineOption persistentOption("persistent", "Spot without expiry.");
    QCommandLineOption ttlOption("ttl", "Lifetime of a timed spot.", "seconds");
    QCommandLineOption muteOption("mute", "Mute receiver audio.");
    QCommandLineOption unmuteOption("unmute", "Unmute receiver audio.");
    QCommandLineOption rawOption("raw", "Send a raw command verbatim.", "command");
    QCommandLineOption saveOption("save", "Write endpoint and spot settings back to the settings file.");

    parser.addOptions({configOption, hostOption, portOption, profileOption, tuneOption,
                       modeOption, callsignOption, endOption, spotOption, persistentOption,
                       ttlOption, muteOption, unmuteOption, rawOption, saveOption});
    parser.process(app);

    qDebug() << "Starting" << SWLVIEW_APP_NAME << "v" << SWLVIEW_VERSION_STRING;

    if (parser.isSet(muteOption) && parser.isSet(unmuteOption)) {
        qCritical() << "--mute and --unmute cannot be combined";
        return 1;
    }

    // Settings are read once, before connecting
    Settings settings;
    QString configPath = parser.value(configOption);
    if (!configPath.isEmpty()) {
        settings.loadFromFile(configPath);
    } else {
        settings.load();
    }

    Settings::TciSettings& tci = settings.tci();
    if (parser.isSet(hostOption)) {
        tci.host = parser.value(hostOption);
    }
    if (parser.isSet(portOption)) {
        bool ok = false;
        int port = parser.value(portOption).toInt(&ok);
        if (!ok || port <= 0 || port > 65535) {
            qCritical() << "Invalid port:" << parser.value(portOption);
            return 1;
        }
        tci.port = port;
    }
    if (parser.isSet(profileOption)) {
        bool ok = false;
        tci.profile = profileFromString(parser.value(profileOption), &ok);
        if (!ok) {
            qCritical() << "Unknown profile:" << parser.value(profileOption);
            return 1;
        }
    }
    if (parser.isSet(persistentOption)) {
        tci.defaultSpotPolicy = SpotPolicy::Persistent;
    }
    if (parser.isSet(ttlOption)) {
        bool ok = false;
        int ttl = parser.value(ttlOption).toInt(&ok);
        if (!ok || ttl <= 0) {
            qCritical() << "Invalid TTL:" << parser.value(ttlOption);
            return 1;
        }
        tci.spotTtlSeconds = ttl;
    }

    RadioControlSession session;
    session.applySettings(settings);

    if (parser.isSet(saveOption)) {
        bool saved = configPath.isEmpty() ? settings.save() : settings.saveToFile(configPath);
        if (!saved) {
            qWarning() << "Settings were not saved";
        }
    }

    if (!session.connectToRadio()) {
        printStatus(session.status());
        return 2;
    }

    bool allOk = true;

    if (parser.isSet(rawOption)) {
        allOk &= report("Raw command", session.sendRaw(parser.value(rawOption)));
    }

    if (parser.isSet(tuneOption)) {
        bool ok = false;
        qint64 frequencyHz = parser.value(tuneOption).toLongLong(&ok);
        if (!ok) {
            qCritical() << "Invalid frequency:" << parser.value(tuneOption);
            allOk = false;
        } else {
            QString callsign = parser.value(callsignOption).trimmed();
            if (callsign.isEmpty() && parser.isSet(spotOption)) {
                callsign = TciProtocol::DEFAULT_STATION;
            }
            StationRef station(callsign, frequencyHz, parser.value(modeOption));
            if (parser.isSet(endOption)) {
                station.scheduledEnd = QDateTime::fromString(parser.value(endOption), Qt::ISODate);
                if (!station.scheduledEnd.isValid()) {
                    qWarning() << "Ignoring unparseable end time:" << parser.value(endOption);
                }
            }
            // With send_spot on, a named station is always spotted
            bool wantSpot = parser.isSet(spotOption)
                         || (tci.sendSpot && !station.callsign.trimmed().isEmpty());
            allOk &= report("Tune", session.tuneStation(station, wantSpot));
        }
    } else if (parser.isSet(spotOption)) {
        qCritical() << "--spot needs --tune";
        allOk = false;
    }

    if (parser.isSet(muteOption) || parser.isSet(unmuteOption)) {
        allOk &= report("Mute", session.setMuted(parser.isSet(muteOption)));
    }

    // Stay up until the write queue is flushed and timed spots have expired
    QTimer idleCheck;
    QObject::connect(&idleCheck, &QTimer::timeout, &app, [&]() {
        SessionConnection* connection = session.connection();
        if (!connection->isConnected()) {
            qWarning() << "Session ended:" << connection->lastError();
            app.exit();
            return;
        }
        if (connection->pendingCommands() == 0 && session.spots()->timedSpotCount() == 0) {
            app.exit();
        }
    });
    idleCheck.start(200);

    if (session.spots()->timedSpotCount() > 0) {
        qDebug() << "Waiting for" << session.spots()->timedSpotCount() << "timed spot(s) to expire";
    }

    app.exec();

    SessionStatus finalStatus = session.status();
    if (finalStatus.state == SessionConnection::Error) {
        allOk = false;
    }
    printStatus(finalStatus);

    session.disconnectFromRadio();
    qDebug() << "Application exiting with code" << (allOk ? 0 : 1);
    return allOk ? 0 : 1;
}
