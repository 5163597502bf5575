// test_SpotLifecycleManager.cpp - Spot bookkeeping and expiry
//
// Tests:
// 1. Deadline computation against ttl and scheduled end
// 2. Timed spots are cleared by the sweep, persistent spots are not
// 3. Records survive a disconnect and are not re-sent on reconnect
// 4. Concurrent producers never interleave frames

#include <QtTest>
#include <QSignalSpy>
#include <QRegularExpression>

#include "FakeTciServer.h"
#include "tci/CommandDispatcher.h"
#include "tci/SessionConnection.h"
#include "tci/SpotLifecycleManager.h"

class TestSpotLifecycleManager : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void deadlineUsesTtl();
    void deadlineStopsAtScheduledEnd();
    void deadlineForFinishedBroadcastIsNow();

    void persistentSpotIsNeverSwept();
    void timedSpotExpiresAtScheduledEnd();
    void finishedBroadcastExpiresOnFirstSweep();
    void spotIsNotStoredWhenDisconnected();
    void recordsAreHeldAcrossReconnect();
    void clearSpotIsIdempotent();
    void clearSpotWhileDisconnectedIsLocal();
    void respotReplacesRecord();
    void expiryDropsRecordsOfSameCallsign();
    void clearSpotDropsRecordsOfSameCallsign();
    void producersNeverInterleave();
    void sweepTimerRuns();

private:
    bool connectSession();

    FakeTciServer* m_server = nullptr;
    SessionConnection* m_connection = nullptr;
    CommandDispatcher* m_dispatcher = nullptr;
    SpotLifecycleManager* m_spots = nullptr;
    QDateTime m_base;
    QDateTime m_now;
};

void TestSpotLifecycleManager::init()
{
    m_base = QDateTime::fromString("2026-10-18T12:00:00Z", Qt::ISODate);
    m_now = m_base;

    m_server = new FakeTciServer;
    QVERIFY(m_server->listen());
    m_connection = new SessionConnection;
    m_connection->setCommandInterval(0);
    m_dispatcher = new CommandDispatcher(m_connection, Profile::Thetis);
    m_spots = new SpotLifecycleManager(m_dispatcher, m_connection);
    m_spots->setClock([this]() { return m_now; });
}

void TestSpotLifecycleManager::cleanup()
{
    delete m_spots;
    m_spots = nullptr;
    delete m_dispatcher;
    m_dispatcher = nullptr;
    delete m_connection;
    m_connection = nullptr;
    delete m_server;
    m_server = nullptr;
}

bool TestSpotLifecycleManager::connectSession()
{
    return m_connection->connect("127.0.0.1", m_server->port());
}

void TestSpotLifecycleManager::deadlineUsesTtl()
{
    QCOMPARE(SpotLifecycleManager::computeDeadline(m_base, 120, QDateTime()),
             m_base.addSecs(120));
    QCOMPARE(SpotLifecycleManager::computeDeadline(m_base, 120, m_base.addSecs(3600)),
             m_base.addSecs(120));
    QCOMPARE(SpotLifecycleManager::computeDeadline(m_base, -10, QDateTime()), m_base);
}

void TestSpotLifecycleManager::deadlineStopsAtScheduledEnd()
{
    QCOMPARE(SpotLifecycleManager::computeDeadline(m_base, 120, m_base.addSecs(30)),
             m_base.addSecs(30));
}

void TestSpotLifecycleManager::deadlineForFinishedBroadcastIsNow()
{
    QCOMPARE(SpotLifecycleManager::computeDeadline(m_base, 120, m_base.addSecs(-300)), m_base);
}

void TestSpotLifecycleManager::persistentSpotIsNeverSwept()
{
    QVERIFY(connectSession());
    StationRef station("RADIO X", 9410000, "am");

    CommandOutcome outcome = m_spots->sendSpot(station, SpotPolicy::Persistent, 120);
    QVERIFY(outcome.succeeded());
    QTRY_COMPARE(m_server->frames(), QStringList{"SPOT:RADIO X,AM,9410000,20381,[json]{};"});

    SpotRecord record = m_spots->spot(station);
    QVERIFY(record.isPersistent());
    QVERIFY(!record.hasDeadline());

    m_now = m_base.addSecs(3600);
    QCOMPARE(m_spots->sweep(), 0);
    QVERIFY(m_spots->hasSpot(station));

    QTest::qWait(50);
    QCOMPARE(m_server->frames().size(), 1);
}

void TestSpotLifecycleManager::timedSpotExpiresAtScheduledEnd()
{
    QVERIFY(connectSession());
    StationRef station("RADIO X", 9410000, "am", m_base.addSecs(30));
    QSignalSpy expired(m_spots, &SpotLifecycleManager::spotExpired);

    QVERIFY(m_spots->sendSpot(station, SpotPolicy::Timed, 120).succeeded());
    QCOMPARE(m_spots->spot(station).deadline, m_base.addSecs(30));
    QTRY_COMPARE(m_server->frames().size(), 1);

    m_now = m_base.addSecs(29);
    QCOMPARE(m_spots->sweep(), 0);
    QVERIFY(m_spots->hasSpot(station));

    m_now = m_base.addSecs(31);
    QCOMPARE(m_spots->sweep(), 1);
    QVERIFY(!m_spots->hasSpot(station));
    QCOMPARE(expired.count(), 1);

    QTRY_COMPARE(m_server->frames().size(), 2);
    QCOMPARE(m_server->frames().at(1), QString("spot_delete:RADIO X;"));
}

void TestSpotLifecycleManager::finishedBroadcastExpiresOnFirstSweep()
{
    QVERIFY(connectSession());
    StationRef station("RADIO Y", 6000000, "usb", m_base.addSecs(-60));

    QVERIFY(m_spots->sendSpot(station, SpotPolicy::Timed, 120).succeeded());
    QCOMPARE(m_spots->spot(station).deadline, m_base);
    QCOMPARE(m_spots->sweep(), 1);
    QCOMPARE(m_spots->spotCount(), 0);
}

void TestSpotLifecycleManager::spotIsNotStoredWhenDisconnected()
{
    StationRef station("RADIO X", 9410000, "am");

    CommandOutcome outcome = m_spots->sendSpot(station, SpotPolicy::Timed, 120);
    QCOMPARE(outcome.error, TciError::NotConnectedError);
    QCOMPARE(m_spots->spotCount(), 0);
}

void TestSpotLifecycleManager::recordsAreHeldAcrossReconnect()
{
    QVERIFY(connectSession());
    StationRef station("RADIO X", 9410000, "am");
    QVERIFY(m_spots->sendSpot(station, SpotPolicy::Timed, 120).succeeded());
    QTRY_COMPARE(m_server->frames().size(), 1);

    m_connection->disconnect();
    m_now = m_base.addSecs(200);
    // No network intents while disconnected, the record stays
    QCOMPARE(m_spots->sweep(), 0);
    QVERIFY(m_spots->hasSpot(station));

    m_server->clearFrames();
    QVERIFY(connectSession());
    QTest::qWait(50);
    // Not re-sent on reconnect
    QVERIFY(m_server->frames().isEmpty());

    QCOMPARE(m_spots->sweep(), 1);
    QTRY_COMPARE(m_server->frames(), QStringList{"spot_delete:RADIO X;"});
}

void TestSpotLifecycleManager::clearSpotIsIdempotent()
{
    QVERIFY(connectSession());
    StationRef station("RADIO X", 9410000, "am");
    QSignalSpy cleared(m_spots, &SpotLifecycleManager::spotCleared);

    QVERIFY(m_spots->sendSpot(station, SpotPolicy::Persistent, 0).succeeded());
    QVERIFY(m_spots->clearSpot(station).succeeded());
    QVERIFY(m_spots->clearSpot(station).succeeded());

    QCOMPARE(cleared.count(), 1);
    QCOMPARE(m_spots->spotCount(), 0);
}

void TestSpotLifecycleManager::clearSpotWhileDisconnectedIsLocal()
{
    QVERIFY(connectSession());
    StationRef station("RADIO X", 9410000, "am");
    QVERIFY(m_spots->sendSpot(station, SpotPolicy::Persistent, 0).succeeded());
    QTRY_COMPARE(m_server->frames().size(), 1);

    m_connection->disconnect();
    CommandOutcome outcome = m_spots->clearSpot(station);
    QCOMPARE(outcome.error, TciError::NotConnectedError);
    QVERIFY(!m_spots->hasSpot(station));
}

void TestSpotLifecycleManager::respotReplacesRecord()
{
    QVERIFY(connectSession());
    StationRef station("RADIO X", 9410000, "am");

    QVERIFY(m_spots->sendSpot(station, SpotPolicy::Timed, 60).succeeded());
    m_now = m_base.addSecs(30);
    QVERIFY(m_spots->sendSpot(station, SpotPolicy::Timed, 60).succeeded());

    QCOMPARE(m_spots->spotCount(), 1);
    QCOMPARE(m_spots->spot(station).deadline, m_base.addSecs(90));

    // Same callsign on another frequency is a different spot
    QVERIFY(m_spots->sendSpot(StationRef("RADIO X", 11700000, "am"),
                              SpotPolicy::Timed, 60).succeeded());
    QCOMPARE(m_spots->spotCount(), 2);
    QCOMPARE(m_spots->timedSpotCount(), 2);
}

void TestSpotLifecycleManager::expiryDropsRecordsOfSameCallsign()
{
    QVERIFY(connectSession());
    StationRef early("RADIO X", 9410000, "am", m_base.addSecs(30));
    StationRef late("RADIO X", 11700000, "am");
    StationRef other("RADIO Y", 6000000, "am");

    QVERIFY(m_spots->sendSpot(early, SpotPolicy::Timed, 120).succeeded());
    QVERIFY(m_spots->sendSpot(late, SpotPolicy::Timed, 120).succeeded());
    QVERIFY(m_spots->sendSpot(other, SpotPolicy::Timed, 120).succeeded());
    QTRY_COMPARE(m_server->frames().size(), 3);
    m_server->clearFrames();

    // Deleting by callsign takes both RADIO X spots off the radio
    m_now = m_base.addSecs(31);
    QCOMPARE(m_spots->sweep(), 2);
    QVERIFY(!m_spots->hasSpot(early));
    QVERIFY(!m_spots->hasSpot(late));
    QVERIFY(m_spots->hasSpot(other));

    QTRY_COMPARE(m_server->frames(), QStringList{"spot_delete:RADIO X;"});
}

void TestSpotLifecycleManager::clearSpotDropsRecordsOfSameCallsign()
{
    QVERIFY(connectSession());
    StationRef first("RADIO X", 9410000, "am");
    StationRef second("RADIO X", 11700000, "am");
    QSignalSpy cleared(m_spots, &SpotLifecycleManager::spotCleared);

    QVERIFY(m_spots->sendSpot(first, SpotPolicy::Persistent, 0).succeeded());
    QVERIFY(m_spots->sendSpot(second, SpotPolicy::Timed, 120).succeeded());

    QVERIFY(m_spots->clearSpot(first).succeeded());
    QCOMPARE(m_spots->spotCount(), 0);
    QCOMPARE(cleared.count(), 2);
}

void TestSpotLifecycleManager::producersNeverInterleave()
{
    QVERIFY(connectSession());

    // Tune/mode/spot traffic mixed with sweep clears
    for (int i = 0; i < 10; i++) {
        StationRef station(QString("STATION %1").arg(i), 9400000 + i * 5000, "am",
                           m_base.addSecs(5));
        m_dispatcher->tuneWithMode(station.frequencyHz, station.mode);
        m_spots->sendSpot(station, SpotPolicy::Timed, 120);
    }
    m_now = m_base.addSecs(10);
    QCOMPARE(m_spots->sweep(), 10);

    QTRY_COMPARE(m_server->frames().size(), 40);

    QRegularExpression whole("^(vfo:0,0,\\d+|modulation:0,0,am|SPOT:STATION \\d,AM,\\d+,20381,\\[json\\]\\{\\}"
                             "|spot_delete:STATION \\d);$");
    for (const QString& frame : m_server->frames()) {
        QVERIFY2(whole.match(frame).hasMatch(), qPrintable(frame));
    }
}

void TestSpotLifecycleManager::sweepTimerRuns()
{
    QVERIFY(connectSession());
    StationRef station("RADIO X", 9410000, "am", m_base.addSecs(5));
    QVERIFY(m_spots->sendSpot(station, SpotPolicy::Timed, 120).succeeded());

    m_now = m_base.addSecs(6);
    m_spots->startSweep(20);
    QVERIFY(m_spots->isSweeping());
    QTRY_COMPARE(m_spots->spotCount(), 0);

    m_spots->stopSweep();
    QVERIFY(!m_spots->isSweeping());
}

QTEST_GUILESS_MAIN(TestSpotLifecycleManager)
#include "test_SpotLifecycleManager.moc"
