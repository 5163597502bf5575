// test_CommandDispatcher.cpp - Intent dispatch through a live session
//
// Tests:
// 1. Outcomes for not-connected and invalid intents
// 2. Tune is always sent before the mode
// 3. Quirks are reported as degraded outcomes
// 4. Raw command normalization

#include <QtTest>
#include <QSignalSpy>

#include "FakeTciServer.h"
#include "tci/CommandDispatcher.h"
#include "tci/SessionConnection.h"

class TestCommandDispatcher : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void notConnectedIsReported();
    void invalidIntentSendsNothing();
    void tuneIsSentVerbatim();
    void tuneWithModeKeepsOrder();
    void tuneWithBadModeSendsNothing();
    void expertMuteUsesReceiverToken();
    void sendRawNormalizesTerminator();
    void sendRawRejectsEmptyCommand();
    void profileIsFixedWhileConnected();
    void commandCompletedIsEmitted();

private:
    bool connectSession();

    FakeTciServer* m_server = nullptr;
    SessionConnection* m_connection = nullptr;
};

void TestCommandDispatcher::init()
{
    m_server = new FakeTciServer;
    QVERIFY(m_server->listen());
    m_connection = new SessionConnection;
    m_connection->setCommandInterval(0);
}

void TestCommandDispatcher::cleanup()
{
    delete m_connection;
    m_connection = nullptr;
    delete m_server;
    m_server = nullptr;
}

bool TestCommandDispatcher::connectSession()
{
    return m_connection->connect("127.0.0.1", m_server->port());
}

void TestCommandDispatcher::notConnectedIsReported()
{
    CommandDispatcher dispatcher(m_connection, Profile::Thetis);

    CommandOutcome outcome = dispatcher.tune(9410000);
    QVERIFY(!outcome.succeeded());
    QCOMPARE(outcome.status, CommandOutcome::Failed);
    QCOMPARE(outcome.error, TciError::NotConnectedError);
    QVERIFY(outcome.frames.isEmpty());
}

void TestCommandDispatcher::invalidIntentSendsNothing()
{
    QVERIFY(connectSession());
    CommandDispatcher dispatcher(m_connection, Profile::Thetis);

    CommandOutcome outcome = dispatcher.setMode("am-swl");
    QCOMPARE(outcome.error, TciError::InvalidIntentError);
    QCOMPARE(m_connection->pendingCommands(), 0);

    outcome = dispatcher.tune(-100);
    QCOMPARE(outcome.error, TciError::InvalidIntentError);

    QTest::qWait(50);
    QVERIFY(m_server->frames().isEmpty());
}

void TestCommandDispatcher::tuneIsSentVerbatim()
{
    QVERIFY(connectSession());
    CommandDispatcher dispatcher(m_connection, Profile::Thetis);

    CommandOutcome outcome = dispatcher.tune(9410000);
    QCOMPARE(outcome.status, CommandOutcome::Sent);
    QCOMPARE(outcome.frames, QStringList{"vfo:0,0,9410000;"});
    QTRY_COMPARE(m_server->frames(), QStringList{"vfo:0,0,9410000;"});
}

void TestCommandDispatcher::tuneWithModeKeepsOrder()
{
    QVERIFY(connectSession());
    CommandDispatcher dispatcher(m_connection, Profile::Thetis);

    CommandOutcome outcome = dispatcher.tuneWithMode(9410000, "AM");
    QVERIFY(outcome.succeeded());
    QVERIFY(outcome.isDegraded());
    QVERIFY(!outcome.message.isEmpty());

    QStringList expected = {"vfo:0,0,9410000;", "modulation:0,0,am;"};
    QCOMPARE(outcome.frames, expected);
    QTRY_COMPARE(m_server->frames(), expected);
}

void TestCommandDispatcher::tuneWithBadModeSendsNothing()
{
    QVERIFY(connectSession());
    CommandDispatcher dispatcher(m_connection, Profile::Thetis);

    CommandOutcome outcome = dispatcher.tuneWithMode(9410000, "morse");
    QCOMPARE(outcome.error, TciError::InvalidIntentError);
    QVERIFY(outcome.frames.isEmpty());

    QTest::qWait(50);
    QVERIFY(m_server->frames().isEmpty());
}

void TestCommandDispatcher::expertMuteUsesReceiverToken()
{
    QVERIFY(connectSession());
    CommandDispatcher dispatcher(m_connection, Profile::ExpertSunSDR);

    QCOMPARE(dispatcher.setMute(true).status, CommandOutcome::Sent);
    QCOMPARE(dispatcher.setMute(false).status, CommandOutcome::Sent);

    QStringList expected = {"rx_mute:0,true;", "rx_mute:0,false;"};
    QTRY_COMPARE(m_server->frames(), expected);
}

void TestCommandDispatcher::sendRawNormalizesTerminator()
{
    QVERIFY(connectSession());
    CommandDispatcher dispatcher(m_connection, Profile::Thetis);

    QVERIFY(dispatcher.sendRaw("  vfo:0,0,6000000  ").succeeded());
    QVERIFY(dispatcher.sendRaw("spot_clear;").succeeded());

    QStringList expected = {"vfo:0,0,6000000;", "spot_clear;"};
    QTRY_COMPARE(m_server->frames(), expected);
}

void TestCommandDispatcher::sendRawRejectsEmptyCommand()
{
    CommandDispatcher dispatcher(m_connection, Profile::Thetis);

    CommandOutcome outcome = dispatcher.sendRaw("   ");
    QCOMPARE(outcome.error, TciError::InvalidIntentError);
    QCOMPARE(dispatcher.lastOutcome().error, TciError::InvalidIntentError);
}

void TestCommandDispatcher::profileIsFixedWhileConnected()
{
    CommandDispatcher dispatcher(m_connection, Profile::Thetis);

    QVERIFY(dispatcher.setProfile(Profile::ExpertSunSDR));
    QCOMPARE(dispatcher.profile(), Profile::ExpertSunSDR);

    QVERIFY(connectSession());
    QVERIFY(!dispatcher.setProfile(Profile::Thetis));
    QCOMPARE(dispatcher.profile(), Profile::ExpertSunSDR);
    // Setting the active profile again is not a change
    QVERIFY(dispatcher.setProfile(Profile::ExpertSunSDR));

    m_connection->disconnect();
    QVERIFY(dispatcher.setProfile(Profile::Thetis));
    QCOMPARE(dispatcher.profile(), Profile::Thetis);
}

void TestCommandDispatcher::commandCompletedIsEmitted()
{
    QVERIFY(connectSession());
    CommandDispatcher dispatcher(m_connection, Profile::Thetis);
    QSignalSpy completed(&dispatcher, &CommandDispatcher::commandCompleted);

    dispatcher.setMute(true);
    dispatcher.setMode("nonsense");

    QCOMPARE(completed.count(), 2);
    QCOMPARE(dispatcher.lastOutcome().status, CommandOutcome::Failed);
    QTRY_COMPARE(m_server->frames(), QStringList{"mute:true;"});
}

QTEST_GUILESS_MAIN(TestCommandDispatcher)
#include "test_CommandDispatcher.moc"
