/*
 * SessionConnection.cpp
 *
 * Single WebSocket session to a TCI control endpoint
 * Part of SWL View
 */

#include "SessionConnection.h"
#include "TciProtocol.h"
#include <QEventLoop>
#include <QTcpSocket>
#include <QUrl>
#include <QDebug>

SessionConnection::SessionConnection(QObject* parent)
    : QObject(parent)
    , m_socket(nullptr)
    , m_writeTimer(new QTimer(this))
    , m_state(Disconnected)
    , m_host(TciProtocol::DEFAULT_HOST)
    , m_port(TciProtocol::DEFAULT_PORT)
    , m_lastErrorCode(TciError::None)
    , m_connectLoop(nullptr)
    , m_connectCancelled(false)
    , m_connectTimeoutMs(TciProtocol::DEFAULT_CONNECT_TIMEOUT_MS)
    , m_commandIntervalMs(TciProtocol::DEFAULT_COMMAND_INTERVAL_MS)
{
    m_writeTimer->setSingleShot(true);
    QObject::connect(m_writeTimer, &QTimer::timeout,
                     this, &SessionConnection::processOutboundQueue);
}

SessionConnection::~SessionConnection()
{
    disconnect();
}

bool SessionConnection::connect(const QString& host, quint16 port)
{
    if (m_state == Connecting) {
        qWarning() << "SessionConnection: Connect already in progress";
        return false;
    }

    // Only one session at a time
    if (m_socket || m_state != Disconnected) {
        disconnect();
    }

    m_host = host.trimmed();
    m_port = port;
    m_connectCancelled = false;
    setState(Connecting);

    QElapsedTimer elapsed;
    elapsed.start();

    // Stage 1: is anything listening? Failure here leaves the state Disconnected
    if (!probeTransport(m_connectTimeoutMs)) {
        setState(Disconnected);
        return false;
    }

    // Stage 2: WebSocket upgrade within what is left of the timeout
    int remainingMs = qMax(0, m_connectTimeoutMs - static_cast<int>(elapsed.elapsed()));
    if (!openWebSocket(remainingMs)) {
        releaseSocket();
        setState(m_connectCancelled ? Disconnected : Error);
        return false;
    }

    m_lastWrite.invalidate();
    m_lastInbound.invalidate();
    m_lastErrorCode = TciError::None;
    m_lastError.clear();

    qDebug() << "SessionConnection: Connected to"
             << TciProtocol::endpointUrl(m_host, m_port);
    setState(Connected);
    return true;
}

void SessionConnection::disconnect()
{
    if (m_state == Connecting) {
        // connect() is waiting in a nested event loop - let it unwind
        m_connectCancelled = true;
        if (m_connectLoop) {
            m_connectLoop->quit();
        }
        qDebug() << "SessionConnection: Connect cancelled";
        return;
    }

    m_writeTimer->stop();
    failPendingCommands("Disconnected before transmission");

    bool hadSocket = (m_socket != nullptr);
    releaseSocket();
    setState(Disconnected);

    if (hadSocket) {
        qDebug() << "SessionConnection: Disconnected";
    }
}

bool SessionConnection::send(const QString& command)
{
    if (m_state != Connected || !m_socket) {
        setError(TciError::NotConnectedError, "Not connected");
        qWarning() << "SessionConnection: Cannot send command - not connected:" << command;
        return false;
    }

    m_outbound.enqueue(command);
    scheduleOutbound();
    return true;
}

qint64 SessionConnection::msSinceLastInbound() const
{
    return m_lastInbound.isValid() ? m_lastInbound.elapsed() : -1;
}

bool SessionConnection::probeTransport(int timeoutMs)
{
    QTcpSocket probe;
    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);

    bool reachable = false;
    bool finished = false;

    QObject::connect(&probe, &QTcpSocket::connected, &loop, [&]() {
        reachable = true;
        finished = true;
        loop.quit();
    });
    QObject::connect(&probe, &QAbstractSocket::errorOccurred, &loop,
                     [&](QAbstractSocket::SocketError) {
        finished = true;
        loop.quit();
    });
    QObject::connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);

    probe.connectToHost(m_host, m_port);

    if (!finished) {
        m_connectLoop = &loop;
        timeout.start(timeoutMs);
        loop.exec();
        m_connectLoop = nullptr;
    }

    if (m_connectCancelled) {
        probe.abort();
        return false;
    }

    if (!reachable) {
        QString reason = finished ? probe.errorString()
                                  : QString("timed out after %1 ms").arg(timeoutMs);
        probe.abort();
        setError(TciError::ConnectionError,
                 QString("Cannot reach %1: %2")
                 .arg(TciProtocol::endpointUrl(m_host, m_port), reason));
        qWarning() << "SessionConnection:" << m_lastError;
        return false;
    }

    probe.abort();
    return true;
}

bool SessionConnection::openWebSocket(int timeoutMs)
{
    m_socket = new QWebSocket(QString(), QWebSocketProtocol::VersionLatest, this);

    // Session handlers are attached before open() so a greeting sent together
    // with the handshake response is not lost. They ignore events until Connected.
    QObject::connect(m_socket, &QWebSocket::textMessageReceived,
                     this, &SessionConnection::onTextMessageReceived);
    QObject::connect(m_socket, &QWebSocket::binaryMessageReceived,
                     this, &SessionConnection::onBinaryMessageReceived);
    QObject::connect(m_socket, &QWebSocket::disconnected,
                     this, &SessionConnection::onSocketDisconnected);
    QObject::connect(m_socket, &QWebSocket::errorOccurred,
                     this, &SessionConnection::onSocketError);

    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);

    bool opened = false;
    bool failed = false;

    QObject::connect(m_socket, &QWebSocket::connected, &loop, [&]() {
        opened = true;
        loop.quit();
    });
    QObject::connect(m_socket, &QWebSocket::errorOccurred, &loop,
                     [&](QAbstractSocket::SocketError) {
        failed = true;
        loop.quit();
    });
    QObject::connect(m_socket, &QWebSocket::disconnected, &loop, [&]() {
        failed = true;
        loop.quit();
    });
    QObject::connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);

    QString url = TciProtocol::endpointUrl(m_host, m_port);
    m_socket->open(QUrl(url));

    m_connectLoop = &loop;
    timeout.start(timeoutMs);
    loop.exec();
    m_connectLoop = nullptr;

    if (m_connectCancelled) {
        return false;
    }

    if (!opened) {
        QString reason = failed ? m_socket->errorString()
                                : QString("timed out after %1 ms").arg(timeoutMs);
        setError(TciError::HandshakeError,
                 QString("WebSocket handshake with %1 failed: %2").arg(url, reason));
        qWarning() << "SessionConnection:" << m_lastError;
        return false;
    }

    return true;
}

void SessionConnection::releaseSocket()
{
    if (!m_socket) {
        return;
    }

    QObject::disconnect(m_socket, nullptr, this, nullptr);
    m_socket->close();
    m_socket->deleteLater();
    m_socket = nullptr;
}

void SessionConnection::failPendingCommands(const QString& reason)
{
    while (!m_outbound.isEmpty()) {
        QString command = m_outbound.dequeue();
        qWarning() << "SessionConnection: Dropped queued command" << command << "-" << reason;
        emit commandFailed(command, reason);
    }
}

void SessionConnection::scheduleOutbound()
{
    if (m_outbound.isEmpty() || m_writeTimer->isActive()) {
        return;
    }

    qint64 waitMs = 0;
    if (m_lastWrite.isValid()) {
        waitMs = qMax<qint64>(0, m_commandIntervalMs - m_lastWrite.elapsed());
    }
    m_writeTimer->start(static_cast<int>(waitMs));
}

void SessionConnection::processOutboundQueue()
{
    if (m_outbound.isEmpty() || !m_socket || m_state != Connected) {
        return;
    }

    // One command per text frame, never split or merged
    QString command = m_outbound.dequeue();
    QByteArray payload = command.toUtf8();
    qint64 written = m_socket->sendTextMessage(command);
    m_lastWrite.start();

    if (written < payload.size()) {
        qWarning() << "SessionConnection: Write failed for" << command;
        emit commandFailed(command, "Write failed");
    } else {
        m_lastCommand = command;
        qDebug() << "SessionConnection: TX:" << command;
        emit commandSent(command);
    }

    scheduleOutbound();
}

void SessionConnection::onTextMessageReceived(const QString& message)
{
    m_lastInbound.start();
    qDebug() << "SessionConnection: RX:" << message;
    emit textFrameReceived(message);
}

void SessionConnection::onBinaryMessageReceived(const QByteArray& message)
{
    m_lastInbound.start();
    emit binaryFrameReceived(message);
}

void SessionConnection::onSocketDisconnected()
{
    if (m_state != Connected) {
        return;
    }

    QString reason = m_socket ? m_socket->closeReason() : QString();
    if (reason.isEmpty()) {
        reason = "closed by peer";
    }

    m_writeTimer->stop();
    failPendingCommands("Connection lost");
    setError(TciError::ConnectionError, QString("Connection lost: %1").arg(reason));
    qWarning() << "SessionConnection:" << m_lastError;
    releaseSocket();
    setState(Error);
}

void SessionConnection::onSocketError(QAbstractSocket::SocketError error)
{
    if (m_state != Connected) {
        return;
    }

    QString reason = m_socket ? m_socket->errorString()
                              : QString("socket error %1").arg(static_cast<int>(error));

    m_writeTimer->stop();
    failPendingCommands("Connection lost");
    setError(TciError::ConnectionError, QString("Transport error: %1").arg(reason));
    qWarning() << "SessionConnection:" << m_lastError;
    releaseSocket();
    setState(Error);
}

void SessionConnection::setState(ConnectionState newState)
{
    if (m_state != newState) {
        m_state = newState;
        emit connectionStateChanged(newState);
    }
}

void SessionConnection::setError(TciError code, const QString& error)
{
    m_lastErrorCode = code;
    m_lastError = error;
    emit errorOccurred(error);
}
