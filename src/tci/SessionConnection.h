/*
 * SessionConnection.h
 *
 * Single WebSocket session to a TCI control endpoint
 * Part of SWL View
 */

#ifndef SESSIONCONNECTION_H
#define SESSIONCONNECTION_H

#include "TciTypes.h"
#include <QObject>
#include <QString>
#include <QByteArray>
#include <QQueue>
#include <QTimer>
#include <QElapsedTimer>
#include <QWebSocket>
#include <QAbstractSocket>

class QEventLoop;

/**
 * @brief Owns the one connection to the control endpoint
 *
 * All outbound commands go through a single FIFO write queue so frames from
 * different callers are never interleaved. There is no automatic reconnect:
 * after a failure the caller has to connect() again.
 *
 * Not thread-safe. Use from the owning thread, or post send() with
 * QMetaObject::invokeMethod from other threads.
 */
class SessionConnection : public QObject
{
    Q_OBJECT

public:
    enum ConnectionState {
        Disconnected,
        Connecting,
        Connected,
        Error
    };
    Q_ENUM(ConnectionState)

    explicit SessionConnection(QObject* parent = nullptr);
    ~SessionConnection();

    /**
     * Connect to ws://host:port (blocks until connected, failed or timed out)
     * Any existing connection is torn down first.
     * @return true if the session is Connected
     */
    bool connect(const QString& host, quint16 port);

    /**
     * Close the session. Queued commands are reported through commandFailed().
     * Safe to call in any state.
     */
    void disconnect();

    /**
     * Queue a complete command for transmission
     * @return false (NotConnectedError) if the session is not Connected
     */
    Q_INVOKABLE bool send(const QString& command);

    ConnectionState state() const { return m_state; }
    bool isConnected() const { return m_state == Connected; }
    QString host() const { return m_host; }
    quint16 port() const { return m_port; }

    TciError lastErrorCode() const { return m_lastErrorCode; }
    QString lastError() const { return m_lastError; }
    QString lastCommand() const { return m_lastCommand; }
    int pendingCommands() const { return m_outbound.size(); }

    // Milliseconds since the last inbound frame, -1 if none was received
    qint64 msSinceLastInbound() const;

    // Bound on probe + handshake inside connect()
    void setConnectTimeout(int ms) { m_connectTimeoutMs = ms; }
    int connectTimeout() const { return m_connectTimeoutMs; }

    // Minimum spacing between two transmitted commands
    void setCommandInterval(int ms) { m_commandIntervalMs = ms; }
    int commandInterval() const { return m_commandIntervalMs; }

signals:
    void connectionStateChanged(SessionConnection::ConnectionState state);
    void textFrameReceived(const QString& frame);
    void binaryFrameReceived(const QByteArray& frame);
    void commandSent(const QString& command);
    void commandFailed(const QString& command, const QString& reason);
    void errorOccurred(const QString& error);

private slots:
    void processOutboundQueue();
    void onTextMessageReceived(const QString& message);
    void onBinaryMessageReceived(const QByteArray& message);
    void onSocketDisconnected();
    void onSocketError(QAbstractSocket::SocketError error);

private:
    bool probeTransport(int timeoutMs);
    bool openWebSocket(int timeoutMs);
    void releaseSocket();
    void failPendingCommands(const QString& reason);
    void scheduleOutbound();
    void setState(ConnectionState newState);
    void setError(TciError code, const QString& error);

    QWebSocket* m_socket;
    QTimer* m_writeTimer;
    QQueue<QString> m_outbound;
    QElapsedTimer m_lastWrite;
    QElapsedTimer m_lastInbound;

    ConnectionState m_state;
    QString m_host;
    quint16 m_port;

    TciError m_lastErrorCode;
    QString m_lastError;
    QString m_lastCommand;

    // Pending connect() wait, quit early by disconnect()
    QEventLoop* m_connectLoop;
    bool m_connectCancelled;

    int m_connectTimeoutMs;
    int m_commandIntervalMs;
};

#endif // SESSIONCONNECTION_H
