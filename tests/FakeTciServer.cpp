/*
 * FakeTciServer.cpp
 *
 * In-process control endpoints for the session tests
 * Part of SWL View
 */

#include "FakeTciServer.h"
#include <QWebSocket>
#include <QWebSocketServer>
#include <QTcpServer>
#include <QTcpSocket>
#include <QHostAddress>

FakeTciServer::FakeTciServer(QObject* parent)
    : QObject(parent)
    , m_server(new QWebSocketServer("FakeTci", QWebSocketServer::NonSecureMode, this))
{
    connect(m_server, &QWebSocketServer::newConnection,
            this, &FakeTciServer::onNewConnection);
}

FakeTciServer::~FakeTciServer()
{
    closeClients();
    m_server->close();
}

bool FakeTciServer::listen()
{
    return m_server->listen(QHostAddress::LocalHost, 0);
}

quint16 FakeTciServer::port() const
{
    return m_server->serverPort();
}

void FakeTciServer::sendToClients(const QString& frame)
{
    for (QWebSocket* client : m_clients) {
        client->sendTextMessage(frame);
    }
}

void FakeTciServer::closeClients()
{
    const QList<QWebSocket*> clients = m_clients;
    m_clients.clear();
    for (QWebSocket* client : clients) {
        client->disconnect(this);
        client->close();
        client->deleteLater();
    }
}

void FakeTciServer::onNewConnection()
{
    while (m_server->hasPendingConnections()) {
        QWebSocket* client = m_server->nextPendingConnection();
        m_clients.append(client);

        connect(client, &QWebSocket::textMessageReceived, this, [this](const QString& frame) {
            m_frames.append(frame);
        });
        connect(client, &QWebSocket::disconnected, this, [this, client]() {
            m_clients.removeAll(client);
            client->deleteLater();
        });

        if (!m_greeting.isEmpty()) {
            client->sendTextMessage(m_greeting);
        }
    }
}

RejectingEndpoint::RejectingEndpoint(QObject* parent)
    : QObject(parent)
    , m_server(new QTcpServer(this))
{
    connect(m_server, &QTcpServer::newConnection,
            this, &RejectingEndpoint::onNewConnection);
}

bool RejectingEndpoint::listen()
{
    return m_server->listen(QHostAddress::LocalHost, 0);
}

quint16 RejectingEndpoint::port() const
{
    return m_server->serverPort();
}

void RejectingEndpoint::onNewConnection()
{
    while (m_server->hasPendingConnections()) {
        QTcpSocket* socket = m_server->nextPendingConnection();
        connect(socket, &QTcpSocket::disconnected, socket, &QObject::deleteLater);
        connect(socket, &QTcpSocket::readyRead, socket, [socket]() {
            // Wait for the end of the upgrade request headers
            if (!socket->peek(socket->bytesAvailable()).contains("\r\n\r\n")) {
                return;
            }
            socket->readAll();
            socket->write("HTTP/1.1 403 Forbidden\r\n"
                          "Content-Length: 0\r\n"
                          "Connection: close\r\n\r\n");
            socket->disconnectFromHost();
        });
    }
}

quint16 unusedLocalPort()
{
    QTcpServer server;
    if (!server.listen(QHostAddress::LocalHost, 0)) {
        return 0;
    }
    quint16 port = server.serverPort();
    server.close();
    return port;
}
