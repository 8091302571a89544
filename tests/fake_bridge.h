#pragma once

#include <QHash>
#include <QList>
#include <QSet>
#include <QTcpServer>
#include <QTcpSocket>

namespace lumactl::testing {

// Minimal HTTP/1.1 responder standing in for a Hue bridge on localhost.
class FakeBridge : public QObject
{
    Q_OBJECT
public:
    struct Request {
        QByteArray method;
        QByteArray path;
        QByteArray appKey;
        QByteArray body;
    };

    explicit FakeBridge(QObject *parent = nullptr) : QObject(parent)
    {
        connect(&m_server, &QTcpServer::newConnection, this, &FakeBridge::onNewConnection);
    }

    bool listen() { return m_server.listen(QHostAddress::LocalHost, 0); }
    int port() const { return m_server.serverPort(); }

    void setResponse(const QByteArray &path, const QByteArray &body, int status = 200)
    {
        m_responses.insert(path, qMakePair(status, body));
    }

    // Requests for a held path are recorded but never answered.
    void holdPath(const QByteArray &path) { m_held.insert(path); }

    QList<Request> requests;

private slots:
    void onNewConnection()
    {
        while (QTcpSocket *socket = m_server.nextPendingConnection()) {
            connect(socket, &QTcpSocket::readyRead, this, [this, socket]() { onReadyRead(socket); });
            connect(socket, &QTcpSocket::disconnected, socket, &QObject::deleteLater);
        }
    }

private:
    void onReadyRead(QTcpSocket *socket)
    {
        QByteArray &buffer = m_buffers[socket];
        buffer.append(socket->readAll());

        const int headerEnd = buffer.indexOf("\r\n\r\n");
        if (headerEnd < 0)
            return;

        const QList<QByteArray> lines = buffer.left(headerEnd).split('\n');
        int contentLength = 0;
        QByteArray appKey;
        for (const QByteArray &raw : lines) {
            const QByteArray line = raw.trimmed();
            const int colon = line.indexOf(':');
            if (colon < 0)
                continue;
            const QByteArray name = line.left(colon).trimmed().toLower();
            const QByteArray value = line.mid(colon + 1).trimmed();
            if (name == "content-length")
                contentLength = value.toInt();
            else if (name == "hue-application-key")
                appKey = value;
        }

        if (buffer.size() < headerEnd + 4 + contentLength)
            return;

        const QList<QByteArray> requestLine = lines.first().trimmed().split(' ');
        Request request;
        request.method = requestLine.value(0);
        request.path = requestLine.value(1);
        request.appKey = appKey;
        request.body = buffer.mid(headerEnd + 4, contentLength);
        requests.append(request);
        m_buffers.remove(socket);
        if (m_held.contains(request.path))
            return;

        const auto response = m_responses.value(request.path, qMakePair(404, QByteArray(R"({"errors":[{"description":"not found"}]})")));
        QByteArray reply = "HTTP/1.1 " + QByteArray::number(response.first) + " OK\r\n";
        reply += "Content-Type: application/json\r\n";
        reply += "Content-Length: " + QByteArray::number(response.second.size()) + "\r\n";
        reply += "Connection: close\r\n\r\n";
        reply += response.second;
        socket->write(reply);
        socket->disconnectFromHost();
    }

    QTcpServer m_server;
    QHash<QTcpSocket *, QByteArray> m_buffers;
    QHash<QByteArray, QPair<int, QByteArray>> m_responses;
    QSet<QByteArray> m_held;
};

} // namespace lumactl::testing
