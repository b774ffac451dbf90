#pragma once

#include <QByteArray>
#include <QHash>
#include <QPair>
#include <QString>
#include <QTcpServer>
#include <QVector>

class QTcpSocket;

namespace deconzctl::test {

// Minimal HTTP/1.1 responder on 127.0.0.1 with canned per-route answers.
class FakeBridge
{
public:
    struct Request {
        QByteArray method;
        QString path;
        QByteArray body;
    };

    FakeBridge();
    ~FakeBridge();

    bool start();
    quint16 port() const;
    QString url() const;

    void setResponse(const QByteArray &method, const QString &path, int status, const QByteArray &body);
    // Accepts connections but never answers.
    void setSilent(bool silent) { m_silent = silent; }

    const QVector<Request> &requests() const { return m_requests; }
    // Runs the event loop until at least count requests arrived or the timeout passed.
    bool waitForRequests(int count, int timeoutMs = 5000);

private:
    void onReadyRead(QTcpSocket *socket);
    void respond(QTcpSocket *socket, const Request &request);

    QTcpServer m_server;
    QHash<QString, QPair<int, QByteArray>> m_routes;
    QHash<QTcpSocket *, QByteArray> m_buffers;
    QVector<Request> m_requests;
    bool m_silent = false;
};

} // namespace deconzctl::test
