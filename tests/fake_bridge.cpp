#include "fake_bridge.h"

#include <QCoreApplication>
#include <QElapsedTimer>
#include <QHostAddress>
#include <QTcpSocket>

namespace deconzctl::test {

namespace {

QString routeKey(const QByteArray &method, const QString &path)
{
    return QString::fromLatin1(method) + QLatin1Char(' ') + path;
}

QByteArray reasonPhrase(int status)
{
    switch (status) {
    case 200:
        return "OK";
    case 400:
        return "Bad Request";
    case 403:
        return "Forbidden";
    case 404:
        return "Not Found";
    default:
        return "Status";
    }
}

} // namespace

FakeBridge::FakeBridge()
{
    QObject::connect(&m_server, &QTcpServer::newConnection, &m_server, [this]() {
        while (QTcpSocket *socket = m_server.nextPendingConnection()) {
            QObject::connect(socket, &QTcpSocket::readyRead, socket, [this, socket]() {
                onReadyRead(socket);
            });
            QObject::connect(socket, &QTcpSocket::disconnected, socket, [this, socket]() {
                m_buffers.remove(socket);
                socket->deleteLater();
            });
        }
    });
}

FakeBridge::~FakeBridge()
{
    m_server.close();
}

bool FakeBridge::start()
{
    return m_server.listen(QHostAddress::LocalHost, 0);
}

quint16 FakeBridge::port() const
{
    return m_server.serverPort();
}

QString FakeBridge::url() const
{
    return QStringLiteral("http://127.0.0.1:%1/").arg(port());
}

void FakeBridge::setResponse(const QByteArray &method, const QString &path, int status, const QByteArray &body)
{
    m_routes.insert(routeKey(method, path), qMakePair(status, body));
}

bool FakeBridge::waitForRequests(int count, int timeoutMs)
{
    QElapsedTimer elapsed;
    elapsed.start();
    while (m_requests.size() < count && elapsed.elapsed() < timeoutMs)
        QCoreApplication::processEvents(QEventLoop::AllEvents, 20);
    return m_requests.size() >= count;
}

void FakeBridge::onReadyRead(QTcpSocket *socket)
{
    QByteArray &buffer = m_buffers[socket];
    buffer.append(socket->readAll());

    const int headerEnd = buffer.indexOf("\r\n\r\n");
    if (headerEnd < 0)
        return;

    const QList<QByteArray> lines = buffer.left(headerEnd).split('\n');
    const QList<QByteArray> requestLine = lines.value(0).trimmed().split(' ');
    int contentLength = 0;
    for (const QByteArray &line : lines) {
        const int colon = line.indexOf(':');
        if (colon > 0 && line.left(colon).trimmed().toLower() == "content-length")
            contentLength = line.mid(colon + 1).trimmed().toInt();
    }

    const int bodyStart = headerEnd + 4;
    if (buffer.size() < bodyStart + contentLength)
        return;

    Request request;
    request.method = requestLine.value(0);
    request.path = QString::fromLatin1(requestLine.value(1));
    request.body = buffer.mid(bodyStart, contentLength);
    buffer.clear();
    m_requests.append(request);

    if (!m_silent)
        respond(socket, request);
}

void FakeBridge::respond(QTcpSocket *socket, const Request &request)
{
    const auto route = m_routes.constFind(routeKey(request.method, request.path));
    const int status = route != m_routes.constEnd() ? route->first : 404;
    const QByteArray body = route != m_routes.constEnd()
        ? route->second
        : QByteArrayLiteral("[{\"error\":{\"type\":3,\"address\":\"\",\"description\":\"resource not available\"}}]");

    QByteArray response = "HTTP/1.1 " + QByteArray::number(status) + ' ' + reasonPhrase(status) + "\r\n";
    response += "Content-Type: application/json\r\n";
    response += "Content-Length: " + QByteArray::number(body.size()) + "\r\n";
    response += "Connection: close\r\n\r\n";
    response += body;

    socket->write(response);
    socket->disconnectFromHost();
}

} // namespace deconzctl::test
