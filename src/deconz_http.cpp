#include "deconz_http.h"

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#if QT_CONFIG(ssl)
#include <QSslConfiguration>
#include <QSslSocket>
#endif

#include "deconz_log.h"

namespace deconzctl {

namespace {

constexpr int kDefaultTimeoutMs = 10000;
constexpr int kPayloadSnippetBytes = 256;

void logFailure(const QUrl &url, const HttpResult &result)
{
    if (result.statusCode > 0) {
        qCWarning(httpLog) << "Bridge request failed:" << url.toString()
                           << "status:" << result.statusCode
                           << "error:" << result.error;
    } else {
        qCWarning(httpLog) << "Bridge request failed:" << url.toString()
                           << "error:" << result.error;
    }

    if (result.payload.isEmpty())
        return;

    const QByteArray snippet = result.payload.left(kPayloadSnippetBytes);
    QString payloadSnippet = QString::fromUtf8(snippet);
    if (result.payload.size() > snippet.size())
        payloadSnippet.append(QStringLiteral(" ..."));
    qCWarning(httpLog).noquote() << "Bridge response payload:" << payloadSnippet;
}

} // namespace

bool ConnectionSettings::fromUrl(const QString &text, ConnectionSettings *out, QString *error)
{
    QString trimmed = text.trimmed();
    if (trimmed.isEmpty()) {
        if (error)
            *error = QStringLiteral("Bridge URL is empty");
        return false;
    }

    if (!trimmed.contains(QStringLiteral("://")))
        trimmed.prepend(QStringLiteral("http://"));

    const QUrl url(trimmed, QUrl::StrictMode);
    const QString scheme = url.scheme().toLower();
    if (!url.isValid() || url.host().isEmpty()) {
        if (error)
            *error = QStringLiteral("Invalid bridge URL: %1").arg(text.trimmed());
        return false;
    }
    if (scheme != QLatin1String("http") && scheme != QLatin1String("https")) {
        if (error)
            *error = QStringLiteral("Unsupported URL scheme: %1").arg(url.scheme());
        return false;
    }

    if (out) {
        out->host = url.host();
        out->useTls = (scheme == QLatin1String("https"));
        out->port = url.port(0);
    }
    if (error)
        error->clear();
    return true;
}

QString ConnectionSettings::toUrl() const
{
    QUrl url;
    url.setScheme(useTls ? QStringLiteral("https") : QStringLiteral("http"));
    url.setHost(host.trimmed());
    if (port > 0)
        url.setPort(port);
    url.setPath(QStringLiteral("/"));
    return url.toString();
}

int ConnectionSettings::effectivePort() const
{
    if (port > 0)
        return port;
    return useTls ? 443 : 80;
}

HttpClient::HttpClient(QNetworkAccessManager *manager)
    : m_manager(manager)
{
}

QUrl HttpClient::buildUrl(const ConnectionSettings &settings, const QString &path)
{
    QUrl url;
    url.setScheme(settings.useTls ? QStringLiteral("https") : QStringLiteral("http"));
    url.setHost(settings.host.trimmed());
    url.setPort(settings.effectivePort());
    if (path.startsWith(QLatin1Char('/')))
        url.setPath(path);
    else
        url.setPath(QStringLiteral("/") + path);
    return url;
}

HttpResult HttpClient::get(const ConnectionSettings &settings,
                           const QString &path,
                           int timeoutMs) const
{
    return request(settings, QByteArrayLiteral("GET"), path, {}, timeoutMs);
}

HttpResult HttpClient::postJson(const ConnectionSettings &settings,
                                const QString &path,
                                const QByteArray &payload,
                                int timeoutMs) const
{
    return request(settings, QByteArrayLiteral("POST"), path, payload, timeoutMs);
}

HttpResult HttpClient::putJson(const ConnectionSettings &settings,
                               const QString &path,
                               const QByteArray &payload,
                               int timeoutMs) const
{
    return request(settings, QByteArrayLiteral("PUT"), path, payload, timeoutMs);
}

QNetworkReply *HttpClient::putJsonAsync(const ConnectionSettings &settings,
                                        const QString &path,
                                        const QByteArray &payload,
                                        QString *error) const
{
    if (!m_manager) {
        if (error)
            *error = QStringLiteral("Network manager unavailable");
        return nullptr;
    }

    QNetworkRequest request;
    if (!buildRequest(settings, path, true, &request, error))
        return nullptr;

    QNetworkReply *reply = m_manager->sendCustomRequest(request, QByteArrayLiteral("PUT"), payload);
    if (!reply) {
        if (error)
            *error = QStringLiteral("Failed to create network request");
        return nullptr;
    }

    const QUrl url = request.url();
    QObject::connect(reply, &QNetworkReply::finished, reply, [reply, url]() {
        if (reply->error() == QNetworkReply::OperationCanceledError) {
            qCDebug(httpLog) << "PUT (async) aborted:" << url.toString();
        } else if (reply->error() != QNetworkReply::NoError) {
            HttpResult result;
            result.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
            result.payload = reply->readAll();
            result.error = reply->errorString();
            logFailure(url, result);
        }
        reply->deleteLater();
    });

    qCDebug(httpLog) << "PUT (async)" << url.toString() << payload;
    if (error)
        error->clear();
    return reply;
}

bool HttpClient::buildRequest(const ConnectionSettings &settings,
                              const QString &path,
                              bool hasJsonBody,
                              QNetworkRequest *request,
                              QString *error) const
{
    if (!request) {
        if (error)
            *error = QStringLiteral("Request object is null");
        return false;
    }

    if (settings.host.trimmed().isEmpty()) {
        if (error)
            *error = QStringLiteral("Bridge host is empty");
        return false;
    }

    QNetworkRequest out(buildUrl(settings, path));
    out.setRawHeader("Accept", "application/json");
    out.setRawHeader("User-Agent", "deconz-control/1.0");
    if (hasJsonBody)
        out.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));

#if QT_CONFIG(ssl)
    if (settings.useTls) {
        QSslConfiguration ssl = QSslConfiguration::defaultConfiguration();
        ssl.setPeerVerifyMode(QSslSocket::VerifyNone);
        out.setSslConfiguration(ssl);
    }
#endif

    *request = out;
    if (error)
        error->clear();
    return true;
}

HttpResult HttpClient::request(const ConnectionSettings &settings,
                               const QByteArray &method,
                               const QString &path,
                               const QByteArray &payload,
                               int timeoutMs) const
{
    HttpResult result;

    if (!m_manager) {
        result.error = QStringLiteral("Network manager unavailable");
        return result;
    }

    QNetworkRequest requestObj;
    if (!buildRequest(settings, path, !payload.isEmpty(), &requestObj, &result.error))
        return result;

    qCDebug(httpLog) << method << requestObj.url().toString();

    QNetworkReply *reply = nullptr;
    if (method == QByteArrayLiteral("GET")) {
        reply = m_manager->get(requestObj);
    } else if (method == QByteArrayLiteral("POST")) {
        reply = m_manager->post(requestObj, payload);
    } else {
        reply = m_manager->sendCustomRequest(requestObj, method, payload);
    }

    if (!reply) {
        result.error = QStringLiteral("Failed to create network request");
        return result;
    }

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    bool timedOut = false;

    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timer, &QTimer::timeout, &loop, [&]() {
        timedOut = true;
        loop.quit();
    });

    timer.start(timeoutMs > 0 ? timeoutMs : kDefaultTimeoutMs);
    loop.exec();

    if (timedOut) {
        reply->abort();
        reply->deleteLater();
        result.error = QStringLiteral("Request timed out");
        logFailure(requestObj.url(), result);
        return result;
    }

    result.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    result.payload = reply->readAll();

    if (result.statusCode >= 200 && result.statusCode < 300 && reply->error() == QNetworkReply::NoError) {
        result.ok = true;
    } else if (result.statusCode > 0) {
        result.error = QStringLiteral("HTTP %1").arg(result.statusCode);
    } else {
        result.error = reply->errorString();
    }

    if (!result.ok)
        logFailure(requestObj.url(), result);

    reply->deleteLater();
    return result;
}

} // namespace deconzctl
