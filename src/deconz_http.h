#pragma once

#include <QByteArray>
#include <QString>
#include <QUrl>

class QNetworkAccessManager;
class QNetworkReply;
class QNetworkRequest;

namespace deconzctl {

struct ConnectionSettings {
    QString host;
    int port = 0;
    bool useTls = false;
    QString apiKey;

    // Accepts "http://host:port/", "https://host" or a bare "host[:port]".
    static bool fromUrl(const QString &text, ConnectionSettings *out, QString *error = nullptr);
    QString toUrl() const;
    int effectivePort() const;
};

struct HttpResult {
    bool ok = false;
    int statusCode = 0;
    QByteArray payload;
    QString error;
};

class HttpClient
{
public:
    explicit HttpClient(QNetworkAccessManager *manager);

    HttpResult get(const ConnectionSettings &settings,
                   const QString &path,
                   int timeoutMs = 10000) const;

    HttpResult postJson(const ConnectionSettings &settings,
                        const QString &path,
                        const QByteArray &payload,
                        int timeoutMs = 10000) const;

    HttpResult putJson(const ConnectionSettings &settings,
                       const QString &path,
                       const QByteArray &payload,
                       int timeoutMs = 10000) const;

    // Returns the pending reply, owned by the manager and deleted once it
    // finishes, or nullptr with *error set.
    QNetworkReply *putJsonAsync(const ConnectionSettings &settings,
                                const QString &path,
                                const QByteArray &payload,
                                QString *error = nullptr) const;

    static QUrl buildUrl(const ConnectionSettings &settings, const QString &path);

private:
    bool buildRequest(const ConnectionSettings &settings,
                      const QString &path,
                      bool hasJsonBody,
                      QNetworkRequest *request,
                      QString *error = nullptr) const;

    HttpResult request(const ConnectionSettings &settings,
                       const QByteArray &method,
                       const QString &path,
                       const QByteArray &payload,
                       int timeoutMs) const;

    QNetworkAccessManager *m_manager = nullptr;
};

} // namespace deconzctl
