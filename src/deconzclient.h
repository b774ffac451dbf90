#pragma once

#include <memory>

#include <QByteArray>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QPointer>
#include <QString>

#include "deconz_http.h"
#include "lightclient.h"

namespace deconzctl {

// Authorized client for a deCONZ REST API.
class DeconzClient final : public LightClient
{
public:
    // Builds a client from an existing API key. The key is not validated.
    static std::unique_ptr<DeconzClient> loginWithToken(const QString &url,
                                                        const QString &token,
                                                        QString *error = nullptr);

    explicit DeconzClient(const ConnectionSettings &settings);
    ~DeconzClient() override;

    bool lightList(QVector<Light> *out, ClientError *error = nullptr) override;
    bool setOnState(const Light &light, bool on, ClientError *error = nullptr) override;
    bool setLightColor(const Light &light,
                       std::optional<std::uint16_t> hue,
                       std::optional<std::uint8_t> bri,
                       std::optional<std::uint8_t> sat,
                       ClientError *error = nullptr) override;
    bool lightState(const Light &light, LightState *out, ClientError *error = nullptr) override;
    bool queueLightColor(const Light &light,
                         std::optional<std::uint16_t> hue,
                         std::optional<std::uint8_t> bri,
                         std::optional<std::uint8_t> sat,
                         ClientError *error = nullptr) override;
    void cancelQueuedColor() override;

    const ConnectionSettings &settings() const { return m_settings; }
    const QString &apiKey() const { return m_settings.apiKey; }

    int timeoutMs() const { return m_timeoutMs; }
    void setTimeoutMs(int timeoutMs);

private:
    QString lightsPath() const;
    QString lightPath(const Light &light) const;
    QString statePath(const Light &light) const;

    bool putState(const Light &light, const QByteArray &payload, ClientError *error);
    bool sendPreview(const QString &path, const QByteArray &payload, QString *error);
    void onPreviewFinished(QNetworkReply *reply);

    QNetworkAccessManager m_network;
    HttpClient m_http;
    ConnectionSettings m_settings;
    int m_timeoutMs = 10000;

    // At most one preview PUT is in flight; newer colors replace the queued one.
    QPointer<QNetworkReply> m_previewReply;
    QString m_queuedPreviewPath;
    QByteArray m_queuedPreviewPayload;
};

} // namespace deconzctl
