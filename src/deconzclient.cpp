#include "deconzclient.h"

#include <QEventLoop>
#include <QTimer>

#include "deconz_log.h"

namespace deconzctl {

namespace {

bool httpFailure(const HttpResult &result, const QString &fallback, ClientError *error)
{
    if (!error)
        return false;

    error->kind = ErrorKind::Http;
    error->message = bridgeErrorDescription(result.payload);
    if (error->message.isEmpty())
        error->message = result.error.isEmpty() ? fallback : result.error;
    return false;
}

} // namespace

std::unique_ptr<DeconzClient> DeconzClient::loginWithToken(const QString &url,
                                                           const QString &token,
                                                           QString *error)
{
    ConnectionSettings settings;
    if (!ConnectionSettings::fromUrl(url, &settings, error))
        return nullptr;

    settings.apiKey = token.trimmed();
    if (settings.apiKey.isEmpty()) {
        if (error)
            *error = QStringLiteral("API key is empty");
        return nullptr;
    }

    qCInfo(clientLog) << "Using deCONZ bridge at" << settings.toUrl();
    return std::make_unique<DeconzClient>(settings);
}

DeconzClient::DeconzClient(const ConnectionSettings &settings)
    : m_http(&m_network)
    , m_settings(settings)
{
}

DeconzClient::~DeconzClient()
{
    m_queuedPreviewPath.clear();
    m_queuedPreviewPayload.clear();
    if (m_previewReply && m_previewReply->isRunning())
        m_previewReply->abort();
}

void DeconzClient::setTimeoutMs(int timeoutMs)
{
    if (timeoutMs > 0)
        m_timeoutMs = timeoutMs;
}

QString DeconzClient::lightsPath() const
{
    return QStringLiteral("/api/%1/lights").arg(m_settings.apiKey);
}

QString DeconzClient::lightPath(const Light &light) const
{
    return lightsPath() + QLatin1Char('/') + QString::number(light.id);
}

QString DeconzClient::statePath(const Light &light) const
{
    return lightPath(light) + QStringLiteral("/state");
}

bool DeconzClient::lightList(QVector<Light> *out, ClientError *error)
{
    const HttpResult result = m_http.get(m_settings, lightsPath(), m_timeoutMs);
    if (!result.ok)
        return httpFailure(result, QStringLiteral("Failed to load light list"), error);

    return parseLightList(result.payload, out, error);
}

bool DeconzClient::setOnState(const Light &light, bool on, ClientError *error)
{
    qCDebug(clientLog) << "Switching light" << light.id << (on ? "on" : "off");
    return putState(light, buildOnStatePayload(on), error);
}

bool DeconzClient::setLightColor(const Light &light,
                                 std::optional<std::uint16_t> hue,
                                 std::optional<std::uint8_t> bri,
                                 std::optional<std::uint8_t> sat,
                                 ClientError *error)
{
    QString payloadError;
    const QByteArray payload = buildColorPayload(hue, bri, sat, &payloadError);
    if (payload.isEmpty()) {
        if (error) {
            error->kind = ErrorKind::Http;
            error->message = payloadError;
        }
        return false;
    }

    return putState(light, payload, error);
}

bool DeconzClient::queueLightColor(const Light &light,
                                   std::optional<std::uint16_t> hue,
                                   std::optional<std::uint8_t> bri,
                                   std::optional<std::uint8_t> sat,
                                   ClientError *error)
{
    QString sendError;
    const QByteArray payload = buildColorPayload(hue, bri, sat, &sendError);
    if (payload.isEmpty()) {
        if (error) {
            error->kind = ErrorKind::Http;
            error->message = sendError;
        }
        return false;
    }

    if (m_previewReply && m_previewReply->isRunning()) {
        m_queuedPreviewPath = statePath(light);
        m_queuedPreviewPayload = payload;
        return true;
    }

    if (!sendPreview(statePath(light), payload, &sendError)) {
        if (error) {
            error->kind = ErrorKind::Http;
            error->message = sendError;
        }
        return false;
    }
    return true;
}

bool DeconzClient::sendPreview(const QString &path, const QByteArray &payload, QString *error)
{
    QNetworkReply *reply = m_http.putJsonAsync(m_settings, path, payload, error);
    if (!reply)
        return false;

    m_previewReply = reply;
    QObject::connect(reply, &QNetworkReply::finished, reply, [this, reply]() {
        onPreviewFinished(reply);
    });
    return true;
}

void DeconzClient::onPreviewFinished(QNetworkReply *reply)
{
    if (m_previewReply == reply)
        m_previewReply.clear();
    if (m_queuedPreviewPayload.isEmpty())
        return;

    const QString path = m_queuedPreviewPath;
    const QByteArray payload = m_queuedPreviewPayload;
    m_queuedPreviewPath.clear();
    m_queuedPreviewPayload.clear();

    QString error;
    if (!sendPreview(path, payload, &error))
        qCWarning(clientLog) << "Failed to send queued color:" << error;
}

void DeconzClient::cancelQueuedColor()
{
    m_queuedPreviewPath.clear();
    m_queuedPreviewPayload.clear();

    if (!m_previewReply || !m_previewReply->isRunning())
        return;

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    QObject::connect(m_previewReply.data(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
    timer.start(m_timeoutMs);
    loop.exec();

    if (m_previewReply && m_previewReply->isRunning()) {
        qCDebug(clientLog) << "Aborting color preview still in flight";
        m_previewReply->abort();
    }
    m_previewReply.clear();
}

bool DeconzClient::lightState(const Light &light, LightState *out, ClientError *error)
{
    qCInfo(clientLog) << "Loading light state for light id" << light.id;

    const HttpResult result = m_http.get(m_settings, lightPath(light), m_timeoutMs);
    if (!result.ok)
        return httpFailure(result, QStringLiteral("Failed to load light state"), error);

    return parseLightState(result.payload, out, error);
}

bool DeconzClient::putState(const Light &light, const QByteArray &payload, ClientError *error)
{
    const HttpResult result = m_http.putJson(m_settings, statePath(light), payload, m_timeoutMs);
    if (!result.ok)
        return httpFailure(result, QStringLiteral("Light command failed"), error);

    // deCONZ may answer 200 with an error array for rejected attributes.
    const QString bridgeError = bridgeErrorDescription(result.payload);
    if (!bridgeError.isEmpty()) {
        if (error) {
            error->kind = ErrorKind::Http;
            error->message = bridgeError;
        }
        return false;
    }

    return true;
}

} // namespace deconzctl
