#include "demolightclient.h"

#include <cstdio>
#include <utility>

#include "deconz_log.h"

namespace deconzctl {

namespace {

const QString kDemoApiKey = QStringLiteral("demo");

} // namespace

DemoLightClient::DemoLightClient()
    : m_stdout(stdout, QIODevice::WriteOnly)
    , m_requestLog(&m_stdout)
{
    addLight(1, QStringLiteral("Bathroom light"));
    addLight(2, QStringLiteral("Outside lighting"));
    addLight(3, QStringLiteral("Studio lamp"));
}

DemoLightClient::DemoLightClient(QTextStream *requestLog)
    : DemoLightClient()
{
    if (requestLog)
        m_requestLog = requestLog;
}

void DemoLightClient::addLight(std::uint32_t id, const QString &name)
{
    Entry entry;
    entry.light.id = id;
    entry.light.name = name;
    entry.state.on = true;
    entry.state.reachable = true;
    entry.state.hue = 0;
    entry.state.bri = 255;
    entry.state.sat = 200;
    m_lights.insert(id, entry);
}

DemoLightClient::Entry *DemoLightClient::find(const Light &light, ClientError *error)
{
    auto it = m_lights.find(light.id);
    if (it != m_lights.end())
        return &it.value();

    if (error) {
        error->kind = ErrorKind::Http;
        error->message = QStringLiteral("resource, /lights/%1, not available").arg(light.id);
    }
    return nullptr;
}

void DemoLightClient::logRequest(const char *method, const QString &path, const QByteArray &body)
{
    QTextStream &out = *m_requestLog;
    out << method << ' ' << path;
    if (!body.isEmpty())
        out << ' ' << QString::fromUtf8(body);
    out << Qt::endl;
}

bool DemoLightClient::lightList(QVector<Light> *out, ClientError *error)
{
    Q_UNUSED(error);
    logRequest("GET", QStringLiteral("/api/%1/lights").arg(kDemoApiKey));

    if (out) {
        out->clear();
        for (const Entry &entry : std::as_const(m_lights))
            out->append(entry.light);
    }
    return true;
}

bool DemoLightClient::setOnState(const Light &light, bool on, ClientError *error)
{
    Entry *entry = find(light, error);
    if (!entry)
        return false;

    logRequest("PUT",
               QStringLiteral("/api/%1/lights/%2/state").arg(kDemoApiKey).arg(light.id),
               buildOnStatePayload(on));
    entry->state.on = on;
    return true;
}

bool DemoLightClient::setLightColor(const Light &light,
                                    std::optional<std::uint16_t> hue,
                                    std::optional<std::uint8_t> bri,
                                    std::optional<std::uint8_t> sat,
                                    ClientError *error)
{
    Entry *entry = find(light, error);
    if (!entry)
        return false;

    QString payloadError;
    const QByteArray payload = buildColorPayload(hue, bri, sat, &payloadError);
    if (payload.isEmpty()) {
        if (error) {
            error->kind = ErrorKind::Http;
            error->message = payloadError;
        }
        return false;
    }

    logRequest("PUT", QStringLiteral("/api/%1/lights/%2/state").arg(kDemoApiKey).arg(light.id), payload);
    if (hue)
        entry->state.hue = hue;
    if (bri)
        entry->state.bri = bri;
    if (sat)
        entry->state.sat = sat;
    return true;
}

bool DemoLightClient::lightState(const Light &light, LightState *out, ClientError *error)
{
    Entry *entry = find(light, error);
    if (!entry)
        return false;

    qCInfo(clientLog) << "Loading light state for light id" << light.id;
    logRequest("GET", QStringLiteral("/api/%1/lights/%2").arg(kDemoApiKey).arg(light.id));
    if (out)
        *out = entry->state;
    return true;
}

} // namespace deconzctl
