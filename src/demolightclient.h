#pragma once

#include <QMap>
#include <QTextStream>

#include "lightclient.h"

namespace deconzctl {

// Keeps light state in memory and writes the requests a real bridge
// would have received to the given stream.
class DemoLightClient final : public LightClient
{
public:
    DemoLightClient();
    explicit DemoLightClient(QTextStream *requestLog);

    bool lightList(QVector<Light> *out, ClientError *error = nullptr) override;
    bool setOnState(const Light &light, bool on, ClientError *error = nullptr) override;
    bool setLightColor(const Light &light,
                       std::optional<std::uint16_t> hue,
                       std::optional<std::uint8_t> bri,
                       std::optional<std::uint8_t> sat,
                       ClientError *error = nullptr) override;
    bool lightState(const Light &light, LightState *out, ClientError *error = nullptr) override;

    bool isDemo() const override { return true; }

private:
    struct Entry {
        Light light;
        LightState state;
    };

    void addLight(std::uint32_t id, const QString &name);
    Entry *find(const Light &light, ClientError *error);
    void logRequest(const char *method, const QString &path, const QByteArray &body = QByteArray());

    QMap<std::uint32_t, Entry> m_lights;
    QTextStream m_stdout;
    QTextStream *m_requestLog = nullptr;
};

} // namespace deconzctl
