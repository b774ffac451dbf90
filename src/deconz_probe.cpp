#include "deconz_probe.h"

#include <QJsonDocument>
#include <QJsonObject>

#include "deconz_log.h"
#include "deconz_model.h"

namespace deconzctl {

ProbeResult checkCredentials(HttpClient &http, const ConnectionSettings &settings, int timeoutMs)
{
    ProbeResult out;

    if (settings.host.trimmed().isEmpty()) {
        out.error = QStringLiteral("Host must not be empty");
        return out;
    }
    if (settings.apiKey.trimmed().isEmpty()) {
        out.error = QStringLiteral("API key must not be empty");
        return out;
    }

    const HttpResult config = http.get(settings,
                                       QStringLiteral("/api/%1/config").arg(settings.apiKey.trimmed()),
                                       timeoutMs);
    const QString bridgeError = bridgeErrorDescription(config.payload);
    if (!config.ok || !bridgeError.isEmpty()) {
        out.error = bridgeError.isEmpty() ? config.error : bridgeError;
        if (out.error.isEmpty())
            out.error = QStringLiteral("Bridge rejected the API key");
        qCWarning(clientLog) << "Credential check failed:" << out.error;
        return out;
    }

    const QJsonDocument doc = QJsonDocument::fromJson(config.payload);
    if (!doc.isObject()) {
        out.error = QStringLiteral("Unexpected response from bridge");
        return out;
    }

    const QJsonObject root = doc.object();
    out.bridgeName = root.value(QStringLiteral("name")).toString().trimmed();
    out.apiVersion = root.value(QStringLiteral("apiversion")).toString().trimmed();

    out.ok = true;
    out.message = out.bridgeName.isEmpty()
        ? QStringLiteral("Bridge reachable and credentials valid")
        : QStringLiteral("Connected to %1").arg(out.bridgeName);
    return out;
}

} // namespace deconzctl
