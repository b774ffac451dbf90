#include "deconz_model.h"

#include <algorithm>
#include <cmath>

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>

namespace deconzctl {

namespace {

constexpr int kErrorUnauthorizedUser = 1;
constexpr double kHueUnitsPerDegree = 65535.0 / 360.0;

bool fail(ClientError *error, ErrorKind kind, const QString &message)
{
    if (error) {
        error->kind = kind;
        error->message = message;
    }
    return false;
}

bool isDecimalId(const QString &key)
{
    if (key.isEmpty())
        return false;
    return std::all_of(key.cbegin(), key.cend(), [](QChar c) {
        return c >= QLatin1Char('0') && c <= QLatin1Char('9');
    });
}

// Missing or null fields stay unset, numbers are clamped into [0, maxValue].
bool readOptionalNumber(const QJsonObject &obj, const QString &key, int maxValue,
                        std::optional<int> *out, ClientError *error)
{
    const QJsonValue value = obj.value(key);
    if (value.isUndefined() || value.isNull()) {
        out->reset();
        return true;
    }
    if (!value.isDouble())
        return fail(error, ErrorKind::ResponseParse, QStringLiteral("Field '%1' is not a number").arg(key));

    const double clamped = std::clamp(value.toDouble(), 0.0, static_cast<double>(maxValue));
    *out = static_cast<int>(std::lround(clamped));
    return true;
}

} // namespace

QString errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::Http:
        return QStringLiteral("http");
    case ErrorKind::IdParse:
        return QStringLiteral("id-parse");
    case ErrorKind::ResponseParse:
        return QStringLiteral("response-parse");
    }
    return QString();
}

QString bridgeErrorDescription(const QByteArray &payload)
{
    const QJsonDocument doc = QJsonDocument::fromJson(payload);
    if (!doc.isArray())
        return {};

    const QJsonArray arr = doc.array();
    for (const QJsonValue &value : arr) {
        if (!value.isObject())
            continue;
        const QJsonObject errObj = value.toObject().value(QStringLiteral("error")).toObject();
        if (errObj.isEmpty())
            continue;

        const int type = errObj.value(QStringLiteral("type")).toInt();
        const QString description = errObj.value(QStringLiteral("description")).toString().trimmed();
        if (type == kErrorUnauthorizedUser)
            return QStringLiteral("Unauthorized API key");
        if (!description.isEmpty())
            return description;
        return QStringLiteral("Bridge rejected the request (error type %1)").arg(type);
    }

    return {};
}

bool parseLightList(const QByteArray &payload, QVector<Light> *out, ClientError *error)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(payload, &parseError);
    if (parseError.error != QJsonParseError::NoError)
        return fail(error, ErrorKind::ResponseParse, parseError.errorString());

    if (doc.isArray()) {
        const QString description = bridgeErrorDescription(payload);
        return fail(error,
                    description.isEmpty() ? ErrorKind::ResponseParse : ErrorKind::Http,
                    description.isEmpty() ? QStringLiteral("Unexpected light list response") : description);
    }
    if (!doc.isObject())
        return fail(error, ErrorKind::ResponseParse, QStringLiteral("Unexpected light list response"));

    QVector<Light> lights;
    const QJsonObject root = doc.object();
    lights.reserve(root.size());
    for (auto it = root.constBegin(); it != root.constEnd(); ++it) {
        bool ok = false;
        const uint id = it.key().toUInt(&ok, 10);
        if (!isDecimalId(it.key()) || !ok)
            return fail(error, ErrorKind::IdParse, QStringLiteral("Invalid light id '%1'").arg(it.key()));

        const QJsonValue nameValue = it.value().toObject().value(QStringLiteral("name"));
        if (!it.value().isObject() || !nameValue.isString()) {
            return fail(error,
                        ErrorKind::ResponseParse,
                        QStringLiteral("Light %1 has no name").arg(it.key()));
        }

        Light light;
        light.id = id;
        light.name = nameValue.toString();
        lights.append(light);
    }

    std::sort(lights.begin(), lights.end(), [](const Light &a, const Light &b) {
        return a.id < b.id;
    });

    if (out)
        *out = lights;
    return true;
}

bool parseLightState(const QByteArray &payload, LightState *out, ClientError *error)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(payload, &parseError);
    if (parseError.error != QJsonParseError::NoError)
        return fail(error, ErrorKind::ResponseParse, parseError.errorString());
    if (!doc.isObject()) {
        const QString description = bridgeErrorDescription(payload);
        return fail(error,
                    ErrorKind::ResponseParse,
                    description.isEmpty() ? QStringLiteral("Unexpected light response") : description);
    }

    const QJsonValue stateValue = doc.object().value(QStringLiteral("state"));
    if (!stateValue.isObject())
        return fail(error, ErrorKind::ResponseParse, QStringLiteral("Light response has no state object"));
    const QJsonObject stateObj = stateValue.toObject();

    const QJsonValue onValue = stateObj.value(QStringLiteral("on"));
    const QJsonValue reachableValue = stateObj.value(QStringLiteral("reachable"));
    if (!onValue.isBool())
        return fail(error, ErrorKind::ResponseParse, QStringLiteral("Field 'on' is missing or not a bool"));
    if (!reachableValue.isBool())
        return fail(error, ErrorKind::ResponseParse, QStringLiteral("Field 'reachable' is missing or not a bool"));

    std::optional<int> hue;
    std::optional<int> bri;
    std::optional<int> sat;
    if (!readOptionalNumber(stateObj, QStringLiteral("hue"), 65535, &hue, error)
        || !readOptionalNumber(stateObj, QStringLiteral("bri"), 255, &bri, error)
        || !readOptionalNumber(stateObj, QStringLiteral("sat"), 255, &sat, error)) {
        return false;
    }

    LightState state;
    state.on = onValue.toBool();
    state.reachable = reachableValue.toBool();
    if (hue)
        state.hue = static_cast<std::uint16_t>(*hue);
    if (bri)
        state.bri = static_cast<std::uint8_t>(*bri);
    if (sat)
        state.sat = static_cast<std::uint8_t>(*sat);

    if (out)
        *out = state;
    return true;
}

QByteArray buildOnStatePayload(bool on)
{
    QJsonObject body;
    body.insert(QStringLiteral("on"), on);
    return QJsonDocument(body).toJson(QJsonDocument::Compact);
}

QByteArray buildColorPayload(std::optional<std::uint16_t> hue,
                             std::optional<std::uint8_t> bri,
                             std::optional<std::uint8_t> sat,
                             QString *error)
{
    QJsonObject body;
    if (hue)
        body.insert(QStringLiteral("hue"), static_cast<int>(*hue));
    if (bri)
        body.insert(QStringLiteral("bri"), static_cast<int>(*bri));
    if (sat)
        body.insert(QStringLiteral("sat"), static_cast<int>(*sat));

    if (body.isEmpty()) {
        if (error)
            *error = QStringLiteral("Empty color payload");
        return QByteArray();
    }

    if (error)
        error->clear();
    return QJsonDocument(body).toJson(QJsonDocument::Compact);
}

HueSatBri colorToHueSatBri(const QColor &color)
{
    const QColor hsv = color.toHsv();
    const int degrees = std::max(0, hsv.hsvHue());

    HueSatBri out;
    out.hue = static_cast<std::uint16_t>(std::clamp(std::lround(degrees * kHueUnitsPerDegree), 0L, 65535L));
    out.sat = static_cast<std::uint8_t>(std::clamp(hsv.hsvSaturation(), 0, 255));
    out.bri = static_cast<std::uint8_t>(std::clamp(hsv.value(), 0, 255));
    return out;
}

QColor hueSatBriToColor(const HueSatBri &color)
{
    const int degrees = static_cast<int>(std::lround(color.hue / kHueUnitsPerDegree)) % 360;
    return QColor::fromHsv(degrees, color.sat, color.bri);
}

HueSatBri displayColor(const LightState &state)
{
    HueSatBri out;
    out.hue = state.hue.value_or(0);
    out.sat = state.sat.value_or(0);
    out.bri = state.bri.value_or(255);
    return out;
}

} // namespace deconzctl
