#pragma once

#include <cstdint>
#include <optional>

#include <QByteArray>
#include <QColor>
#include <QString>
#include <QVector>

namespace deconzctl {

enum class ErrorKind {
    Http,
    IdParse,
    ResponseParse
};

struct ClientError {
    ErrorKind kind = ErrorKind::Http;
    QString message;
};

QString errorKindName(ErrorKind kind);

struct Light {
    QString name;
    std::uint32_t id = 0;
};

struct LightState {
    bool on = false;
    bool reachable = false;
    std::optional<std::uint16_t> hue;
    std::optional<std::uint8_t> bri;
    std::optional<std::uint8_t> sat;
};

// Color in bridge units: hue 0..65535, sat and bri 0..255.
struct HueSatBri {
    std::uint16_t hue = 0;
    std::uint8_t sat = 0;
    std::uint8_t bri = 255;
};

bool parseLightList(const QByteArray &payload, QVector<Light> *out, ClientError *error = nullptr);
bool parseLightState(const QByteArray &payload, LightState *out, ClientError *error = nullptr);

QByteArray buildOnStatePayload(bool on);
QByteArray buildColorPayload(std::optional<std::uint16_t> hue,
                             std::optional<std::uint8_t> bri,
                             std::optional<std::uint8_t> sat,
                             QString *error = nullptr);

// First error description of a bridge error array, empty when there is none.
QString bridgeErrorDescription(const QByteArray &payload);

HueSatBri colorToHueSatBri(const QColor &color);
QColor hueSatBriToColor(const HueSatBri &color);
HueSatBri displayColor(const LightState &state);

} // namespace deconzctl
