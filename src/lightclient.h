#pragma once

#include <cstdint>
#include <optional>

#include <QVector>

#include "deconz_model.h"

namespace deconzctl {

class LightClient
{
public:
    virtual ~LightClient() = default;

    virtual bool lightList(QVector<Light> *out, ClientError *error = nullptr) = 0;

    virtual bool setOnState(const Light &light, bool on, ClientError *error = nullptr) = 0;

    // Absent components are left unchanged on the light.
    virtual bool setLightColor(const Light &light,
                               std::optional<std::uint16_t> hue,
                               std::optional<std::uint8_t> bri,
                               std::optional<std::uint8_t> sat,
                               ClientError *error = nullptr) = 0;

    virtual bool lightState(const Light &light, LightState *out, ClientError *error = nullptr) = 0;

    // Fire-and-forget variant used while the color picker is dragged.
    virtual bool queueLightColor(const Light &light,
                                 std::optional<std::uint16_t> hue,
                                 std::optional<std::uint8_t> bri,
                                 std::optional<std::uint8_t> sat,
                                 ClientError *error = nullptr)
    {
        return setLightColor(light, hue, bri, sat, error);
    }

    // Drops queued colors and waits for the one in flight, so a following
    // setLightColor is the last write the light sees.
    virtual void cancelQueuedColor() {}

    virtual bool isDemo() const { return false; }
};

} // namespace deconzctl
