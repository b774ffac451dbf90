#include "lightsession.h"

#include <algorithm>
#include <utility>

#include "deconz_log.h"

namespace deconzctl {

LightSession::LightSession(std::unique_ptr<LightClient> client, QObject *parent)
    : QObject(parent)
    , m_client(std::move(client))
{
}

LightSession::~LightSession() = default;

bool LightSession::report(const QString &action, const ClientError &error)
{
    const QString message = error.message.isEmpty()
        ? action
        : QStringLiteral("%1: %2").arg(action, error.message);
    qCWarning(clientLog).noquote() << message << QStringLiteral("[%1]").arg(errorKindName(error.kind));
    emit errorOccurred(message);
    return false;
}

bool LightSession::requireSelection()
{
    if (m_selected)
        return true;
    emit errorOccurred(QStringLiteral("No lamp selected"));
    return false;
}

bool LightSession::reload()
{
    if (!m_client)
        return false;

    QVector<Light> lights;
    ClientError error;
    if (!m_client->lightList(&lights, &error))
        return report(QStringLiteral("Failed to load lights"), error);

    m_lights = lights;
    qCDebug(clientLog) << "Loaded" << m_lights.size() << "lights";
    emit lightsChanged();

    if (m_selected) {
        const std::uint32_t selectedId = m_selected->id;
        const auto it = std::find_if(m_lights.cbegin(), m_lights.cend(), [selectedId](const Light &light) {
            return light.id == selectedId;
        });
        if (it == m_lights.cend()) {
            m_selected.reset();
            m_state.reset();
            emit selectionChanged();
            emit stateChanged();
        } else if (it->name != m_selected->name) {
            m_selected = *it;
            emit selectionChanged();
        }
    }
    return true;
}

bool LightSession::select(std::uint32_t id)
{
    if (id == 0) {
        if (!m_selected)
            return true;
        m_selected.reset();
        m_state.reset();
        emit selectionChanged();
        emit stateChanged();
        return true;
    }

    const auto it = std::find_if(m_lights.cbegin(), m_lights.cend(), [id](const Light &light) {
        return light.id == id;
    });
    if (it == m_lights.cend()) {
        emit errorOccurred(QStringLiteral("Unknown light %1").arg(id));
        return false;
    }

    qCDebug(clientLog) << "Light" << it->name << "was selected";
    m_selected = *it;
    m_state.reset();
    emit selectionChanged();
    return refreshSelected();
}

bool LightSession::refreshSelected()
{
    if (!m_client || !requireSelection())
        return false;

    LightState state;
    ClientError error;
    if (!m_client->lightState(*m_selected, &state, &error)) {
        m_state.reset();
        emit stateChanged();
        return report(QStringLiteral("Failed to load state of %1").arg(m_selected->name), error);
    }

    m_state = state;
    emit stateChanged();
    return true;
}

bool LightSession::toggleSelected()
{
    if (!m_client || !requireSelection())
        return false;

    LightState current;
    ClientError error;
    if (!m_client->lightState(*m_selected, &current, &error))
        return report(QStringLiteral("Failed to load state of %1").arg(m_selected->name), error);

    m_state = current;
    return setSelectedOn(!current.on);
}

bool LightSession::setSelectedOn(bool on)
{
    if (!m_client || !requireSelection())
        return false;

    ClientError error;
    if (!m_client->setOnState(*m_selected, on, &error))
        return report(QStringLiteral("Failed to switch %1").arg(m_selected->name), error);

    if (m_state)
        m_state->on = on;
    emit stateChanged();
    return true;
}

bool LightSession::setSelectedBrightness(int bri)
{
    if (!m_client || !requireSelection())
        return false;

    const auto value = static_cast<std::uint8_t>(std::clamp(bri, 0, 255));
    ClientError error;
    if (!m_client->setLightColor(*m_selected, std::nullopt, value, std::nullopt, &error))
        return report(QStringLiteral("Failed to dim %1").arg(m_selected->name), error);

    if (m_state)
        m_state->bri = value;
    emit stateChanged();
    return true;
}

bool LightSession::applyColor(const QColor &color)
{
    if (!m_client || !requireSelection())
        return false;
    if (!color.isValid()) {
        emit errorOccurred(QStringLiteral("Invalid color"));
        return false;
    }

    m_client->cancelQueuedColor();

    const HueSatBri hsb = colorToHueSatBri(color);
    ClientError error;
    if (!m_client->setLightColor(*m_selected, hsb.hue, hsb.bri, hsb.sat, &error))
        return report(QStringLiteral("Failed to change color of %1").arg(m_selected->name), error);

    if (m_state) {
        m_state->hue = hsb.hue;
        m_state->bri = hsb.bri;
        m_state->sat = hsb.sat;
    }
    emit stateChanged();
    return true;
}

QColor LightSession::beginColorEdit()
{
    m_previewSent = false;
    m_editOrigin = m_state ? hueSatBriToColor(displayColor(*m_state)) : hueSatBriToColor(HueSatBri());
    return m_editOrigin;
}

bool LightSession::previewColor(const QColor &color)
{
    if (!m_client || !m_selected || !color.isValid())
        return false;

    const HueSatBri hsb = colorToHueSatBri(color);
    ClientError error;
    if (!m_client->queueLightColor(*m_selected, hsb.hue, hsb.bri, hsb.sat, &error))
        return report(QStringLiteral("Failed to preview color"), error);
    m_previewSent = true;
    return true;
}

bool LightSession::finishColorEdit(bool accepted, const QColor &chosen)
{
    const bool previewed = m_previewSent;
    m_previewSent = false;

    if (accepted)
        return applyColor(chosen);
    if (previewed && m_editOrigin.isValid())
        return applyColor(m_editOrigin);

    if (m_client)
        m_client->cancelQueuedColor();
    return true;
}

} // namespace deconzctl
