#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include <QColor>
#include <QObject>
#include <QVector>

#include "lightclient.h"

namespace deconzctl {

class LightSession : public QObject
{
    Q_OBJECT
public:
    explicit LightSession(std::unique_ptr<LightClient> client, QObject *parent = nullptr);
    ~LightSession() override;

    bool reload();
    bool select(std::uint32_t id);
    bool refreshSelected();

    bool toggleSelected();
    bool setSelectedOn(bool on);
    bool setSelectedBrightness(int bri);
    bool applyColor(const QColor &color);

    // Color picker flow: begin returns the color to start from, previews are
    // sent while picking, finish applies the choice or restores the start
    // color if anything was previewed.
    QColor beginColorEdit();
    bool previewColor(const QColor &color);
    bool finishColorEdit(bool accepted, const QColor &chosen = QColor());

    const QVector<Light> &lights() const { return m_lights; }
    std::optional<Light> selectedLight() const { return m_selected; }
    std::optional<LightState> selectedState() const { return m_state; }
    LightClient *client() const { return m_client.get(); }

signals:
    void lightsChanged();
    void selectionChanged();
    void stateChanged();
    void errorOccurred(const QString &message);

private:
    bool requireSelection();
    bool report(const QString &action, const ClientError &error);

    std::unique_ptr<LightClient> m_client;
    QVector<Light> m_lights;
    std::optional<Light> m_selected;
    std::optional<LightState> m_state;
    QColor m_editOrigin;
    bool m_previewSent = false;
};

} // namespace deconzctl
