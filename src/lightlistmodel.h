#pragma once

#include <QAbstractListModel>
#include <QVector>

#include "deconz_model.h"

namespace deconzctl {

class LightListModel : public QAbstractListModel
{
    Q_OBJECT
public:
    enum Roles {
        IdRole = Qt::UserRole + 1
    };

    explicit LightListModel(QObject *parent = nullptr);

    void setLights(const QVector<Light> &lights);
    const QVector<Light> &lights() const { return m_lights; }
    int rowForId(std::uint32_t id) const;

    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    QHash<int, QByteArray> roleNames() const override;

private:
    QVector<Light> m_lights;
};

} // namespace deconzctl
