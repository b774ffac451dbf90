#include "lightlistmodel.h"

namespace deconzctl {

LightListModel::LightListModel(QObject *parent)
    : QAbstractListModel(parent)
{
}

void LightListModel::setLights(const QVector<Light> &lights)
{
    beginResetModel();
    m_lights = lights;
    endResetModel();
}

int LightListModel::rowForId(std::uint32_t id) const
{
    for (int row = 0; row < m_lights.size(); ++row) {
        if (m_lights.at(row).id == id)
            return row;
    }
    return -1;
}

int LightListModel::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid())
        return 0;
    return m_lights.size();
}

QVariant LightListModel::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() < 0 || index.row() >= m_lights.size())
        return QVariant();

    const Light &light = m_lights.at(index.row());
    switch (role) {
    case Qt::DisplayRole:
        return light.name;
    case Qt::ToolTipRole:
        return QStringLiteral("Light %1").arg(light.id);
    case IdRole:
        return static_cast<uint>(light.id);
    default:
        return QVariant();
    }
}

QHash<int, QByteArray> LightListModel::roleNames() const
{
    QHash<int, QByteArray> roles = QAbstractListModel::roleNames();
    roles.insert(IdRole, QByteArrayLiteral("lightId"));
    return roles;
}

} // namespace deconzctl
