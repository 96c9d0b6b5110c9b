#pragma once

#include <QJsonObject>
#include <QString>
#include <QVector>

namespace phicore::refoss::ipc {

enum class DeviceModel {
    Unknown,
    Em01p,
    Em06p,
    Em16p
};

struct ChannelInfo {
    int id = 0;
    QString label;
};

QVector<ChannelInfo> channelsForModel(DeviceModel model);
QVector<int> channelIdsForModel(DeviceModel model);
QString channelLabel(DeviceModel model, int channelId);

DeviceModel modelFromString(const QString &text);
DeviceModel modelFromDeviceInfo(const QJsonObject &info);
// Smallest model that has a channel with this id.
DeviceModel modelForHighestChannel(int channelId);
QString modelName(DeviceModel model);
QString modelKey(DeviceModel model);

// Upper-case MAC without separators; falls back to the host with dots removed.
QString identityFromMac(const QString &mac, const QString &fallbackHost = {});

} // namespace phicore::refoss::ipc
