#include "refoss_model.h"

#include <QRegularExpression>

namespace phicore::refoss::ipc {

QVector<ChannelInfo> channelsForModel(DeviceModel model)
{
    switch (model) {
    case DeviceModel::Em01p:
        return {{1, QStringLiteral("A1")}};
    case DeviceModel::Em06p:
        return {
            {1, QStringLiteral("A1")},
            {2, QStringLiteral("B1")},
            {3, QStringLiteral("C1")},
            {4, QStringLiteral("A2")},
            {5, QStringLiteral("B2")},
            {6, QStringLiteral("C2")},
        };
    case DeviceModel::Em16p: {
        // A1..A6, B1..B6, C1..C6
        QVector<ChannelInfo> out;
        const QString phases = QStringLiteral("ABC");
        for (int phase = 0; phase < phases.size(); ++phase) {
            for (int index = 1; index <= 6; ++index)
                out.append(ChannelInfo{phase * 6 + index, QStringLiteral("%1%2").arg(phases.at(phase)).arg(index)});
        }
        return out;
    }
    case DeviceModel::Unknown:
        break;
    }
    return {};
}

QVector<int> channelIdsForModel(DeviceModel model)
{
    QVector<int> ids;
    const QVector<ChannelInfo> channels = channelsForModel(model);
    for (const ChannelInfo &channel : channels)
        ids.append(channel.id);
    return ids;
}

QString channelLabel(DeviceModel model, int channelId)
{
    const QVector<ChannelInfo> channels = channelsForModel(model);
    for (const ChannelInfo &channel : channels) {
        if (channel.id == channelId)
            return channel.label;
    }
    return QStringLiteral("CH%1").arg(channelId);
}

DeviceModel modelFromString(const QString &text)
{
    const QString lower = text.trimmed().toLower();
    if (lower.contains(QLatin1String("em16p")) || lower.contains(QLatin1String("em16")))
        return DeviceModel::Em16p;
    if (lower.contains(QLatin1String("em06p")) || lower.contains(QLatin1String("em06")))
        return DeviceModel::Em06p;
    if (lower.contains(QLatin1String("em01p")) || lower.contains(QLatin1String("em01")))
        return DeviceModel::Em01p;
    return DeviceModel::Unknown;
}

DeviceModel modelFromDeviceInfo(const QJsonObject &info)
{
    static const char *const keys[] = {"model", "type", "dev_type", "app", "name"};
    for (const char *key : keys) {
        const DeviceModel model = modelFromString(info.value(QLatin1String(key)).toString());
        if (model != DeviceModel::Unknown)
            return model;
    }
    return DeviceModel::Unknown;
}

DeviceModel modelForHighestChannel(int channelId)
{
    if (channelId <= 0)
        return DeviceModel::Unknown;
    if (channelId == 1)
        return DeviceModel::Em01p;
    if (channelId <= 6)
        return DeviceModel::Em06p;
    if (channelId <= 18)
        return DeviceModel::Em16p;
    return DeviceModel::Unknown;
}

QString modelName(DeviceModel model)
{
    switch (model) {
    case DeviceModel::Em01p:
        return QStringLiteral("Refoss EM01P");
    case DeviceModel::Em06p:
        return QStringLiteral("Refoss EM06P");
    case DeviceModel::Em16p:
        return QStringLiteral("Refoss EM16P");
    case DeviceModel::Unknown:
        break;
    }
    return QStringLiteral("Refoss energy monitor");
}

QString modelKey(DeviceModel model)
{
    switch (model) {
    case DeviceModel::Em01p:
        return QStringLiteral("em01p");
    case DeviceModel::Em06p:
        return QStringLiteral("em06p");
    case DeviceModel::Em16p:
        return QStringLiteral("em16p");
    case DeviceModel::Unknown:
        break;
    }
    return {};
}

QString identityFromMac(const QString &mac, const QString &fallbackHost)
{
    static const QRegularExpression separators(QStringLiteral("[:\\-\\.\\s]"));
    QString identity = mac;
    identity.remove(separators);
    if (!identity.isEmpty())
        return identity.toUpper();

    QString host = fallbackHost.trimmed();
    host.remove(QLatin1Char('.'));
    return host.toUpper();
}

} // namespace phicore::refoss::ipc
