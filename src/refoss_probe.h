#pragma once

#include <QJsonObject>
#include <QString>

#include "refoss_model.h"
#include "refoss_rpc.h"

namespace phicore::refoss::ipc {

struct ProbeResult {
    bool ok = false;
    QString error;
    QString message;
    QString identity;
    DeviceModel model = DeviceModel::Unknown;
    QString name;
    QString firmware;
    QJsonObject metaPatch;
};

ProbeResult runProbe(RpcCaller &http,
                     const ConnectionSettings &settings,
                     int timeoutMs = 10000);

} // namespace phicore::refoss::ipc
