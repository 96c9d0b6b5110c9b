#include "refoss_probe.h"

#include <initializer_list>

#include "refoss_log.h"

namespace phicore::refoss::ipc {

namespace {

QString firstString(const QJsonObject &obj, std::initializer_list<const char *> keys)
{
    for (const char *key : keys) {
        const QString value = obj.value(QLatin1String(key)).toString().trimmed();
        if (!value.isEmpty())
            return value;
    }
    return {};
}

QString describeError(const RpcError &error)
{
    switch (error.kind) {
    case ErrorKind::AuthMissingCredentials:
        return QStringLiteral("Device requires a username and password");
    case ErrorKind::AuthBadCredentials:
        return QStringLiteral("Device rejected the username or password");
    case ErrorKind::TransportTimeout:
        return QStringLiteral("Device did not answer in time");
    default:
        break;
    }
    return error.message.isEmpty() ? QStringLiteral("Device probe failed") : error.message;
}

} // namespace

ProbeResult runProbe(RpcCaller &http, const ConnectionSettings &settings, int timeoutMs)
{
    ProbeResult out;

    if (settings.host.trimmed().isEmpty()) {
        out.error = QStringLiteral("Host must not be empty");
        return out;
    }

    ConnectionSettings probeSettings = settings;
    if (probeSettings.port <= 0)
        probeSettings.port = 80;

    const RpcResult info = http.call(probeSettings, QStringLiteral("Refoss.GetDeviceInfo"), {}, timeoutMs);
    if (!info.ok) {
        qCWarning(adapterLog).noquote() << "probe of" << probeSettings.host << "failed:" << info.error.toString();
        out.error = describeError(info.error);
        return out;
    }
    if (!info.value.isObject()) {
        out.error = QStringLiteral("Unexpected device info response");
        return out;
    }

    const QJsonObject device = info.value.toObject();
    out.identity = identityFromMac(firstString(device, {"mac", "mac_address"}), probeSettings.host);
    out.model = modelFromDeviceInfo(device);
    out.firmware = firstString(device, {"fw_ver", "fw", "firmware", "ver"});
    out.name = firstString(device, {"name"});
    if (out.name.isEmpty())
        out.name = QStringLiteral("%1 (%2)").arg(modelName(out.model), probeSettings.host.trimmed());

    out.ok = true;
    out.message = QStringLiteral("Device reachable: %1").arg(out.name);

    out.metaPatch.insert(QStringLiteral("identity"), out.identity);
    if (out.model != DeviceModel::Unknown)
        out.metaPatch.insert(QStringLiteral("model"), modelKey(out.model));
    if (!out.firmware.isEmpty())
        out.metaPatch.insert(QStringLiteral("firmware"), out.firmware);

    qCInfo(adapterLog).noquote() << "probe ok" << out.identity << modelKey(out.model) << out.firmware;
    return out;
}

} // namespace phicore::refoss::ipc
