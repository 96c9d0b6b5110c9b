#include "refoss_sidecar.h"

#include <algorithm>
#include <iostream>
#include <utility>

#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>

#include "refoss_log.h"
#include "refoss_probe.h"
#include "refoss_schema.h"

namespace phicore::refoss::ipc {

namespace {

namespace v1 = phicore::adapter::v1;
namespace sdk = phicore::adapter::sdk;

const QString kAvailableChannel = QStringLiteral("available");
const QString kTriggerPrefix = QStringLiteral("trigger.");

int readInt(const QJsonObject &obj, const QString &key, int fallback)
{
    if (!obj.contains(key))
        return fallback;
    bool ok = false;
    const int value = obj.value(key).toVariant().toInt(&ok);
    return ok ? value : fallback;
}

double readDouble(const QJsonObject &obj, const QString &key, double fallback)
{
    if (!obj.contains(key))
        return fallback;
    bool ok = false;
    const double value = obj.value(key).toVariant().toDouble(&ok);
    return ok ? value : fallback;
}

QString readString(const QJsonObject &obj, const QString &key, const QString &fallback = {})
{
    const QString value = obj.value(key).toString().trimmed();
    return value.isEmpty() ? fallback : value;
}

v1::Channel makeMeasurementChannel(const char *id,
                                   const QString &name,
                                   v1::ChannelKind kind,
                                   const v1::Utf8String &unit)
{
    v1::Channel channel;
    channel.externalId = id;
    channel.name = name.toStdString();
    channel.kind = kind;
    channel.dataType = v1::ChannelDataType::Float;
    channel.flags = v1::kChannelFlagDefaultRead;
    channel.unit = unit;
    return channel;
}

v1::Channel makeTriggerChannel(const char *kind, const QString &name)
{
    v1::Channel channel;
    channel.externalId = (kTriggerPrefix + QLatin1String(kind)).toStdString();
    channel.name = name.toStdString();
    channel.kind = v1::ChannelKind::Unknown;
    channel.dataType = v1::ChannelDataType::Float;
    channel.flags = v1::kChannelFlagDefaultRead;
    return channel;
}

QJsonObject paramsObject(const sdk::AdapterActionInvokeRequest &request)
{
    if (request.paramsJson.empty())
        return {};
    const QJsonDocument doc = QJsonDocument::fromJson(QByteArray::fromStdString(request.paramsJson));
    return doc.isObject() ? doc.object() : QJsonObject{};
}

} // namespace

RefossSidecar::DeviceHost::DeviceHost(RefossSidecar &owner,
                                      const v1::Device &device,
                                      const v1::ChannelList &channels,
                                      bool ownsConnectionState)
    : m_owner(owner)
    , m_device(device)
    , m_channels(channels)
    , m_ownsConnectionState(ownsConnectionState)
{
}

bool RefossSidecar::DeviceHost::setCapability(const QString &name, double value, QString *error)
{
    v1::Utf8String sendError;
    if (!m_owner.sendChannelStateUpdated(m_device.externalId, name.toStdString(), value, nowMs(), &sendError)) {
        if (error)
            *error = QString::fromStdString(sendError);
        return false;
    }
    return true;
}

bool RefossSidecar::DeviceHost::setAvailable(bool available, const QString &reason, QString *error)
{
    if (m_ownsConnectionState)
        m_owner.setConnectionState(available);
    if (!available && !reason.isEmpty())
        std::cerr << "refoss-ipc " << m_device.externalId << " unavailable: " << reason.toStdString() << '\n';

    v1::Utf8String sendError;
    if (!m_owner.sendChannelStateUpdated(m_device.externalId,
                                         kAvailableChannel.toStdString(),
                                         available,
                                         nowMs(),
                                         &sendError)) {
        if (error)
            *error = QString::fromStdString(sendError);
        return false;
    }
    return true;
}

bool RefossSidecar::DeviceHost::emitTrigger(const QString &kind, const QJsonObject &tokens, QString *error)
{
    // Every trigger carries exactly one numeric token.
    const QJsonValue token = tokens.isEmpty() ? QJsonValue() : *tokens.constBegin();
    if (!token.isDouble()) {
        if (error)
            *error = QStringLiteral("Trigger %1 has no numeric token").arg(kind);
        return false;
    }

    v1::Utf8String sendError;
    if (!m_owner.sendChannelStateUpdated(m_device.externalId,
                                         (kTriggerPrefix + kind).toStdString(),
                                         token.toDouble(),
                                         nowMs(),
                                         &sendError)) {
        if (error)
            *error = QString::fromStdString(sendError);
        return false;
    }
    return true;
}

bool RefossSidecar::DeviceHost::publish(QString *error)
{
    v1::Utf8String sendError;
    if (!m_owner.sendDeviceUpdated(m_device, m_channels, &sendError)) {
        if (error)
            *error = QString::fromStdString(sendError);
        return false;
    }
    return true;
}

void RefossSidecar::DeviceHost::rename(const QString &name)
{
    m_device.name = name.toStdString();
}

RefossSidecar::RefossSidecar()
    : m_http(&m_network)
{
    m_socket.setSource(QStringLiteral("phi-adapter-refoss"));
}

RefossSidecar::~RefossSidecar()
{
    shutdown();
}

void RefossSidecar::shutdown()
{
    stopEngine();
    if (m_push.isListening())
        m_push.close();
}

void RefossSidecar::tick()
{
    if (!m_hasBootstrap || m_coordinator)
        return;

    const std::int64_t now = nowMs();
    if (m_nextStartDueMs > now)
        return;

    QString error;
    if (!startEngine(&error)) {
        stopEngine();
        setConnectionState(false);
        if (!error.isEmpty()) {
            std::cerr << "refoss-ipc start failed: " << error.toStdString() << '\n';
            sendError(error.toStdString());
        }
        m_nextStartDueMs = now + std::max(1000, m_retryIntervalMs);
        return;
    }
}

void RefossSidecar::onConnected()
{
    std::cerr << "refoss-ipc connected" << '\n';
}

void RefossSidecar::onDisconnected()
{
    setConnectionState(false);
    std::cerr << "refoss-ipc disconnected" << '\n';
}

void RefossSidecar::onBootstrap(const sdk::BootstrapRequest &request)
{
    AdapterSidecar::onBootstrap(request);

    const Settings previous = m_settings;
    applyBootstrapAdapter(request.adapter);
    m_hasBootstrap = true;

    std::cerr << "refoss-ipc bootstrap adapterId=" << request.adapterId
              << " externalId=" << request.adapter.externalId
              << " host=" << m_settings.connection.host.toStdString()
              << " port=" << m_settings.connection.port
              << " model=" << modelKey(m_settings.model).toStdString()
              << '\n';

    if (!m_coordinator) {
        m_nextStartDueMs = 0;
        return;
    }

    const bool sameDevice = m_settings.identity == previous.identity
        && m_settings.model == previous.model
        && m_settings.channelIds == previous.channelIds
        && m_settings.webhookPort == previous.webhookPort;
    if (!sameDevice) {
        std::cerr << "refoss-ipc device layout changed, restarting" << '\n';
        stopEngine();
        m_nextStartDueMs = 0;
        return;
    }

    m_coordinator->applySettings(deviceConfig());
    for (const auto &consumer : m_consumers)
        consumer->setPricing(m_settings.electricityPrice, m_settings.currency);
}

phicore::adapter::v1::CmdResponse RefossSidecar::onChannelInvoke(const sdk::ChannelInvokeRequest &request)
{
    if (!m_hasBootstrap)
        return failureResponse(request.cmdId, CmdStatus::TemporarilyOffline, QStringLiteral("Adapter not bootstrapped"));
    return failureResponse(request.cmdId,
                           CmdStatus::NotImplemented,
                           QStringLiteral("Energy monitor channels are read-only"));
}

phicore::adapter::v1::ActionResponse RefossSidecar::onAdapterActionInvoke(const sdk::AdapterActionInvokeRequest &request)
{
    const QString actionId = QString::fromStdString(request.actionId);
    if (actionId == QLatin1String("probe"))
        return invokeProbe(request);
    if (actionId == QLatin1String("refresh"))
        return invokeRefresh(request);
    if (actionId == QLatin1String("resubscribe"))
        return invokeResubscribe(request);

    ActionResponse resp;
    resp.id = request.cmdId;
    resp.status = CmdStatus::NotImplemented;
    resp.error = "Unsupported adapter action";
    resp.tsMs = nowMs();
    return resp;
}

phicore::adapter::v1::CmdResponse RefossSidecar::onDeviceNameUpdate(const sdk::DeviceNameUpdateRequest &request)
{
    if (request.deviceExternalId.empty())
        return failureResponse(request.cmdId, CmdStatus::InvalidArgument, QStringLiteral("deviceExternalId missing"));
    if (request.name.empty())
        return failureResponse(request.cmdId, CmdStatus::InvalidArgument, QStringLiteral("name missing"));

    const QString deviceExternalId = QString::fromStdString(request.deviceExternalId);
    DeviceHost *target = nullptr;
    if (m_mainHost && m_mainHost->externalId() == deviceExternalId)
        target = m_mainHost.get();
    for (const auto &host : m_channelHosts) {
        if (!target && host->externalId() == deviceExternalId)
            target = host.get();
    }
    if (!target)
        return failureResponse(request.cmdId, CmdStatus::InvalidArgument, QStringLiteral("Unknown device"));

    // The device firmware has no per-channel names; the name is kept host side.
    target->rename(QString::fromStdString(request.name));
    QString error;
    if (!target->publish(&error))
        return failureResponse(request.cmdId, CmdStatus::Failure, error);

    return successResponse(request.cmdId);
}

phicore::adapter::v1::CmdResponse RefossSidecar::onSceneInvoke(const sdk::SceneInvokeRequest &request)
{
    return failureResponse(request.cmdId, CmdStatus::NotImplemented, QStringLiteral("Scenes are not supported"));
}

phicore::adapter::v1::Utf8String RefossSidecar::displayName() const
{
    return phicore::refoss::ipc::displayName();
}

phicore::adapter::v1::Utf8String RefossSidecar::description() const
{
    return phicore::refoss::ipc::description();
}

phicore::adapter::v1::Utf8String RefossSidecar::iconSvg() const
{
    return phicore::refoss::ipc::iconSvg();
}

phicore::adapter::v1::Utf8String RefossSidecar::apiVersion() const
{
    return "1.0.0";
}

int RefossSidecar::timeoutMs() const
{
    return 20000;
}

phicore::adapter::v1::AdapterCapabilities RefossSidecar::capabilities() const
{
    return phicore::refoss::ipc::capabilities();
}

phicore::adapter::v1::JsonText RefossSidecar::configSchemaJson() const
{
    return phicore::refoss::ipc::configSchemaJson();
}

std::int64_t RefossSidecar::nowMs()
{
    return QDateTime::currentMSecsSinceEpoch();
}

void RefossSidecar::applyBootstrapAdapter(const v1::Adapter &adapter)
{
    m_adapterInfo = adapter;

    m_meta = QJsonObject{};
    const QByteArray metaBytes = QByteArray::fromStdString(adapter.metaJson);
    if (!metaBytes.trimmed().isEmpty()) {
        const QJsonDocument metaDoc = QJsonDocument::fromJson(metaBytes);
        if (metaDoc.isObject())
            m_meta = metaDoc.object();
    }

    Settings next = readSettings(adapter, m_meta);

    // Keep what an earlier probe learned about the same device.
    if (next.connection.host == m_settings.connection.host) {
        if (next.identity.isEmpty())
            next.identity = m_settings.identity;
        if (next.model == DeviceModel::Unknown)
            next.model = m_settings.model;
        if (next.name.isEmpty())
            next.name = m_settings.name;
        if (next.firmware.isEmpty())
            next.firmware = m_settings.firmware;
        if (next.channelIds.isEmpty())
            next.channelIds = m_settings.channelIds;
    }

    m_settings = next;
    m_retryIntervalMs = std::clamp(readInt(m_meta, QStringLiteral("retryIntervalMs"), 10000), 1000, 600000);
}

RefossSidecar::Settings RefossSidecar::readSettings(const v1::Adapter &adapter, const QJsonObject &meta) const
{
    Settings out;

    out.connection.host = QString::fromStdString(adapter.host).trimmed();
    if (out.connection.host.isEmpty())
        out.connection.host = QString::fromStdString(adapter.ip).trimmed();
    out.connection.host = readString(meta, QStringLiteral("host"), out.connection.host);
    out.connection.port = readInt(meta, QStringLiteral("port"), static_cast<int>(adapter.port));
    if (out.connection.port <= 0)
        out.connection.port = 80;

    out.connection.password = readString(meta, QStringLiteral("password"),
                                         QString::fromStdString(adapter.token).trimmed());
    out.connection.username = readString(meta, QStringLiteral("username"));
    if (out.connection.username.isEmpty() && !out.connection.password.isEmpty())
        out.connection.username = QStringLiteral("admin");

    out.model = modelFromString(readString(meta, QStringLiteral("model")));
    const QString identity = readString(meta, QStringLiteral("identity"));
    if (!identity.isEmpty())
        out.identity = identityFromMac(identity);
    out.name = readString(meta, QStringLiteral("name"));
    out.firmware = readString(meta, QStringLiteral("firmware"));

    out.pollIntervalS = clampPollInterval(readInt(meta, QStringLiteral("pollIntervalS"), kDefaultPollIntervalS));
    out.webhookPort = std::clamp(readInt(meta, QStringLiteral("webhookPort"), kDefaultWebhookPort), 0, 65535);
    out.localAddress = readString(meta, QStringLiteral("localAddress"));
    out.electricityPrice = std::max(0.0, readDouble(meta, QStringLiteral("electricityPrice"), 0.0));
    out.currency = readString(meta, QStringLiteral("currency"), QStringLiteral("EUR"));

    const QJsonArray channels = meta.value(QStringLiteral("channels")).toArray();
    for (const QJsonValue &value : channels) {
        const int id = value.toInt(0);
        if (id > 0 && !out.channelIds.contains(id))
            out.channelIds.append(id);
    }
    std::sort(out.channelIds.begin(), out.channelIds.end());

    return out;
}

bool RefossSidecar::startEngine(QString *error)
{
    if (m_settings.connection.host.isEmpty()) {
        if (error)
            *error = QStringLiteral("Device host is empty");
        return false;
    }

    if (!resolveDevice(error))
        return false;

    const bool webhookEnabled = ensureListener();
    const bool aggregate = m_settings.channelIds.size() > 1;
    const QString baseName = m_settings.name.isEmpty()
        ? QStringLiteral("%1 (%2)").arg(modelName(m_settings.model), m_settings.connection.host)
        : m_settings.name;

    QJsonObject deviceMeta;
    deviceMeta.insert(QStringLiteral("host"), m_settings.connection.host);
    deviceMeta.insert(QStringLiteral("model"), modelKey(m_settings.model));
    deviceMeta.insert(QStringLiteral("channels"), m_settings.channelIds.size());

    v1::Device device;
    device.externalId = m_settings.identity.toStdString();
    device.name = baseName.toStdString();
    device.manufacturer = "Refoss";
    device.model = modelName(m_settings.model).toStdString();
    device.firmware = m_settings.firmware.toStdString();
    device.deviceClass = aggregate ? v1::DeviceClass::Gateway : v1::DeviceClass::Sensor;
    device.metaJson = QJsonDocument(deviceMeta).toJson(QJsonDocument::Compact).toStdString();
    m_mainHost = std::make_unique<DeviceHost>(*this, device, buildChannels(aggregate, true), true);

    if (aggregate) {
        for (int channelId : std::as_const(m_settings.channelIds)) {
            const QString label = channelLabel(m_settings.model, channelId);

            QJsonObject channelMeta;
            channelMeta.insert(QStringLiteral("parent"), m_settings.identity);
            channelMeta.insert(QStringLiteral("channel"), channelId);
            channelMeta.insert(QStringLiteral("label"), label);

            v1::Device sub;
            sub.externalId = QStringLiteral("%1-ch%2").arg(m_settings.identity).arg(channelId).toStdString();
            sub.name = QStringLiteral("%1 %2").arg(baseName, label).toStdString();
            sub.manufacturer = device.manufacturer;
            sub.model = device.model;
            sub.firmware = device.firmware;
            sub.deviceClass = v1::DeviceClass::Sensor;
            sub.metaJson = QJsonDocument(channelMeta).toJson(QJsonDocument::Compact).toStdString();
            m_channelHosts.push_back(std::make_unique<DeviceHost>(*this, sub, buildChannels(false, false), false));

            auto consumer = std::make_unique<ChannelConsumer>(m_settings.identity, channelId, &m_push,
                                                              *m_channelHosts.back());
            consumer->setPricing(m_settings.electricityPrice, m_settings.currency);
            m_consumers.push_back(std::move(consumer));
        }
    }

    if (!m_mainHost->publish(error))
        return false;
    for (const auto &host : m_channelHosts) {
        if (!host->publish(error))
            return false;
    }

    DeviceConfig config = deviceConfig();
    config.webhookEnabled = webhookEnabled;
    m_coordinator = std::make_unique<FreshnessCoordinator>(config, m_http, m_socket, &m_push, *m_mainHost);

    for (const auto &consumer : m_consumers)
        consumer->start();
    m_coordinator->start();

    v1::Utf8String sendError;
    if (!sendFullSyncCompleted(&sendError))
        std::cerr << "refoss-ipc failed to send fullSyncCompleted: " << sendError << '\n';

    std::cerr << "refoss-ipc started " << m_settings.identity.toStdString()
              << " channels=" << m_settings.channelIds.size()
              << " webhook=" << (webhookEnabled ? "on" : "off") << '\n';
    return true;
}

void RefossSidecar::stopEngine()
{
    if (m_coordinator)
        m_coordinator->stop();
    m_coordinator.reset();
    m_consumers.clear();
    m_channelHosts.clear();
    m_mainHost.reset();
}

bool RefossSidecar::resolveDevice(QString *error)
{
    if (m_settings.identity.isEmpty() || m_settings.model == DeviceModel::Unknown) {
        const ProbeResult probe = runProbe(m_http, m_settings.connection, 10000);
        if (!probe.ok) {
            if (error)
                *error = probe.error;
            return false;
        }

        if (m_settings.identity.isEmpty())
            m_settings.identity = probe.identity;
        if (m_settings.model == DeviceModel::Unknown)
            m_settings.model = probe.model;
        if (m_settings.name.isEmpty())
            m_settings.name = probe.name;
        if (m_settings.firmware.isEmpty())
            m_settings.firmware = probe.firmware;

        v1::Utf8String sendError;
        const QByteArray patch = QJsonDocument(probe.metaPatch).toJson(QJsonDocument::Compact);
        if (!sendAdapterMetaUpdated(patch.toStdString(), &sendError))
            std::cerr << "refoss-ipc failed to send adapterMetaUpdated(probe): " << sendError << '\n';
    }

    if (m_settings.model == DeviceModel::Unknown && !m_settings.channelIds.isEmpty())
        m_settings.model = modelForHighestChannel(m_settings.channelIds.last());
    if (m_settings.model == DeviceModel::Unknown) {
        qCWarning(adapterLog).noquote() << "model of" << m_settings.identity << "unknown, assuming EM06P";
        m_settings.model = DeviceModel::Em06p;
    }

    const QVector<int> modelIds = channelIdsForModel(m_settings.model);
    QVector<int> selected;
    for (int id : std::as_const(m_settings.channelIds)) {
        if (modelIds.contains(id))
            selected.append(id);
    }
    m_settings.channelIds = selected.isEmpty() ? modelIds : selected;
    return true;
}

bool RefossSidecar::ensureListener()
{
    const quint16 port = static_cast<quint16>(m_settings.webhookPort);
    if (m_push.isListening() && (port == 0 || m_push.port() == port))
        return true;

    QString error;
    if (!m_push.listen(port, QHostAddress::AnyIPv4, &error)) {
        std::cerr << "refoss-ipc webhook listener unavailable, polling only: " << error.toStdString() << '\n';
        return false;
    }
    return true;
}

DeviceConfig RefossSidecar::deviceConfig() const
{
    DeviceConfig config;
    config.identity = m_settings.identity;
    config.connection = m_settings.connection;
    config.pollIntervalS = m_settings.pollIntervalS;
    config.channelIds = m_settings.channelIds;
    config.electricityPrice = m_settings.electricityPrice;
    config.currency = m_settings.currency;
    config.localAddress = m_settings.localAddress;
    config.webhookEnabled = m_push.isListening();
    return config;
}

phicore::adapter::v1::ChannelList RefossSidecar::buildChannels(bool aggregate, bool withTemperature) const
{
    v1::ChannelList channels;

    channels.push_back(makeMeasurementChannel(capability::kPower, QStringLiteral("Power"), v1::ChannelKind::Power, "W"));
    channels.push_back(makeMeasurementChannel(capability::kVoltage, QStringLiteral("Voltage"), v1::ChannelKind::Voltage, "V"));
    channels.push_back(makeMeasurementChannel(capability::kCurrent, QStringLiteral("Current"), v1::ChannelKind::Current, "A"));
    channels.push_back(makeMeasurementChannel(capability::kApparentPower, QStringLiteral("Apparent power"), v1::ChannelKind::Power, "VA"));

    v1::Channel powerFactor = makeMeasurementChannel(capability::kPowerFactor, QStringLiteral("Power factor"),
                                                     v1::ChannelKind::Unknown, "");
    powerFactor.minValue = kMinPowerFactor;
    powerFactor.maxValue = kMaxPowerFactor;
    powerFactor.stepValue = 0.01;
    channels.push_back(powerFactor);

    channels.push_back(makeMeasurementChannel(capability::kMonthEnergy, QStringLiteral("Energy this month"), v1::ChannelKind::Energy, "kWh"));
    channels.push_back(makeMeasurementChannel(capability::kWeekEnergy, QStringLiteral("Energy this week"), v1::ChannelKind::Energy, "kWh"));
    channels.push_back(makeMeasurementChannel(capability::kDayEnergy, QStringLiteral("Energy today"), v1::ChannelKind::Energy, "kWh"));
    channels.push_back(makeMeasurementChannel(capability::kExportedEnergy, QStringLiteral("Returned energy this month"), v1::ChannelKind::Energy, "kWh"));

    if (withTemperature)
        channels.push_back(makeMeasurementChannel(capability::kTemperature, QStringLiteral("Temperature"), v1::ChannelKind::Temperature, "C"));

    if (m_settings.electricityPrice > 0.0) {
        channels.push_back(makeMeasurementChannel(capability::kDayCost, QStringLiteral("Cost today"),
                                                  v1::ChannelKind::Unknown, m_settings.currency.toStdString()));
    }

    v1::Channel available;
    available.externalId = kAvailableChannel.toStdString();
    available.name = "Available";
    available.kind = v1::ChannelKind::Unknown;
    available.dataType = v1::ChannelDataType::Bool;
    available.flags = v1::kChannelFlagDefaultRead;
    channels.push_back(available);

    channels.push_back(makeTriggerChannel(trigger::kPowerChanged, QStringLiteral("Power changed")));
    channels.push_back(makeTriggerChannel(trigger::kMonthEnergy, QStringLiteral("Monthly energy changed")));
    channels.push_back(makeTriggerChannel(trigger::kWeekEnergy, QStringLiteral("Weekly energy changed")));
    channels.push_back(makeTriggerChannel(trigger::kDayEnergy, QStringLiteral("Daily energy changed")));

    if (aggregate) {
        for (v1::Channel &channel : channels) {
            QJsonObject meta;
            meta.insert(QStringLiteral("aggregate"), true);
            channel.metaJson = QJsonDocument(meta).toJson(QJsonDocument::Compact).toStdString();
        }
    }

    return channels;
}

void RefossSidecar::setConnectionState(bool connected)
{
    if (m_connected == connected)
        return;
    m_connected = connected;
    v1::Utf8String error;
    if (!sendConnectionStateChanged(connected, &error)) {
        std::cerr << "refoss-ipc failed to send connectionStateChanged: " << error << '\n';
    }
}

phicore::adapter::v1::ActionResponse RefossSidecar::invokeProbe(const sdk::AdapterActionInvokeRequest &request)
{
    ActionResponse response;
    response.id = request.cmdId;
    response.tsMs = nowMs();

    ConnectionSettings settings = m_settings.connection;
    const QJsonObject params = paramsObject(request);
    if (params.contains(QStringLiteral("host")))
        settings.host = params.value(QStringLiteral("host")).toString().trimmed();
    if (params.contains(QStringLiteral("port")))
        settings.port = params.value(QStringLiteral("port")).toInt(settings.port);
    if (params.contains(QStringLiteral("username")))
        settings.username = params.value(QStringLiteral("username")).toString().trimmed();
    if (params.contains(QStringLiteral("password")))
        settings.password = params.value(QStringLiteral("password")).toString();
    if (settings.username.isEmpty() && !settings.password.isEmpty())
        settings.username = QStringLiteral("admin");

    const ProbeResult probe = runProbe(m_http, settings, 10000);
    if (!probe.ok) {
        response.status = CmdStatus::Failure;
        response.error = probe.error.toStdString();
        response.resultType = v1::ActionResultType::None;
        return response;
    }

    if (!probe.metaPatch.isEmpty()) {
        v1::Utf8String sendError;
        const QByteArray patch = QJsonDocument(probe.metaPatch).toJson(QJsonDocument::Compact);
        if (!sendAdapterMetaUpdated(patch.toStdString(), &sendError)) {
            std::cerr << "refoss-ipc failed to send adapterMetaUpdated(probe): " << sendError << '\n';
        }
    }

    response.status = CmdStatus::Success;
    response.resultType = v1::ActionResultType::String;
    response.resultValue = probe.identity.toStdString();
    return response;
}

phicore::adapter::v1::ActionResponse RefossSidecar::invokeRefresh(const sdk::AdapterActionInvokeRequest &request)
{
    ActionResponse response;
    response.id = request.cmdId;
    response.tsMs = nowMs();

    if (!m_coordinator) {
        response.status = CmdStatus::TemporarilyOffline;
        response.error = "Device not started yet";
        return response;
    }

    m_coordinator->pollNow();
    response.status = CmdStatus::Success;
    response.resultType = v1::ActionResultType::String;
    response.resultValue = std::string(freshnessStateName(m_coordinator->state().state));
    return response;
}

phicore::adapter::v1::ActionResponse RefossSidecar::invokeResubscribe(const sdk::AdapterActionInvokeRequest &request)
{
    ActionResponse response;
    response.id = request.cmdId;
    response.tsMs = nowMs();

    if (!m_coordinator) {
        response.status = CmdStatus::TemporarilyOffline;
        response.error = "Device not started yet";
        return response;
    }

    m_coordinator->renewWebhook();
    const ConnectionState &state = m_coordinator->state();
    if (!state.webhookActive) {
        response.status = CmdStatus::Failure;
        response.error = "Webhook registration failed, polling only";
        return response;
    }

    response.status = CmdStatus::Success;
    response.resultType = v1::ActionResultType::String;
    response.resultValue = state.webhookEvent.toStdString();
    return response;
}

phicore::adapter::v1::CmdResponse RefossSidecar::failureResponse(std::uint64_t cmdId, CmdStatus status, const QString &error) const
{
    CmdResponse response;
    response.id = cmdId;
    response.status = status;
    response.error = error.toStdString();
    response.tsMs = nowMs();
    return response;
}

phicore::adapter::v1::CmdResponse RefossSidecar::successResponse(std::uint64_t cmdId) const
{
    CmdResponse response;
    response.id = cmdId;
    response.status = CmdStatus::Success;
    response.tsMs = nowMs();
    return response;
}

} // namespace phicore::refoss::ipc
