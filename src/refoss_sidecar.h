#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QString>

#include "refoss_capabilities.h"
#include "refoss_coordinator.h"
#include "refoss_http.h"
#include "refoss_model.h"
#include "refoss_push.h"
#include "refoss_rpcsocket.h"
#include "phi/adapter/sdk/sidecar.h"

namespace phicore::refoss::ipc {

class RefossSidecar final : public phicore::adapter::sdk::AdapterSidecar
{
public:
    RefossSidecar();
    ~RefossSidecar() override;

    void tick();
    // Unregisters device-side hooks and closes the webhook listener.
    void shutdown();

protected:
    void onConnected() override;
    void onDisconnected() override;
    void onBootstrap(const phicore::adapter::sdk::BootstrapRequest &request) override;

    phicore::adapter::v1::CmdResponse onChannelInvoke(
        const phicore::adapter::sdk::ChannelInvokeRequest &request) override;
    phicore::adapter::v1::ActionResponse onAdapterActionInvoke(
        const phicore::adapter::sdk::AdapterActionInvokeRequest &request) override;
    phicore::adapter::v1::CmdResponse onDeviceNameUpdate(
        const phicore::adapter::sdk::DeviceNameUpdateRequest &request) override;
    phicore::adapter::v1::CmdResponse onSceneInvoke(
        const phicore::adapter::sdk::SceneInvokeRequest &request) override;

    phicore::adapter::v1::Utf8String displayName() const override;
    phicore::adapter::v1::Utf8String description() const override;
    phicore::adapter::v1::Utf8String iconSvg() const override;
    phicore::adapter::v1::Utf8String apiVersion() const override;
    int timeoutMs() const override;
    phicore::adapter::v1::AdapterCapabilities capabilities() const override;
    phicore::adapter::v1::JsonText configSchemaJson() const override;

private:
    using CmdResponse = phicore::adapter::v1::CmdResponse;
    using ActionResponse = phicore::adapter::v1::ActionResponse;
    using CmdStatus = phicore::adapter::v1::CmdStatus;

    // One logical device on the host side: the monitor itself or a CT channel.
    class DeviceHost final : public HostCollaborator
    {
    public:
        DeviceHost(RefossSidecar &owner,
                   const phicore::adapter::v1::Device &device,
                   const phicore::adapter::v1::ChannelList &channels,
                   bool ownsConnectionState);

        bool setCapability(const QString &name, double value, QString *error) override;
        bool setAvailable(bool available, const QString &reason, QString *error) override;
        bool emitTrigger(const QString &kind, const QJsonObject &tokens, QString *error) override;

        bool publish(QString *error);
        void rename(const QString &name);

        const phicore::adapter::v1::Device &device() const { return m_device; }
        QString externalId() const { return QString::fromStdString(m_device.externalId); }

    private:
        RefossSidecar &m_owner;
        phicore::adapter::v1::Device m_device;
        phicore::adapter::v1::ChannelList m_channels;
        bool m_ownsConnectionState = false;
    };

    struct Settings {
        ConnectionSettings connection;
        DeviceModel model = DeviceModel::Unknown;
        QString identity;
        QString name;
        QString firmware;
        int pollIntervalS = kDefaultPollIntervalS;
        int webhookPort = kDefaultWebhookPort;
        QString localAddress;
        double electricityPrice = 0.0;
        QString currency;
        QVector<int> channelIds;
    };

    static std::int64_t nowMs();

    void applyBootstrapAdapter(const phicore::adapter::v1::Adapter &adapter);
    Settings readSettings(const phicore::adapter::v1::Adapter &adapter, const QJsonObject &meta) const;

    bool startEngine(QString *error);
    void stopEngine();
    bool resolveDevice(QString *error);
    bool ensureListener();
    DeviceConfig deviceConfig() const;
    phicore::adapter::v1::ChannelList buildChannels(bool aggregate, bool withTemperature) const;
    void setConnectionState(bool connected);

    ActionResponse invokeProbe(const phicore::adapter::sdk::AdapterActionInvokeRequest &request);
    ActionResponse invokeRefresh(const phicore::adapter::sdk::AdapterActionInvokeRequest &request);
    ActionResponse invokeResubscribe(const phicore::adapter::sdk::AdapterActionInvokeRequest &request);

    CmdResponse failureResponse(std::uint64_t cmdId, CmdStatus status, const QString &error) const;
    CmdResponse successResponse(std::uint64_t cmdId) const;

    QNetworkAccessManager m_network;
    HttpClient m_http;
    RpcSocketClient m_socket;
    PushDispatchServer m_push;

    phicore::adapter::v1::Adapter m_adapterInfo;
    QJsonObject m_meta;
    Settings m_settings;

    std::unique_ptr<DeviceHost> m_mainHost;
    std::vector<std::unique_ptr<DeviceHost>> m_channelHosts;
    std::unique_ptr<FreshnessCoordinator> m_coordinator;
    std::vector<std::unique_ptr<ChannelConsumer>> m_consumers;

    bool m_connected = false;
    bool m_hasBootstrap = false;
    int m_retryIntervalMs = 10000;
    std::int64_t m_nextStartDueMs = 0;
};

} // namespace phicore::refoss::ipc
