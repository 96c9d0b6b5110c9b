#pragma once

#include <memory>

#include <QObject>
#include <QString>
#include <QTimer>
#include <QVector>

#include "refoss_capabilities.h"
#include "refoss_rpc.h"
#include "refoss_status.h"
#include "refoss_webhook.h"

namespace phicore::refoss::ipc {

class PushDispatchServer;

inline constexpr int kFailureThreshold = 3;
inline constexpr int kTimeoutRetryDelayMs = 500;
inline constexpr int kSafetyNetPollMs = 60 * 1000;
inline constexpr double kPollJitterRatio = 0.10;
inline constexpr int kMinJitteredPollMs = 2000;
inline constexpr int kMinPollIntervalS = 5;
inline constexpr int kMaxPollIntervalS = 300;
inline constexpr int kDefaultPollIntervalS = 10;

int clampPollInterval(int seconds);
// unitRandom in [-1, 1]
int jitteredIntervalMs(int baseMs, double unitRandom);

struct DeviceConfig {
    QString identity;
    ConnectionSettings connection;
    int pollIntervalS = kDefaultPollIntervalS;
    QVector<int> channelIds;
    double electricityPrice = 0.0;
    QString currency;
    // Host part of the webhook target URL; detected when empty.
    QString localAddress;
    bool webhookEnabled = true;
};

enum class FreshnessState {
    Initializing,
    WebhookActive,
    PollingOnly,
    Unreachable
};

const char *freshnessStateName(FreshnessState state);

struct ConnectionState {
    ConnectionSettings settings;
    int pollIntervalS = kDefaultPollIntervalS;
    int webhookId = -1;
    bool webhookActive = false;
    QString webhookEvent;
    int consecutiveFailures = 0;
    bool available = true;
    FreshnessState state = FreshnessState::Initializing;
};

// Keeps one logical device fresh: webhook push when the device accepts a
// subscription, a jittered safety-net poll, and availability hysteresis.
class FreshnessCoordinator : public QObject
{
    Q_OBJECT
public:
    FreshnessCoordinator(const DeviceConfig &config,
                         RpcCaller &query,
                         RpcCaller &mutate,
                         PushDispatchServer *dispatcher,
                         HostCollaborator &host,
                         QObject *parent = nullptr);
    ~FreshnessCoordinator() override;

    void start();
    void stop();
    bool isRunning() const { return m_running; }

    // Requests a poll; coalesced with one already running.
    void pollNow();
    void handlePush(const ChannelReading &reading);
    void applySettings(const DeviceConfig &config);
    // Drops and re-creates the device-side subscriptions.
    void renewWebhook();

    const ConnectionState &state() const { return m_state; }
    const DeviceConfig &config() const { return m_config; }
    const DeviceTelemetry &lastTelemetry() const { return m_lastTelemetry; }
    bool isAggregate() const { return m_config.channelIds.size() > 1; }
    int activePollIntervalMs() const;
    bool isPollTimerActive() const { return m_pollTimer.isActive(); }

signals:
    void stateChanged(phicore::refoss::ipc::FreshnessState state);
    void polled(bool ok);

private:
    void runPoll();
    RpcResult fetchStatus();
    void recordSuccess(const DeviceTelemetry &telemetry);
    void recordFailure(const RpcError &error);
    void markReachable();

    void setupWebhook();
    void teardownWebhook();
    void startPolling(int baseMs);
    void stopPolling();
    void setState(FreshnessState state);

    DeviceConfig m_config;
    RpcCaller &m_query;
    PushDispatchServer *m_dispatcher = nullptr;
    WebhookRegistrar m_registrar;
    CapabilityPublisher m_publisher;

    ConnectionState m_state;
    DeviceTelemetry m_lastTelemetry;
    QTimer m_pollTimer;

    bool m_running = false;
    bool m_polling = false;
    bool m_pollPending = false;
};

// Passive per-channel sub-device. Receives readings through the dispatch
// registry (pushes and the parent's polls) and never polls on its own.
class ChannelConsumer
{
public:
    ChannelConsumer(const QString &identity,
                    int channelId,
                    PushDispatchServer *dispatcher,
                    HostCollaborator &host);
    ~ChannelConsumer();

    void start();
    void stop();
    void setPricing(double pricePerKwh, const QString &currency);

    void apply(const ChannelReading &reading);

    int channelId() const { return m_channelId; }
    QString key() const;

private:
    QString m_identity;
    int m_channelId = 0;
    PushDispatchServer *m_dispatcher = nullptr;
    CapabilityPublisher m_publisher;
    bool m_registered = false;
};

} // namespace phicore::refoss::ipc
