#include "refoss_coordinator.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include <QEventLoop>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QRandomGenerator>

#include "refoss_log.h"
#include "refoss_push.h"

namespace phicore::refoss::ipc {

namespace {

void waitMs(int ms)
{
    QEventLoop loop;
    QTimer::singleShot(ms, &loop, &QEventLoop::quit);
    loop.exec();
}

QByteArray compactJson(const QJsonValue &value)
{
    if (value.isObject())
        return QJsonDocument(value.toObject()).toJson(QJsonDocument::Compact);
    if (value.isArray())
        return QJsonDocument(value.toArray()).toJson(QJsonDocument::Compact);
    return value.toVariant().toString().toUtf8();
}

} // namespace

int clampPollInterval(int seconds)
{
    if (seconds <= 0)
        return kDefaultPollIntervalS;
    return std::clamp(seconds, kMinPollIntervalS, kMaxPollIntervalS);
}

int jitteredIntervalMs(int baseMs, double unitRandom)
{
    const double jitter = std::round(baseMs * kPollJitterRatio * std::clamp(unitRandom, -1.0, 1.0));
    return std::max(kMinJitteredPollMs, baseMs + static_cast<int>(jitter));
}

const char *freshnessStateName(FreshnessState state)
{
    switch (state) {
    case FreshnessState::Initializing:
        return "Initializing";
    case FreshnessState::WebhookActive:
        return "WebhookActive";
    case FreshnessState::PollingOnly:
        return "PollingOnly";
    case FreshnessState::Unreachable:
        return "Unreachable";
    }
    return "Unknown";
}

FreshnessCoordinator::FreshnessCoordinator(const DeviceConfig &config,
                                           RpcCaller &query,
                                           RpcCaller &mutate,
                                           PushDispatchServer *dispatcher,
                                           HostCollaborator &host,
                                           QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_query(query)
    , m_dispatcher(dispatcher)
    , m_registrar(query, mutate)
    , m_publisher(host, config.identity)
{
    m_config.pollIntervalS = clampPollInterval(config.pollIntervalS);
    m_state.settings = m_config.connection;
    m_state.pollIntervalS = m_config.pollIntervalS;
    m_publisher.setPricing(m_config.electricityPrice, m_config.currency);

    m_pollTimer.setSingleShot(false);
    connect(&m_pollTimer, &QTimer::timeout, this, &FreshnessCoordinator::pollNow);
}

FreshnessCoordinator::~FreshnessCoordinator()
{
    m_pollTimer.stop();
    if (m_dispatcher && m_running)
        m_dispatcher->unregisterHandler(PushDispatchServer::deviceKey(m_config.identity));
}

void FreshnessCoordinator::start()
{
    if (m_running)
        return;
    m_running = true;
    setState(FreshnessState::Initializing);

    qCInfo(adapterLog).noquote() << "starting" << m_config.identity << "host" << m_config.connection.host
                                 << "channels" << m_config.channelIds.size()
                                 << "poll" << m_config.pollIntervalS << "s";

    if (m_dispatcher) {
        m_dispatcher->registerHandler(PushDispatchServer::deviceKey(m_config.identity),
                                      [this](const ChannelReading &reading) { handlePush(reading); });
    }

    pollNow();
    if (m_running)
        setupWebhook();
}

void FreshnessCoordinator::stop()
{
    if (!m_running)
        return;
    stopPolling();
    if (m_dispatcher)
        m_dispatcher->unregisterHandler(PushDispatchServer::deviceKey(m_config.identity));
    teardownWebhook();
    m_running = false;
    m_pollPending = false;
    qCInfo(adapterLog).noquote() << "stopped" << m_config.identity;
}

int FreshnessCoordinator::activePollIntervalMs() const
{
    return m_pollTimer.isActive() ? m_pollTimer.interval() : 0;
}

void FreshnessCoordinator::pollNow()
{
    if (!m_running)
        return;
    if (m_polling) {
        m_pollPending = true;
        return;
    }

    m_polling = true;
    do {
        m_pollPending = false;
        runPoll();
    } while (m_pollPending && m_running);
    m_polling = false;
}

void FreshnessCoordinator::handlePush(const ChannelReading &reading)
{
    if (!m_running)
        return;

    qCDebug(adapterLog).noquote() << "push for" << m_config.identity << "ch" << reading.channelId
                                  << "state" << freshnessStateName(m_state.state);

    if (isAggregate()) {
        pollNow();
        return;
    }

    // Single channel: the push is a complete reading and proves the device is up.
    m_publisher.applyChannel(reading);
    if (m_state.consecutiveFailures > 0)
        qCInfo(adapterLog).noquote() << m_config.identity << "reachable again via push";
    m_state.consecutiveFailures = 0;
    markReachable();
}

void FreshnessCoordinator::applySettings(const DeviceConfig &config)
{
    const ConnectionSettings previous = m_config.connection;
    const bool hostChanged = previous.host != config.connection.host || previous.port != config.connection.port;
    const bool authChanged = previous.username != config.connection.username
        || previous.password != config.connection.password;
    const int nextPoll = clampPollInterval(config.pollIntervalS);
    const bool pollChanged = nextPoll != m_config.pollIntervalS;

    const QString identity = m_config.identity;
    m_config = config;
    m_config.identity = identity;
    m_config.pollIntervalS = nextPoll;
    m_state.pollIntervalS = nextPoll;
    m_publisher.setPricing(m_config.electricityPrice, m_config.currency);

    if (!m_running)
        return;

    if (hostChanged || authChanged) {
        qCInfo(adapterLog).noquote() << m_config.identity << "connection settings changed, re-establishing push";
        // Hooks live on the device we were talking to.
        m_state.settings = previous;
        teardownWebhook();
        m_state.settings = m_config.connection;
        m_state.consecutiveFailures = 0;
        setupWebhook();
        pollNow();
        return;
    }

    if (pollChanged && m_state.state != FreshnessState::WebhookActive)
        startPolling(m_config.pollIntervalS * 1000);
}

void FreshnessCoordinator::renewWebhook()
{
    if (!m_running)
        return;
    teardownWebhook();
    setupWebhook();
}

void FreshnessCoordinator::runPoll()
{
    const RpcResult result = fetchStatus();
    if (!result.ok) {
        recordFailure(result.error);
        emit polled(false);
        return;
    }

    const DeviceTelemetry telemetry = normalizeStatus(result.value);
    if (telemetry.isEmpty())
        qCWarning(adapterLog).noquote() << m_config.identity << "status payload:" << logSnippet(compactJson(result.value), 280);
    recordSuccess(telemetry);
    emit polled(true);
}

RpcResult FreshnessCoordinator::fetchStatus()
{
    QJsonObject params;
    params.insert(QStringLiteral("id"), 65535);

    RpcResult result = m_query.call(m_state.settings, QStringLiteral("Em.Status.Get"), params);
    if (result.ok || !result.error.isTimeout())
        return result;

    qCDebug(adapterLog).noquote() << m_config.identity << "Em.Status.Get timed out, retrying once";
    waitMs(kTimeoutRetryDelayMs);
    if (!m_running)
        return result;
    return m_query.call(m_state.settings, QStringLiteral("Em.Status.Get"), params);
}

void FreshnessCoordinator::recordSuccess(const DeviceTelemetry &telemetry)
{
    m_lastTelemetry = telemetry;

    if (m_state.consecutiveFailures > 0) {
        qCInfo(adapterLog).noquote() << m_config.identity << "poll recovered after"
                                     << m_state.consecutiveFailures << "consecutive failure(s)";
    }
    m_state.consecutiveFailures = 0;

    if (isAggregate()) {
        m_publisher.applyTotals(telemetry.total, telemetry.temperature);
        if (m_dispatcher) {
            for (int channelId : std::as_const(m_config.channelIds)) {
                const ChannelReading *reading = telemetry.channel(channelId);
                if (!reading)
                    continue;
                ChannelReading routed = *reading;
                routed.channelId = channelId;
                m_dispatcher->dispatchToChannel(m_config.identity, routed);
            }
        }
    } else {
        const int channelId = m_config.channelIds.isEmpty() ? 1 : m_config.channelIds.first();
        if (const ChannelReading *reading = telemetry.channel(channelId))
            m_publisher.applyChannel(*reading);
        m_publisher.apply(QString::fromLatin1(capability::kTemperature), telemetry.temperature);
    }

    markReachable();
}

void FreshnessCoordinator::recordFailure(const RpcError &error)
{
    ++m_state.consecutiveFailures;
    qCWarning(adapterLog).noquote() << m_config.identity << "poll failed:" << error.toString();

    if (m_state.consecutiveFailures < kFailureThreshold) {
        qCInfo(adapterLog).noquote() << m_config.identity << "transient failure"
                                     << m_state.consecutiveFailures << "/" << kFailureThreshold
                                     << "keeping device available";
        return;
    }

    m_state.available = false;
    m_publisher.setAvailable(false, QStringLiteral("Device unreachable: %1").arg(error.message));
    if (m_state.state != FreshnessState::Unreachable) {
        setState(FreshnessState::Unreachable);
        startPolling(m_config.pollIntervalS * 1000);
    }
}

void FreshnessCoordinator::markReachable()
{
    m_state.available = true;
    m_publisher.setAvailable(true);

    if (m_state.state != FreshnessState::Unreachable)
        return;

    setState(FreshnessState::PollingOnly);
    if (m_state.webhookActive) {
        // Re-register outside the poll so the device sees fresh hooks.
        QTimer::singleShot(0, this, [this]() {
            if (m_running && m_state.state == FreshnessState::PollingOnly)
                setupWebhook();
        });
    } else {
        startPolling(m_config.pollIntervalS * 1000);
    }
}

void FreshnessCoordinator::setupWebhook()
{
    if (!m_dispatcher || !m_config.webhookEnabled || !m_dispatcher->isListening()) {
        m_state.webhookActive = false;
        if (m_state.state != FreshnessState::Unreachable)
            setState(FreshnessState::PollingOnly);
        startPolling(m_config.pollIntervalS * 1000);
        return;
    }

    stopPolling();

    const QString event = m_registrar.discoverEvent(m_state.settings);
    const QString url = m_dispatcher->webhookUrl(m_config.localAddress, m_config.identity);
    const WebhookRegistration registration = m_registrar.registerHooks(m_state.settings, url, event, m_config.channelIds);

    if (!registration.ok) {
        qCWarning(adapterLog).noquote() << m_config.identity << "webhook setup failed, falling back to polling:"
                                        << registration.error.toString() << "event" << event << "url" << url;
        m_state.webhookActive = false;
        m_state.webhookId = -1;
        if (m_state.state != FreshnessState::Unreachable)
            setState(FreshnessState::PollingOnly);
        startPolling(m_config.pollIntervalS * 1000);
        return;
    }

    m_state.webhookActive = true;
    m_state.webhookId = registration.id;
    m_state.webhookEvent = registration.event;
    qCInfo(adapterLog).noquote() << m_config.identity << "webhook registered id" << registration.id
                                 << "event" << registration.event << "url" << url;
    if (!registration.failures.isEmpty())
        qCWarning(adapterLog).noquote() << m_config.identity << "per-channel webhooks:" << registration.failures.join(QStringLiteral("; "));

    if (m_state.state == FreshnessState::Unreachable) {
        startPolling(m_config.pollIntervalS * 1000);
        return;
    }
    setState(FreshnessState::WebhookActive);
    startPolling(kSafetyNetPollMs);
}

void FreshnessCoordinator::teardownWebhook()
{
    if (!m_state.webhookActive)
        return;

    RpcError error;
    if (!m_registrar.unregisterHooks(m_state.settings, &error))
        qCWarning(adapterLog).noquote() << m_config.identity << "webhook teardown failed:" << error.toString();
    m_state.webhookActive = false;
    m_state.webhookId = -1;
    m_state.webhookEvent.clear();
}

void FreshnessCoordinator::startPolling(int baseMs)
{
    const double unitRandom = QRandomGenerator::global()->generateDouble() * 2.0 - 1.0;
    const int interval = jitteredIntervalMs(baseMs, unitRandom);
    m_pollTimer.start(interval);
    qCDebug(adapterLog).noquote() << m_config.identity << "polling every" << interval << "ms";
}

void FreshnessCoordinator::stopPolling()
{
    m_pollTimer.stop();
}

void FreshnessCoordinator::setState(FreshnessState state)
{
    if (m_state.state == state)
        return;
    qCInfo(adapterLog).noquote() << m_config.identity << freshnessStateName(m_state.state) << "->"
                                 << freshnessStateName(state);
    m_state.state = state;
    emit stateChanged(state);
}

ChannelConsumer::ChannelConsumer(const QString &identity,
                                 int channelId,
                                 PushDispatchServer *dispatcher,
                                 HostCollaborator &host)
    : m_identity(identity)
    , m_channelId(channelId)
    , m_dispatcher(dispatcher)
    , m_publisher(host, PushDispatchServer::channelKey(identity, channelId))
{
}

ChannelConsumer::~ChannelConsumer()
{
    stop();
}

void ChannelConsumer::start()
{
    if (m_registered || !m_dispatcher)
        return;
    m_dispatcher->registerHandler(key(), [this](const ChannelReading &reading) { apply(reading); });
    m_registered = true;
}

void ChannelConsumer::stop()
{
    if (!m_registered)
        return;
    if (m_dispatcher)
        m_dispatcher->unregisterHandler(key());
    m_registered = false;
}

void ChannelConsumer::setPricing(double pricePerKwh, const QString &currency)
{
    m_publisher.setPricing(pricePerKwh, currency);
}

void ChannelConsumer::apply(const ChannelReading &reading)
{
    m_publisher.applyChannel(reading);
    m_publisher.setAvailable(true);
}

QString ChannelConsumer::key() const
{
    return PushDispatchServer::channelKey(m_identity, m_channelId);
}

} // namespace phicore::refoss::ipc
