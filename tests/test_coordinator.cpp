#include <gtest/gtest.h>

#include <memory>

#include <QJsonArray>

#include "fake_device.h"
#include "refoss_coordinator.h"
#include "refoss_push.h"

using namespace phicore::refoss::ipc;
using phicore::refoss::ipc::test::FakeHost;
using phicore::refoss::ipc::test::FakeRpcCaller;
using phicore::refoss::ipc::test::SimulatedHookTable;
using phicore::refoss::ipc::test::waitFor;

namespace {

const QString kIdentity = QStringLiteral("AABBCC001122");

QJsonObject channelRecord(int id, double power, double voltage = 230.0)
{
    return QJsonObject{{QStringLiteral("id"), id},
                       {QStringLiteral("power"), power},
                       {QStringLiteral("voltage"), voltage},
                       {QStringLiteral("current"), power / voltage},
                       {QStringLiteral("day_energy"), 2.0},
                       {QStringLiteral("month_energy"), 40.0}};
}

QJsonObject statusPayload(const QJsonArray &records)
{
    return QJsonObject{{QStringLiteral("status"), records}};
}

DeviceConfig makeConfig(const QVector<int> &channelIds, const QString &host = QStringLiteral("10.0.0.40"))
{
    DeviceConfig config;
    config.identity = kIdentity;
    config.connection.host = host;
    config.pollIntervalS = 10;
    config.channelIds = channelIds;
    config.localAddress = QStringLiteral("127.0.0.1");
    return config;
}

// Device answering Em.Status.Get itself and the webhook calls through a
// simulated hook table.
class CoordinatorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        query.setHandler([this](const QString &method, const QJsonObject &params) {
            if (method == QLatin1String("Em.Status.Get")) {
                if (onStatus)
                    onStatus();
                if (failing)
                    return RpcResult::failure(failureKind, QStringLiteral("device offline"));
                return RpcResult::success(status);
            }
            return table.query().call(ConnectionSettings{}, method, params);
        });
        status = statusPayload(QJsonArray{channelRecord(1, 100.0)});
    }

    std::unique_ptr<FreshnessCoordinator> make(const DeviceConfig &config, PushDispatchServer *dispatcher = nullptr)
    {
        return std::make_unique<FreshnessCoordinator>(config, query, table.mutate(), dispatcher, host);
    }

    SimulatedHookTable table;
    FakeRpcCaller query;
    FakeHost host;
    QJsonObject status;
    bool failing = false;
    ErrorKind failureKind = ErrorKind::TransportHttpStatus;
    std::function<void()> onStatus;
};

} // namespace

TEST(PollIntervalTest, Clamping)
{
    EXPECT_EQ(clampPollInterval(0), kDefaultPollIntervalS);
    EXPECT_EQ(clampPollInterval(-4), kDefaultPollIntervalS);
    EXPECT_EQ(clampPollInterval(1), kMinPollIntervalS);
    EXPECT_EQ(clampPollInterval(30), 30);
    EXPECT_EQ(clampPollInterval(3600), kMaxPollIntervalS);
}

TEST(PollIntervalTest, Jitter)
{
    EXPECT_EQ(jitteredIntervalMs(10000, 0.0), 10000);
    EXPECT_EQ(jitteredIntervalMs(10000, 1.0), 11000);
    EXPECT_EQ(jitteredIntervalMs(10000, -1.0), 9000);
    EXPECT_EQ(jitteredIntervalMs(10000, 7.0), 11000);
    EXPECT_EQ(jitteredIntervalMs(1000, -1.0), kMinJitteredPollMs);
}

TEST_F(CoordinatorTest, StartPollsAndFallsBackToPollingWithoutListener)
{
    auto coordinator = make(makeConfig({1}));
    coordinator->start();

    EXPECT_EQ(query.count(QStringLiteral("Em.Status.Get")), 1);
    EXPECT_EQ(query.calls().first().params.value(QStringLiteral("id")).toInt(), 65535);
    EXPECT_EQ(coordinator->state().state, FreshnessState::PollingOnly);
    EXPECT_TRUE(coordinator->isPollTimerActive());
    EXPECT_GE(coordinator->activePollIntervalMs(), 9000);
    EXPECT_LE(coordinator->activePollIntervalMs(), 11000);
    EXPECT_DOUBLE_EQ(host.value(QStringLiteral("measure_power")), 100.0);
    EXPECT_EQ(host.availability(), QVector<bool>{true});
}

TEST_F(CoordinatorTest, AvailabilityNeedsThreeConsecutiveFailures)
{
    auto coordinator = make(makeConfig({1}));
    coordinator->start();
    ASSERT_EQ(host.availability(), QVector<bool>{true});

    failing = true;
    coordinator->pollNow();
    coordinator->pollNow();
    EXPECT_EQ(host.availability(), QVector<bool>{true});
    EXPECT_TRUE(coordinator->state().available);
    EXPECT_EQ(coordinator->state().consecutiveFailures, 2);

    coordinator->pollNow();
    EXPECT_EQ(host.availability(), (QVector<bool>{true, false}));
    EXPECT_EQ(coordinator->state().state, FreshnessState::Unreachable);

    failing = false;
    coordinator->pollNow();
    EXPECT_EQ(host.availability(), (QVector<bool>{true, false, true}));
    EXPECT_EQ(coordinator->state().state, FreshnessState::PollingOnly);
    EXPECT_EQ(coordinator->state().consecutiveFailures, 0);
}

TEST_F(CoordinatorTest, TimeoutIsRetriedOnce)
{
    int calls = 0;
    onStatus = [&]() {
        ++calls;
        failing = calls == 1;
    };
    failureKind = ErrorKind::TransportTimeout;

    auto coordinator = make(makeConfig({1}));
    coordinator->start();
    EXPECT_EQ(query.count(QStringLiteral("Em.Status.Get")), 2);
    EXPECT_EQ(coordinator->state().consecutiveFailures, 0);
    EXPECT_TRUE(host.has(QStringLiteral("measure_power")));
}

TEST_F(CoordinatorTest, NonTimeoutFailureIsNotRetried)
{
    failing = true;
    auto coordinator = make(makeConfig({1}));
    coordinator->start();
    EXPECT_EQ(query.count(QStringLiteral("Em.Status.Get")), 1);
    EXPECT_EQ(coordinator->state().consecutiveFailures, 1);
    EXPECT_TRUE(host.availability().isEmpty());
}

TEST_F(CoordinatorTest, UnchangedValuesAreNotRepublished)
{
    auto coordinator = make(makeConfig({1}));
    coordinator->start();
    coordinator->pollNow();
    EXPECT_EQ(host.updates(QStringLiteral("measure_power")), 1);

    status = statusPayload(QJsonArray{channelRecord(1, 120.0)});
    coordinator->pollNow();
    EXPECT_EQ(host.updates(QStringLiteral("measure_power")), 2);
    EXPECT_DOUBLE_EQ(host.value(QStringLiteral("measure_power")), 120.0);

    int powerTriggers = 0;
    const QVector<FakeHost::Trigger> triggers = host.triggers();
    for (const FakeHost::Trigger &trigger : triggers) {
        if (trigger.kind == QLatin1String("power_changed"))
            ++powerTriggers;
    }
    EXPECT_EQ(powerTriggers, 2);
}

TEST_F(CoordinatorTest, FailingCapabilityDoesNotBlockOthers)
{
    host.failCapability(QStringLiteral("measure_voltage"));
    auto coordinator = make(makeConfig({1}));
    coordinator->start();
    EXPECT_FALSE(host.has(QStringLiteral("measure_voltage")));
    EXPECT_TRUE(host.has(QStringLiteral("measure_power")));
    EXPECT_TRUE(host.has(QStringLiteral("meter_power")));
}

TEST_F(CoordinatorTest, DayCostFollowsPrice)
{
    DeviceConfig config = makeConfig({1});
    config.electricityPrice = 0.25;
    config.currency = QStringLiteral("EUR");
    auto coordinator = make(config);
    coordinator->start();
    EXPECT_DOUBLE_EQ(host.value(QStringLiteral("meter_cost_day")), 0.5);
}

TEST_F(CoordinatorTest, SingleChannelPublishesTemperature)
{
    status = QJsonObject{{QStringLiteral("status"), QJsonArray{channelRecord(1, 10.0)}},
                         {QStringLiteral("sys"), QJsonObject{{QStringLiteral("temperature"), 415}}}};
    auto coordinator = make(makeConfig({1}));
    coordinator->start();
    EXPECT_DOUBLE_EQ(host.value(QStringLiteral("measure_temperature")), 41.5);
}

TEST_F(CoordinatorTest, AggregatePublishesTotalsAndRoutesChannels)
{
    status = statusPayload(QJsonArray{channelRecord(1, 100.0),
                                      channelRecord(2, 50.0, 232.0),
                                      QJsonObject{{QStringLiteral("id"), 3}, {QStringLiteral("power"), QJsonValue()}}});
    PushDispatchServer dispatcher;
    FakeHost channelHosts[3];
    std::vector<std::unique_ptr<ChannelConsumer>> consumers;
    for (int i = 0; i < 3; ++i) {
        consumers.push_back(std::make_unique<ChannelConsumer>(kIdentity, i + 1, &dispatcher, channelHosts[i]));
        consumers.back()->start();
    }

    auto coordinator = make(makeConfig({1, 2, 3}), &dispatcher);
    ASSERT_TRUE(coordinator->isAggregate());
    coordinator->start();

    EXPECT_DOUBLE_EQ(host.value(QStringLiteral("measure_power")), 150.0);
    EXPECT_DOUBLE_EQ(host.value(QStringLiteral("measure_voltage")), 231.0);
    EXPECT_DOUBLE_EQ(host.value(QStringLiteral("meter_power")), 80.0);
    EXPECT_DOUBLE_EQ(channelHosts[0].value(QStringLiteral("measure_power")), 100.0);
    EXPECT_DOUBLE_EQ(channelHosts[1].value(QStringLiteral("measure_power")), 50.0);
    EXPECT_FALSE(channelHosts[2].has(QStringLiteral("measure_power")));
    EXPECT_EQ(channelHosts[2].availability(), QVector<bool>{true});
    // Not listening: no subscription attempt.
    EXPECT_EQ(coordinator->state().state, FreshnessState::PollingOnly);
    EXPECT_EQ(table.mutate().count(QStringLiteral("Webhook.Create")), 0);
}

TEST_F(CoordinatorTest, AggregatePushTriggersPoll)
{
    PushDispatchServer dispatcher;
    auto coordinator = make(makeConfig({1, 2}), &dispatcher);
    coordinator->start();
    ASSERT_EQ(query.count(QStringLiteral("Em.Status.Get")), 1);

    ChannelReading reading;
    reading.channelId = 2;
    reading.power = 5.0;
    dispatcher.dispatch(kIdentity, reading);
    EXPECT_EQ(query.count(QStringLiteral("Em.Status.Get")), 2);
}

TEST_F(CoordinatorTest, SingleChannelPushRestoresAvailability)
{
    PushDispatchServer dispatcher;
    auto coordinator = make(makeConfig({1}), &dispatcher);
    failing = true;
    coordinator->start();
    coordinator->pollNow();
    coordinator->pollNow();
    ASSERT_EQ(coordinator->state().state, FreshnessState::Unreachable);
    ASSERT_EQ(host.availability(), QVector<bool>{false});

    ChannelReading reading;
    reading.channelId = 1;
    reading.power = 42.0;
    dispatcher.dispatch(kIdentity.toLower(), reading);

    EXPECT_DOUBLE_EQ(host.value(QStringLiteral("measure_power")), 42.0);
    EXPECT_EQ(host.availability(), (QVector<bool>{false, true}));
    EXPECT_EQ(coordinator->state().consecutiveFailures, 0);
    EXPECT_EQ(coordinator->state().state, FreshnessState::PollingOnly);
}

TEST_F(CoordinatorTest, WebhookSetupKeepsSafetyNetPoll)
{
    PushDispatchServer dispatcher;
    ASSERT_TRUE(dispatcher.listen(0, QHostAddress::LocalHost));
    table.setSupportedEvents({QStringLiteral("emmerge.power_change")});

    auto coordinator = make(makeConfig({1, 2}), &dispatcher);
    coordinator->start();

    EXPECT_EQ(coordinator->state().state, FreshnessState::WebhookActive);
    EXPECT_TRUE(coordinator->state().webhookActive);
    EXPECT_EQ(coordinator->state().webhookEvent, QStringLiteral("emmerge.power_change"));
    EXPECT_GE(coordinator->activePollIntervalMs(), 54000);
    EXPECT_LE(coordinator->activePollIntervalMs(), 66000);

    const QList<QJsonObject> hooks = table.hooks();
    ASSERT_EQ(hooks.size(), 1);
    const QString url = hooks.first().value(QStringLiteral("urls")).toArray().first().toString();
    EXPECT_EQ(url, QStringLiteral("http://127.0.0.1:%1/webhook/%2").arg(dispatcher.port()).arg(kIdentity));

    coordinator->stop();
    EXPECT_FALSE(coordinator->isRunning());
    EXPECT_FALSE(coordinator->isPollTimerActive());
    EXPECT_TRUE(table.hooks().isEmpty());
    EXPECT_FALSE(dispatcher.hasHandler(kIdentity));
}

TEST_F(CoordinatorTest, RejectedWebhookFallsBackToPolling)
{
    PushDispatchServer dispatcher;
    ASSERT_TRUE(dispatcher.listen(0, QHostAddress::LocalHost));
    table.setRejectedPrefix(QStringLiteral("em"));

    auto coordinator = make(makeConfig({1, 2}), &dispatcher);
    coordinator->start();

    EXPECT_EQ(coordinator->state().state, FreshnessState::PollingOnly);
    EXPECT_FALSE(coordinator->state().webhookActive);
    EXPECT_GE(coordinator->activePollIntervalMs(), 9000);
    EXPECT_LE(coordinator->activePollIntervalMs(), 11000);
}

TEST_F(CoordinatorTest, RecoveryRegistersWebhookAgain)
{
    PushDispatchServer dispatcher;
    ASSERT_TRUE(dispatcher.listen(0, QHostAddress::LocalHost));

    auto coordinator = make(makeConfig({1, 2}), &dispatcher);
    coordinator->start();
    ASSERT_EQ(coordinator->state().state, FreshnessState::WebhookActive);
    const int createsBefore = table.mutate().count(QStringLiteral("Webhook.Create"));

    failing = true;
    for (int i = 0; i < kFailureThreshold; ++i)
        coordinator->pollNow();
    ASSERT_EQ(coordinator->state().state, FreshnessState::Unreachable);
    EXPECT_LE(coordinator->activePollIntervalMs(), 11000);

    failing = false;
    coordinator->pollNow();
    EXPECT_EQ(coordinator->state().state, FreshnessState::PollingOnly);
    EXPECT_TRUE(waitFor([&]() { return coordinator->state().state == FreshnessState::WebhookActive; }));
    EXPECT_EQ(table.mutate().count(QStringLiteral("Webhook.Create")), createsBefore + 1);
    EXPECT_EQ(table.hooks().size(), 1);
}

TEST_F(CoordinatorTest, HostChangeTearsDownOnPreviousHost)
{
    PushDispatchServer dispatcher;
    ASSERT_TRUE(dispatcher.listen(0, QHostAddress::LocalHost));

    auto coordinator = make(makeConfig({1, 2}), &dispatcher);
    coordinator->start();
    ASSERT_TRUE(coordinator->state().webhookActive);
    table.mutate().clear();
    query.clear();

    coordinator->applySettings(makeConfig({1, 2}, QStringLiteral("10.0.0.41")));

    const QVector<FakeRpcCaller::Call> mutations = table.mutate().calls();
    ASSERT_GE(mutations.size(), 2);
    EXPECT_EQ(mutations.first().method, QStringLiteral("Webhook.Delete"));
    EXPECT_EQ(mutations.first().settings.host, QStringLiteral("10.0.0.40"));
    EXPECT_EQ(mutations.last().method, QStringLiteral("Webhook.Create"));
    EXPECT_EQ(mutations.last().settings.host, QStringLiteral("10.0.0.41"));

    EXPECT_EQ(query.calls().last().method, QStringLiteral("Em.Status.Get"));
    EXPECT_EQ(query.calls().last().settings.host, QStringLiteral("10.0.0.41"));
    EXPECT_EQ(coordinator->state().settings.host, QStringLiteral("10.0.0.41"));
    EXPECT_EQ(coordinator->config().identity, kIdentity);
}

TEST_F(CoordinatorTest, PollIntervalChangeRestartsTimer)
{
    auto coordinator = make(makeConfig({1}));
    coordinator->start();

    DeviceConfig config = makeConfig({1});
    config.pollIntervalS = 60;
    coordinator->applySettings(config);
    EXPECT_EQ(coordinator->state().pollIntervalS, 60);
    EXPECT_GE(coordinator->activePollIntervalMs(), 54000);
    EXPECT_LE(coordinator->activePollIntervalMs(), 66000);
}

TEST_F(CoordinatorTest, ConcurrentPollRequestsCoalesce)
{
    auto coordinator = make(makeConfig({1}));
    FreshnessCoordinator *raw = coordinator.get();
    int depth = 0;
    onStatus = [&]() {
        // Re-entrant requests while the first poll is in flight.
        if (depth++ == 0) {
            raw->pollNow();
            raw->pollNow();
        }
    };

    coordinator->start();
    EXPECT_EQ(query.count(QStringLiteral("Em.Status.Get")), 2);
}

TEST_F(CoordinatorTest, StoppedCoordinatorIgnoresRequests)
{
    auto coordinator = make(makeConfig({1}));
    coordinator->pollNow();
    ChannelReading reading;
    reading.channelId = 1;
    reading.power = 3.0;
    coordinator->handlePush(reading);
    EXPECT_EQ(query.count(QStringLiteral("Em.Status.Get")), 0);
    EXPECT_FALSE(host.has(QStringLiteral("measure_power")));
}

TEST(ChannelConsumerTest, RegistersAndUnregistersHandler)
{
    PushDispatchServer dispatcher;
    FakeHost host;
    {
        ChannelConsumer consumer(kIdentity, 4, &dispatcher, host);
        EXPECT_EQ(consumer.key(), QStringLiteral("AABBCC001122:4"));
        consumer.setPricing(0.5, QStringLiteral("EUR"));
        consumer.start();
        EXPECT_TRUE(dispatcher.hasHandler(consumer.key()));

        ChannelReading reading;
        reading.channelId = 4;
        reading.power = 12.0;
        reading.dayEnergy = 3.0;
        dispatcher.dispatchToChannel(kIdentity, reading);
        EXPECT_DOUBLE_EQ(host.value(QStringLiteral("measure_power")), 12.0);
        EXPECT_DOUBLE_EQ(host.value(QStringLiteral("meter_cost_day")), 1.5);
        EXPECT_EQ(host.availability(), QVector<bool>{true});
    }
    EXPECT_FALSE(dispatcher.hasHandler(QStringLiteral("AABBCC001122:4")));
}
