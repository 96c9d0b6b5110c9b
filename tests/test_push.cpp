#include <gtest/gtest.h>

#include <QTcpSocket>

#include "fake_device.h"
#include "refoss_push.h"

using namespace phicore::refoss::ipc;
using phicore::refoss::ipc::test::waitFor;

namespace {

class PushServerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        QString error;
        ASSERT_TRUE(server.listen(0, QHostAddress::LocalHost, &error)) << error.toStdString();
    }

    // Sends raw bytes and returns everything the server wrote back.
    QByteArray exchange(const QByteArray &request)
    {
        QTcpSocket socket;
        QByteArray response;
        bool closed = false;
        QObject::connect(&socket, &QTcpSocket::readyRead, [&]() { response += socket.readAll(); });
        QObject::connect(&socket, &QTcpSocket::disconnected, [&]() { closed = true; });
        socket.connectToHost(QHostAddress::LocalHost, server.port());
        if (!waitFor([&]() { return socket.state() == QAbstractSocket::ConnectedState; }))
            return {};
        socket.write(request);
        waitFor([&]() { return closed; });
        response += socket.readAll();
        return response;
    }

    static QByteArray post(const QByteArray &path, const QByteArray &body)
    {
        QByteArray request;
        request += "POST " + path + " HTTP/1.1\r\n";
        request += "Host: 127.0.0.1\r\n";
        request += "Content-Type: application/json\r\n";
        request += "Content-Length: " + QByteArray::number(body.size()) + "\r\n\r\n";
        request += body;
        return request;
    }

    PushDispatchServer server;
};

const QByteArray kChannelTwoPush =
    R"({"src":"refoss-em06p","method":"NotifyStatus","params":{"em":{"id":2,"power":150.2,"pf":0.92}}})";

} // namespace

TEST_F(PushServerTest, PushReachesDeviceAndChannelHandlers)
{
    ChannelReading channelReading;
    int channelCalls = 0;
    int deviceCalls = 0;
    server.registerHandler(QStringLiteral("AABBCC001122:2"), [&](const ChannelReading &reading) {
        channelReading = reading;
        ++channelCalls;
    });
    server.registerHandler(QStringLiteral("aabbcc001122"), [&](const ChannelReading &) { ++deviceCalls; });

    QString pushedIdentity;
    int pushedChannel = 0;
    QObject::connect(&server, &PushDispatchServer::pushReceived, [&](const QString &identity, int channelId) {
        pushedIdentity = identity;
        pushedChannel = channelId;
    });

    const QByteArray response = exchange(post("/webhook/aabbcc001122", kChannelTwoPush));
    EXPECT_TRUE(response.startsWith("HTTP/1.1 200 OK"));
    EXPECT_TRUE(response.endsWith("{\"ok\":true}"));

    ASSERT_TRUE(waitFor([&]() { return channelCalls == 1; }));
    EXPECT_EQ(deviceCalls, 1);
    EXPECT_EQ(channelReading.channelId, 2);
    EXPECT_DOUBLE_EQ(channelReading.power.value_or(-1), 150.2);
    EXPECT_NEAR(channelReading.apparentPower.value_or(-1), 163.26, 0.01);
    EXPECT_EQ(pushedIdentity, QStringLiteral("AABBCC001122"));
    EXPECT_EQ(pushedChannel, 2);
}

TEST_F(PushServerTest, UnknownPathsAreNotFound)
{
    EXPECT_TRUE(exchange(post("/status", kChannelTwoPush)).startsWith("HTTP/1.1 404"));
    EXPECT_TRUE(exchange(post("/webhook/", kChannelTwoPush)).startsWith("HTTP/1.1 404"));
    EXPECT_TRUE(exchange("GET /webhook/AABB HTTP/1.1\r\nHost: x\r\n\r\n").startsWith("HTTP/1.1 404"));
}

TEST_F(PushServerTest, OversizedRequestIsRejected)
{
    QByteArray request;
    request += "POST /webhook/AABB HTTP/1.1\r\n";
    request += "Content-Length: " + QByteArray::number(kMaxPushRequestBytes + 1) + "\r\n\r\n";
    EXPECT_TRUE(exchange(request).startsWith("HTTP/1.1 413"));
}

TEST_F(PushServerTest, HugeContentLengthIsRejected)
{
    QByteArray request;
    request += "POST /webhook/AABB HTTP/1.1\r\n";
    request += "Content-Length: 9223372036854775800\r\n\r\n";
    EXPECT_TRUE(exchange(request).startsWith("HTTP/1.1 413"));
}

TEST_F(PushServerTest, StalledRequestIsAborted)
{
    server.setReadTimeoutMs(200);

    QTcpSocket socket;
    bool closed = false;
    QObject::connect(&socket, &QTcpSocket::disconnected, [&]() { closed = true; });
    socket.connectToHost(QHostAddress::LocalHost, server.port());
    ASSERT_TRUE(waitFor([&]() { return socket.state() == QAbstractSocket::ConnectedState; }));
    socket.write("POST /webhook/AABB HTTP/1.1\r\nContent-Len");
    ASSERT_TRUE(waitFor([&]() { return server.pendingConnections() == 1; }));

    EXPECT_TRUE(waitFor([&]() { return closed || socket.state() == QAbstractSocket::UnconnectedState; }, 2000));
    EXPECT_TRUE(socket.readAll().isEmpty());
    EXPECT_EQ(server.pendingConnections(), 0);
}

TEST_F(PushServerTest, MalformedPushIsAcknowledgedButDropped)
{
    int calls = 0;
    server.registerHandler(QStringLiteral("AABB"), [&](const ChannelReading &) { ++calls; });

    EXPECT_TRUE(exchange(post("/webhook/AABB", "{\"method\":\"NotifyStatus\"")).startsWith("HTTP/1.1 200"));
    EXPECT_TRUE(exchange(post("/webhook/AABB", R"({"method":"NotifyEvent","params":{}})")).startsWith("HTTP/1.1 200"));
    waitFor([]() { return false; }, 100);
    EXPECT_EQ(calls, 0);
}

TEST_F(PushServerTest, QueryStringIsIgnored)
{
    int calls = 0;
    server.registerHandler(QStringLiteral("AABB:2"), [&](const ChannelReading &) { ++calls; });

    EXPECT_TRUE(exchange(post("/webhook/AABB?cid=2", kChannelTwoPush)).startsWith("HTTP/1.1 200"));
    EXPECT_TRUE(waitFor([&]() { return calls == 1; }));
}

TEST_F(PushServerTest, SecondListenerOnSamePortFails)
{
    PushDispatchServer other;
    QString error;
    EXPECT_FALSE(other.listen(server.port(), QHostAddress::LocalHost, &error));
    EXPECT_FALSE(error.isEmpty());
}

TEST(PushDispatchTest, DispatchRoutesByKey)
{
    PushDispatchServer server;
    int device = 0;
    int channel = 0;
    server.registerHandler(PushDispatchServer::deviceKey(QStringLiteral("aabb")),
                           [&](const ChannelReading &) { ++device; });
    server.registerHandler(PushDispatchServer::channelKey(QStringLiteral("aabb"), 3),
                           [&](const ChannelReading &) { ++channel; });

    ChannelReading reading;
    reading.channelId = 3;
    server.dispatch(QStringLiteral("AABB"), reading);
    EXPECT_EQ(device, 1);
    EXPECT_EQ(channel, 1);

    server.dispatchToChannel(QStringLiteral("AABB"), reading);
    EXPECT_EQ(device, 1);
    EXPECT_EQ(channel, 2);

    reading.channelId = 4;
    server.dispatchToChannel(QStringLiteral("AABB"), reading);
    EXPECT_EQ(channel, 2);
}

TEST(PushDispatchTest, HandlerMayUnregisterItself)
{
    PushDispatchServer server;
    int calls = 0;
    server.registerHandler(QStringLiteral("AABB"), [&](const ChannelReading &) {
        ++calls;
        server.unregisterHandler(QStringLiteral("aabb"));
    });

    ChannelReading reading;
    reading.channelId = 1;
    server.dispatch(QStringLiteral("AABB"), reading);
    server.dispatch(QStringLiteral("AABB"), reading);
    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(server.hasHandler(QStringLiteral("AABB")));
}

TEST(PushDispatchTest, KeysAndUrl)
{
    EXPECT_EQ(PushDispatchServer::deviceKey(QStringLiteral(" aabb ")), QStringLiteral("AABB"));
    EXPECT_EQ(PushDispatchServer::channelKey(QStringLiteral("aabb"), 12), QStringLiteral("AABB:12"));

    PushDispatchServer server;
    ASSERT_TRUE(server.listen(0, QHostAddress::LocalHost));
    EXPECT_EQ(server.webhookUrl(QStringLiteral("10.0.0.5"), QStringLiteral("aabb")),
              QStringLiteral("http://10.0.0.5:%1/webhook/AABB").arg(server.port()));
    EXPECT_FALSE(server.webhookUrl({}, QStringLiteral("aabb")).isEmpty());
}
