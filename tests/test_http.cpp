#include <gtest/gtest.h>

#include <QJsonArray>
#include <QJsonDocument>
#include <QNetworkAccessManager>

#include "fake_device.h"
#include "refoss_http.h"

using namespace phicore::refoss::ipc;
using phicore::refoss::ipc::test::DigestCredentials;
using phicore::refoss::ipc::test::FakeHttpDevice;

namespace {

class HttpClientTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(device.start());
    }

    QNetworkAccessManager manager;
    HttpClient client{&manager};
    FakeHttpDevice device;
};

DigestCredentials adminCredentials()
{
    DigestCredentials credentials;
    credentials.username = QStringLiteral("admin");
    credentials.password = QStringLiteral("s3cret");
    return credentials;
}

} // namespace

TEST_F(HttpClientTest, PlainCallUnwrapsResult)
{
    device.setRoute([](const QString &) {
        return QByteArrayLiteral(R"({"result":{"mac":"AA:BB:CC:00:11:22","fw_ver":"1.2.3"}})");
    });

    const RpcResult result = client.call(device.settings(), QStringLiteral("Refoss.GetDeviceInfo"));
    ASSERT_TRUE(result.ok) << result.error.toString().toStdString();
    EXPECT_EQ(result.value.toObject().value(QStringLiteral("fw_ver")).toString(), QStringLiteral("1.2.3"));
    ASSERT_EQ(device.paths().size(), 1);
    EXPECT_EQ(device.paths().first(), QStringLiteral("/rpc/Refoss.GetDeviceInfo"));
    EXPECT_TRUE(device.authorizations().first().isEmpty());
}

TEST_F(HttpClientTest, DigestChallengeIsAnsweredOnce)
{
    device.setCredentials(adminCredentials());

    const RpcResult result = client.call(device.settings(QStringLiteral("admin"), QStringLiteral("s3cret")),
                                         QStringLiteral("Em.Status.Get"),
                                         QJsonObject{{QStringLiteral("id"), 1}});
    ASSERT_TRUE(result.ok) << result.error.toString().toStdString();
    EXPECT_EQ(device.challengesSent(), 1);
    ASSERT_EQ(device.authorizations().size(), 2);
    EXPECT_TRUE(device.authorizations().at(0).isEmpty());
    EXPECT_TRUE(device.authorizations().at(1).startsWith("Digest "));
    EXPECT_EQ(client.nonceCount(), 1u);
}

TEST_F(HttpClientTest, NonceCountAdvancesPerChallenge)
{
    device.setCredentials(adminCredentials());
    const ConnectionSettings settings = device.settings(QStringLiteral("admin"), QStringLiteral("s3cret"));

    ASSERT_TRUE(client.call(settings, QStringLiteral("Em.Status.Get")).ok);
    ASSERT_TRUE(client.call(settings, QStringLiteral("Em.Status.Get")).ok);

    const auto fields = test::parseAuthorizationHeader(device.authorizations().last());
    EXPECT_EQ(fields.value(QStringLiteral("nc")), QStringLiteral("00000002"));
}

TEST_F(HttpClientTest, PostResendsBodyWithDigest)
{
    device.setCredentials(adminCredentials());
    device.setRoute([](const QString &) { return QByteArrayLiteral(R"({"result":{"id":3}})"); });

    const QJsonObject body{{QStringLiteral("event"), QStringLiteral("em.power_change")},
                           {QStringLiteral("cid"), 2}};
    const RpcResult result = client.post(device.settings(QStringLiteral("admin"), QStringLiteral("s3cret")),
                                         QStringLiteral("/rpc/Webhook.Create"),
                                         body);
    ASSERT_TRUE(result.ok) << result.error.toString().toStdString();
    EXPECT_EQ(result.value.toObject().value(QStringLiteral("id")).toInt(), 3);

    EXPECT_EQ(device.challengesSent(), 1);
    ASSERT_EQ(device.bodies().size(), 2);
    EXPECT_EQ(device.methods().at(0), QByteArrayLiteral("POST"));
    EXPECT_EQ(device.methods().at(1), QByteArrayLiteral("POST"));
    EXPECT_TRUE(device.contentTypes().at(1).startsWith("application/json"));

    const QJsonObject received = QJsonDocument::fromJson(device.bodies().at(1)).object();
    EXPECT_EQ(received, body);
    EXPECT_EQ(device.paths().at(1), QStringLiteral("/rpc/Webhook.Create"));

    const QByteArray authorization = device.authorizations().at(1);
    EXPECT_TRUE(test::verifyDigest(adminCredentials(), QByteArrayLiteral("POST"), authorization));
    EXPECT_FALSE(test::verifyDigest(adminCredentials(), QByteArrayLiteral("GET"), authorization));
}

TEST_F(HttpClientTest, ChallengeWithoutCredentialsIsReported)
{
    device.setCredentials(adminCredentials());

    const RpcResult result = client.call(device.settings(), QStringLiteral("Em.Status.Get"));
    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, ErrorKind::AuthMissingCredentials);
    EXPECT_EQ(result.error.code, 401);
    EXPECT_EQ(device.paths().size(), 1);
}

TEST_F(HttpClientTest, WrongPasswordIsReportedAfterOneRetry)
{
    device.setCredentials(adminCredentials());

    const RpcResult result = client.call(device.settings(QStringLiteral("admin"), QStringLiteral("wrong")),
                                         QStringLiteral("Em.Status.Get"));
    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, ErrorKind::AuthBadCredentials);
    EXPECT_EQ(device.challengesSent(), 2);
    EXPECT_EQ(device.paths().size(), 2);
}

TEST_F(HttpClientTest, SilentDeviceTimesOut)
{
    device.setSilent(true);

    const RpcResult result = client.call(device.settings(), QStringLiteral("Em.Status.Get"), {}, 300);
    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, ErrorKind::TransportTimeout);
    EXPECT_TRUE(result.error.isTimeout());
}

TEST_F(HttpClientTest, ServerErrorCarriesStatus)
{
    device.setStatusCode(500);

    const RpcResult result = client.call(device.settings(), QStringLiteral("Em.Status.Get"));
    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, ErrorKind::TransportHttpStatus);
    EXPECT_EQ(result.error.code, 500);
}

TEST_F(HttpClientTest, InvalidJsonIsReported)
{
    device.setRoute([](const QString &) { return QByteArrayLiteral("<html>busy</html>"); });

    const RpcResult result = client.call(device.settings(), QStringLiteral("Em.Status.Get"));
    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, ErrorKind::TransportInvalidJson);
}

TEST_F(HttpClientTest, ErrorEnvelopesBecomeDeviceErrors)
{
    device.setRoute([](const QString &path) {
        if (path.contains(QLatin1String("Legacy")))
            return QByteArrayLiteral(R"({"code":-105,"message":"Argument id invalid"})");
        return QByteArrayLiteral(R"({"id":1,"error":{"code":-103,"message":"Invalid argument"}})");
    });

    const RpcResult modern = client.call(device.settings(), QStringLiteral("Webhook.Create"));
    ASSERT_FALSE(modern.ok);
    EXPECT_EQ(modern.error.kind, ErrorKind::DeviceRpc);
    EXPECT_EQ(modern.error.code, -103);
    EXPECT_EQ(modern.error.message, QStringLiteral("Invalid argument"));

    const RpcResult legacy = client.call(device.settings(), QStringLiteral("Legacy.Call"));
    ASSERT_FALSE(legacy.ok);
    EXPECT_EQ(legacy.error.kind, ErrorKind::DeviceRpc);
    EXPECT_EQ(legacy.error.code, -105);
}

TEST_F(HttpClientTest, UnreachableHostFailsWithoutStatus)
{
    ConnectionSettings settings = device.settings();
    settings.port = 1;

    const RpcResult result = client.call(settings, QStringLiteral("Em.Status.Get"), {}, 2000);
    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error.code, 0);
}

TEST_F(HttpClientTest, QueryParametersReachTheDevice)
{
    const RpcResult result = client.call(device.settings(),
                                         QStringLiteral("Webhook.Delete"),
                                         QJsonObject{{QStringLiteral("id"), 4}});
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(device.paths().first(), QStringLiteral("/rpc/Webhook.Delete?id=4"));
}

TEST(HttpRpcPathTest, EncodesParameters)
{
    EXPECT_EQ(HttpClient::rpcPath(QStringLiteral("Em.Status.Get"), {}), QStringLiteral("/rpc/Em.Status.Get"));

    const QString path = HttpClient::rpcPath(QStringLiteral("Webhook.Create"),
                                             QJsonObject{{QStringLiteral("cid"), 1},
                                                         {QStringLiteral("enable"), true},
                                                         {QStringLiteral("name"), QStringLiteral("a b")}});
    EXPECT_TRUE(path.startsWith(QStringLiteral("/rpc/Webhook.Create?")));
    EXPECT_TRUE(path.contains(QStringLiteral("cid=1")));
    EXPECT_TRUE(path.contains(QStringLiteral("enable=true")));
    EXPECT_TRUE(path.contains(QStringLiteral("name=a%20b")));

    const QString arrayPath = HttpClient::rpcPath(QStringLiteral("X"),
                                                  QJsonObject{{QStringLiteral("urls"),
                                                               QJsonArray{QStringLiteral("http://h/w")}}});
    EXPECT_EQ(arrayPath, QStringLiteral("/rpc/X?urls=%5B%22http%3A%2F%2Fh%2Fw%22%5D"));
}
