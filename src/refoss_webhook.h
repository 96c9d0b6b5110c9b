#pragma once

#include <QHash>
#include <QString>
#include <QStringList>
#include <QVector>

#include "refoss_rpc.h"

namespace phicore::refoss::ipc {

inline constexpr int kDeviceHookQuota = 20;
inline constexpr char kDefaultWebhookEvent[] = "em.status_update";

struct WebhookSubscription {
    int id = -1;
    QString name;
    QString event;
    int cid = 0;
    QStringList urls;
    bool enabled = true;
};

struct WebhookRegistration {
    bool ok = false;
    int id = -1;
    QString event;
    bool perChannel = false;
    // cid -> hook id for every hook created by this registration.
    QHash<int, int> channelHooks;
    QStringList failures;
    RpcError error;
};

// Manages the device-side push subscriptions owned by this adapter. Reads
// go through `query`, creation and deletion through `mutate` (the device
// rejects those over plain HTTP).
class WebhookRegistrar
{
public:
    WebhookRegistrar(RpcCaller &query, RpcCaller &mutate);

    QString discoverEvent(const ConnectionSettings &settings, int timeoutMs = kDefaultRpcTimeoutMs);

    bool listHooks(const ConnectionSettings &settings,
                   QVector<WebhookSubscription> *hooks,
                   RpcError *error = nullptr,
                   int timeoutMs = kDefaultRpcTimeoutMs);

    WebhookRegistration registerHooks(const ConnectionSettings &settings,
                                      const QString &targetUrl,
                                      const QString &eventHint,
                                      const QVector<int> &channelIds,
                                      int timeoutMs = kDefaultRpcTimeoutMs);

    bool unregisterHooks(const ConnectionSettings &settings,
                         RpcError *error = nullptr,
                         int timeoutMs = kDefaultRpcTimeoutMs);

    static bool isOwnHookName(const QString &name);
    static QString hookName(int channelId = 0);

    static QStringList supportedEvents(const QJsonValue &result);
    static QString pickEvent(const QStringList &supported);
    static QVector<WebhookSubscription> parseHookList(const QJsonValue &result);

private:
    // Deletes every hook following the naming convention. Returns the
    // number of hooks left on the device that belong to somebody else.
    int removeOwnHooks(const ConnectionSettings &settings, int timeoutMs);

    RpcResult createHook(const ConnectionSettings &settings,
                         const QString &name,
                         const QString &event,
                         int cid,
                         const QString &targetUrl,
                         int timeoutMs);

    RpcCaller &m_query;
    RpcCaller &m_mutate;
};

} // namespace phicore::refoss::ipc
