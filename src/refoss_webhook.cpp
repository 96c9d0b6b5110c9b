#include "refoss_webhook.h"

#include <utility>

#include <QJsonArray>
#include <QJsonObject>

#include "refoss_log.h"

namespace phicore::refoss::ipc {

namespace {

const QStringList &preferredEvents()
{
    static const QStringList events{
        QStringLiteral("emmerge.power_change"),
        QStringLiteral("emmerge.current_change"),
        QStringLiteral("emmerge.voltage_change"),
        QStringLiteral("em.power_change"),
        QStringLiteral("em.current_change"),
        QStringLiteral("em.voltage_change"),
    };
    return events;
}

QString eventSuffix(const QString &event)
{
    const int dot = event.indexOf(QLatin1Char('.'));
    if (dot < 0 || dot + 1 >= event.size())
        return QStringLiteral("status_update");
    return event.mid(dot + 1);
}

int readHookId(const QJsonValue &value)
{
    if (value.isDouble())
        return value.toInt(-1);
    if (value.isObject())
        return value.toObject().value(QStringLiteral("id")).toInt(-1);
    return -1;
}

} // namespace

WebhookRegistrar::WebhookRegistrar(RpcCaller &query, RpcCaller &mutate)
    : m_query(query)
    , m_mutate(mutate)
{
}

bool WebhookRegistrar::isOwnHookName(const QString &name)
{
    if (name == QLatin1String("phirefoss") || name.startsWith(QLatin1String("phirefoss-ch")))
        return true;
    // Names used by earlier releases.
    return name == QLatin1String("homey-refoss") || name.startsWith(QLatin1String("homeyrefoss"));
}

QString WebhookRegistrar::hookName(int channelId)
{
    if (channelId <= 0)
        return QStringLiteral("phirefoss");
    return QStringLiteral("phirefoss-ch%1").arg(channelId);
}

QStringList WebhookRegistrar::supportedEvents(const QJsonValue &result)
{
    QJsonValue types = result;
    if (result.isObject() && result.toObject().contains(QStringLiteral("types")))
        types = result.toObject().value(QStringLiteral("types"));

    QStringList out;
    if (types.isObject()) {
        out = types.toObject().keys();
    } else if (types.isArray()) {
        const QJsonArray array = types.toArray();
        for (const QJsonValue &entry : array) {
            if (entry.isString())
                out.append(entry.toString());
        }
    }
    return out;
}

QString WebhookRegistrar::pickEvent(const QStringList &supported)
{
    for (const QString &event : preferredEvents()) {
        if (supported.contains(event))
            return event;
    }
    for (const QString &event : supported) {
        if (event.startsWith(QLatin1String("emmerge.")) || event.startsWith(QLatin1String("em.")))
            return event;
    }
    return {};
}

QVector<WebhookSubscription> WebhookRegistrar::parseHookList(const QJsonValue &result)
{
    QJsonArray hooks;
    if (result.isArray())
        hooks = result.toArray();
    else if (result.isObject())
        hooks = result.toObject().value(QStringLiteral("hooks")).toArray();

    QVector<WebhookSubscription> out;
    for (const QJsonValue &entry : std::as_const(hooks)) {
        if (!entry.isObject())
            continue;
        const QJsonObject obj = entry.toObject();
        WebhookSubscription hook;
        hook.id = obj.value(QStringLiteral("id")).toInt(-1);
        hook.name = obj.value(QStringLiteral("name")).toString();
        hook.event = obj.value(QStringLiteral("event")).toString();
        hook.cid = obj.value(QStringLiteral("cid")).toInt();
        hook.enabled = obj.value(QStringLiteral("enable")).toBool(true);
        const QJsonArray urls = obj.value(QStringLiteral("urls")).toArray();
        for (const QJsonValue &url : urls)
            hook.urls.append(url.toString());
        out.append(hook);
    }
    return out;
}

QString WebhookRegistrar::discoverEvent(const ConnectionSettings &settings, int timeoutMs)
{
    const RpcResult result = m_query.call(settings, QStringLiteral("Webhook.Supported.List"), {}, timeoutMs);
    if (!result.ok) {
        qCDebug(adapterLog).noquote() << "Webhook.Supported.List failed:" << result.error.toString();
        return QString::fromLatin1(kDefaultWebhookEvent);
    }

    const QString event = pickEvent(supportedEvents(result.value));
    if (event.isEmpty())
        return QString::fromLatin1(kDefaultWebhookEvent);
    return event;
}

bool WebhookRegistrar::listHooks(const ConnectionSettings &settings,
                                 QVector<WebhookSubscription> *hooks,
                                 RpcError *error,
                                 int timeoutMs)
{
    const RpcResult result = m_query.call(settings, QStringLiteral("Webhook.List"), {}, timeoutMs);
    if (!result.ok) {
        if (error)
            *error = result.error;
        return false;
    }
    if (hooks)
        *hooks = parseHookList(result.value);
    return true;
}

int WebhookRegistrar::removeOwnHooks(const ConnectionSettings &settings, int timeoutMs)
{
    QVector<WebhookSubscription> hooks;
    RpcError listError;
    if (!listHooks(settings, &hooks, &listError, timeoutMs)) {
        qCWarning(adapterLog).noquote() << "Webhook.List failed, skipping cleanup:" << listError.toString();
        return 0;
    }

    int foreign = 0;
    for (const WebhookSubscription &hook : std::as_const(hooks)) {
        if (!isOwnHookName(hook.name)) {
            ++foreign;
            continue;
        }
        QJsonObject params;
        params.insert(QStringLiteral("id"), hook.id);
        const RpcResult deleted = m_mutate.call(settings, QStringLiteral("Webhook.Delete"), params, timeoutMs);
        if (!deleted.ok) {
            qCWarning(adapterLog).noquote() << "failed to delete webhook" << hook.id << hook.name
                                            << deleted.error.toString();
            ++foreign;
        }
    }
    return foreign;
}

RpcResult WebhookRegistrar::createHook(const ConnectionSettings &settings,
                                       const QString &name,
                                       const QString &event,
                                       int cid,
                                       const QString &targetUrl,
                                       int timeoutMs)
{
    QJsonObject params;
    params.insert(QStringLiteral("name"), name);
    params.insert(QStringLiteral("event"), event);
    params.insert(QStringLiteral("cid"), cid);
    params.insert(QStringLiteral("enable"), true);
    params.insert(QStringLiteral("urls"), QJsonArray{targetUrl});
    params.insert(QStringLiteral("repeat_period"), 0);
    return m_mutate.call(settings, QStringLiteral("Webhook.Create"), params, timeoutMs);
}

WebhookRegistration WebhookRegistrar::registerHooks(const ConnectionSettings &settings,
                                                    const QString &targetUrl,
                                                    const QString &eventHint,
                                                    const QVector<int> &channelIds,
                                                    int timeoutMs)
{
    WebhookRegistration out;
    int occupied = removeOwnHooks(settings, timeoutMs);

    const QString suffix = eventSuffix(eventHint.isEmpty() ? QString::fromLatin1(kDefaultWebhookEvent) : eventHint);
    const QString aggregateEvent = QStringLiteral("emmerge.") + suffix;
    const QString channelEvent = QStringLiteral("em.") + suffix;

    RpcResult created = createHook(settings, hookName(), aggregateEvent, 1, targetUrl, timeoutMs);
    out.event = aggregateEvent;
    if (!created.ok && created.error.kind == ErrorKind::DeviceRpc) {
        qCInfo(adapterLog).noquote() << "aggregate event" << aggregateEvent << "rejected ("
                                     << created.error.message << "), using" << channelEvent;
        created = createHook(settings, hookName(), channelEvent, 1, targetUrl, timeoutMs);
        out.event = channelEvent;
        out.perChannel = true;
    }

    if (!created.ok) {
        out.error = created.error;
        return out;
    }

    out.ok = true;
    out.id = readHookId(created.value);
    out.channelHooks.insert(1, out.id);
    ++occupied;

    if (!out.perChannel)
        return out;

    for (int channelId : channelIds) {
        if (channelId == 1)
            continue;
        if (occupied >= kDeviceHookQuota) {
            out.failures.append(QStringLiteral("ch%1: device hook quota reached").arg(channelId));
            continue;
        }
        const RpcResult channelHook = createHook(settings, hookName(channelId), channelEvent, channelId, targetUrl, timeoutMs);
        if (!channelHook.ok) {
            qCWarning(adapterLog).noquote() << "per-channel webhook for ch" << channelId << "failed:"
                                            << channelHook.error.toString();
            out.failures.append(QStringLiteral("ch%1: %2").arg(channelId).arg(channelHook.error.toString()));
            continue;
        }
        out.channelHooks.insert(channelId, readHookId(channelHook.value));
        ++occupied;
    }

    return out;
}

bool WebhookRegistrar::unregisterHooks(const ConnectionSettings &settings, RpcError *error, int timeoutMs)
{
    QVector<WebhookSubscription> hooks;
    if (!listHooks(settings, &hooks, error, timeoutMs))
        return false;

    bool ok = true;
    for (const WebhookSubscription &hook : std::as_const(hooks)) {
        if (!isOwnHookName(hook.name))
            continue;
        QJsonObject params;
        params.insert(QStringLiteral("id"), hook.id);
        const RpcResult deleted = m_mutate.call(settings, QStringLiteral("Webhook.Delete"), params, timeoutMs);
        if (!deleted.ok) {
            ok = false;
            if (error)
                *error = deleted.error;
            qCWarning(adapterLog).noquote() << "failed to delete webhook" << hook.id << deleted.error.toString();
        }
    }
    return ok;
}

} // namespace phicore::refoss::ipc
