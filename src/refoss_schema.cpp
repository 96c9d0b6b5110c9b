#include "refoss_schema.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include "refoss_coordinator.h"
#include "refoss_push.h"

namespace phicore::refoss::ipc {

namespace {

QJsonObject responsive(int xs, int sm, int md, int lg, int xl, int xxl)
{
    QJsonObject out;
    out.insert(QStringLiteral("xs"), xs);
    out.insert(QStringLiteral("sm"), sm);
    out.insert(QStringLiteral("md"), md);
    out.insert(QStringLiteral("lg"), lg);
    out.insert(QStringLiteral("xl"), xl);
    out.insert(QStringLiteral("xxl"), xxl);
    return out;
}

QJsonObject field(const QString &key,
                  const QString &type,
                  const QString &label,
                  const QString &description,
                  const QJsonValue &defaultValue = QJsonValue(),
                  const QJsonArray &flags = {})
{
    QJsonObject out;
    out.insert(QStringLiteral("key"), key);
    out.insert(QStringLiteral("type"), type);
    out.insert(QStringLiteral("label"), label);
    out.insert(QStringLiteral("description"), description);
    if (!defaultValue.isUndefined() && !defaultValue.isNull())
        out.insert(QStringLiteral("default"), defaultValue);
    if (!flags.isEmpty())
        out.insert(QStringLiteral("flags"), flags);
    return out;
}

QJsonArray connectionFields()
{
    QJsonArray fields;

    fields.append(field(QStringLiteral("host"),
                        QStringLiteral("Hostname"),
                        QStringLiteral("Device host"),
                        QStringLiteral("IP address or hostname of the Refoss energy monitor."),
                        QJsonValue(),
                        QJsonArray{QStringLiteral("Required")}));

    fields.append(field(QStringLiteral("port"),
                        QStringLiteral("Port"),
                        QStringLiteral("Port"),
                        QStringLiteral("HTTP port of the device RPC endpoint."),
                        QJsonValue(80)));

    fields.append(field(QStringLiteral("username"),
                        QStringLiteral("String"),
                        QStringLiteral("Username"),
                        QStringLiteral("Digest username, only when device authentication is enabled."),
                        QJsonValue(QStringLiteral("admin"))));

    fields.append(field(QStringLiteral("password"),
                        QStringLiteral("Password"),
                        QStringLiteral("Password"),
                        QStringLiteral("Digest password."),
                        QJsonValue(),
                        QJsonArray{QStringLiteral("Secret")}));

    fields.append(field(QStringLiteral("model"),
                        QStringLiteral("String"),
                        QStringLiteral("Model"),
                        QStringLiteral("em01p, em06p or em16p. Detected by the probe when empty.")));

    return fields;
}

QJsonArray instanceFields()
{
    QJsonArray fields = connectionFields();

    fields.append(field(QStringLiteral("pollIntervalS"),
                        QStringLiteral("Integer"),
                        QStringLiteral("Poll interval"),
                        QStringLiteral("Seconds between status polls while push delivery is not active (5-300)."),
                        QJsonValue(kDefaultPollIntervalS)));

    fields.append(field(QStringLiteral("webhookPort"),
                        QStringLiteral("Port"),
                        QStringLiteral("Webhook port"),
                        QStringLiteral("Local port the device pushes status notifications to."),
                        QJsonValue(kDefaultWebhookPort)));

    fields.append(field(QStringLiteral("localAddress"),
                        QStringLiteral("Hostname"),
                        QStringLiteral("Webhook address"),
                        QStringLiteral("Address of this host as seen by the device. Detected when empty.")));

    fields.append(field(QStringLiteral("electricityPrice"),
                        QStringLiteral("Float"),
                        QStringLiteral("Electricity price"),
                        QStringLiteral("Price per kWh used for the daily cost channel. 0 disables it."),
                        QJsonValue(0.0)));

    fields.append(field(QStringLiteral("currency"),
                        QStringLiteral("String"),
                        QStringLiteral("Currency"),
                        QStringLiteral("Unit shown for the daily cost channel."),
                        QJsonValue(QStringLiteral("EUR"))));

    return fields;
}

QJsonObject section(const QString &title, const QString &description, const QJsonArray &fields)
{
    QJsonObject layout;
    layout.insert(QStringLiteral("gridUnits"), 24);
    QJsonArray gutter;
    gutter.append(12);
    gutter.append(8);
    layout.insert(QStringLiteral("gutter"), gutter);

    QJsonObject defaults;
    defaults.insert(QStringLiteral("span"), responsive(24, 24, 12, 12, 12, 12));
    defaults.insert(QStringLiteral("labelPosition"), QStringLiteral("Left"));
    defaults.insert(QStringLiteral("labelSpan"), 8);
    defaults.insert(QStringLiteral("controlSpan"), 16);
    defaults.insert(QStringLiteral("actionPosition"), QStringLiteral("Inline"));
    defaults.insert(QStringLiteral("actionSpan"), 6);
    layout.insert(QStringLiteral("defaults"), defaults);

    QJsonObject out;
    out.insert(QStringLiteral("title"), title);
    out.insert(QStringLiteral("description"), description);
    out.insert(QStringLiteral("layout"), layout);
    out.insert(QStringLiteral("fields"), fields);
    return out;
}

} // namespace

phicore::adapter::v1::Utf8String displayName()
{
    return "Refoss Energy Monitor";
}

phicore::adapter::v1::Utf8String description()
{
    return "Provides power and energy channels for Refoss EM01P, EM06P and EM16P monitors";
}

phicore::adapter::v1::Utf8String iconSvg()
{
    return
        "<svg width=\"24\" height=\"24\" viewBox=\"0 0 24 24\" xmlns=\"http://www.w3.org/2000/svg\" role=\"img\" aria-label=\"Refoss energy monitor\">"
        "<rect x=\"3\" y=\"3\" width=\"18\" height=\"18\" rx=\"4\" fill=\"none\" stroke=\"#2F9E6E\" stroke-width=\"1.8\"/>"
        "<path d=\"M13 5.5 8 13h3.5l-1 5.5L16 11h-3.5z\" fill=\"#2F9E6E\"/>"
        "</svg>";
}

phicore::adapter::v1::AdapterCapabilities capabilities()
{
    namespace v1 = phicore::adapter::v1;

    v1::AdapterCapabilities caps;
    caps.required = v1::AdapterRequirement::Host;
    caps.optional = v1::AdapterRequirement::Port;
    caps.flags = v1::AdapterFlag::SupportsProbe
        | v1::AdapterFlag::SupportsRename
        | v1::AdapterFlag::RequiresPolling;

    v1::AdapterActionDescriptor probe;
    probe.id = "probe";
    probe.label = "Test connection";
    probe.description = "Reachability and credentials check";
    probe.metaJson = R"({"placement":"card","kind":"command","requiresAck":true,"resultField":"identity"})";
    caps.factoryActions.push_back(probe);

    v1::AdapterActionDescriptor refresh;
    refresh.id = "refresh";
    refresh.label = "Refresh now";
    refresh.description = "Poll the energy monitor immediately.";
    refresh.metaJson = R"({"placement":"card","kind":"command","requiresAck":false})";
    caps.instanceActions.push_back(refresh);

    v1::AdapterActionDescriptor resubscribe;
    resubscribe.id = "resubscribe";
    resubscribe.label = "Re-register webhooks";
    resubscribe.description = "Delete and recreate the push subscriptions on the device.";
    resubscribe.metaJson = R"({"placement":"card","kind":"command","requiresAck":true})";
    caps.instanceActions.push_back(resubscribe);

    caps.defaultsJson = R"({"port":80,"username":"admin","pollIntervalS":10,"webhookPort":8741,"electricityPrice":0,"currency":"EUR"})";
    return caps;
}

phicore::adapter::v1::JsonText configSchemaJson()
{
    QJsonObject schema;
    schema.insert(QStringLiteral("factory"),
                  section(QStringLiteral("Refoss Energy Monitor"),
                          QStringLiteral("Configure connection to a Refoss energy monitor."),
                          connectionFields()));
    schema.insert(QStringLiteral("instance"),
                  section(QStringLiteral("Refoss Energy Monitor"),
                          QStringLiteral("Connection, push delivery and pricing settings."),
                          instanceFields()));

    return QJsonDocument(schema).toJson(QJsonDocument::Compact).toStdString();
}

} // namespace phicore::refoss::ipc
