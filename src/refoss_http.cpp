#include "refoss_http.h"

#include <QEventLoop>
#include <QJsonArray>
#include <QJsonDocument>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QStringList>
#include <QTimer>
#include <QUrl>

#include "refoss_digest.h"
#include "refoss_log.h"

namespace phicore::refoss::ipc {

namespace {

QString queryValue(const QJsonValue &value)
{
    switch (value.type()) {
    case QJsonValue::Bool:
        return value.toBool() ? QStringLiteral("true") : QStringLiteral("false");
    case QJsonValue::Double: {
        const double number = value.toDouble();
        const qint64 integral = static_cast<qint64>(number);
        if (static_cast<double>(integral) == number)
            return QString::number(integral);
        return QString::number(number, 'g', 12);
    }
    case QJsonValue::String:
        return value.toString();
    case QJsonValue::Array:
        return QString::fromUtf8(QJsonDocument(value.toArray()).toJson(QJsonDocument::Compact));
    case QJsonValue::Object:
        return QString::fromUtf8(QJsonDocument(value.toObject()).toJson(QJsonDocument::Compact));
    default:
        return QStringLiteral("null");
    }
}

} // namespace

HttpClient::HttpClient(QNetworkAccessManager *manager)
    : m_manager(manager)
{
}

RpcResult HttpClient::get(const ConnectionSettings &settings, const QString &path, int timeoutMs)
{
    return exchange(settings, QByteArrayLiteral("GET"), path, {}, timeoutMs);
}

RpcResult HttpClient::post(const ConnectionSettings &settings,
                           const QString &path,
                           const QJsonObject &body,
                           int timeoutMs)
{
    return exchange(settings,
                    QByteArrayLiteral("POST"),
                    path,
                    QJsonDocument(body).toJson(QJsonDocument::Compact),
                    timeoutMs);
}

RpcResult HttpClient::call(const ConnectionSettings &settings,
                           const QString &method,
                           const QJsonObject &params,
                           int timeoutMs)
{
    return get(settings, rpcPath(method, params), timeoutMs);
}

QString HttpClient::rpcPath(const QString &method, const QJsonObject &params)
{
    QString path = QStringLiteral("/rpc/") + method;
    if (params.isEmpty())
        return path;

    QStringList pairs;
    for (auto it = params.constBegin(); it != params.constEnd(); ++it) {
        pairs.append(QString::fromLatin1(QUrl::toPercentEncoding(it.key()))
                     + QLatin1Char('=')
                     + QString::fromLatin1(QUrl::toPercentEncoding(queryValue(it.value()))));
    }
    return path + QLatin1Char('?') + pairs.join(QLatin1Char('&'));
}

RpcResult HttpClient::exchange(const ConnectionSettings &settings,
                               const QByteArray &method,
                               const QString &path,
                               const QByteArray &payload,
                               int timeoutMs)
{
    HttpResult first = request(settings, method, path, payload, {}, timeoutMs);
    if (first.timedOut)
        return RpcResult::failure(ErrorKind::TransportTimeout, QStringLiteral("Timeout calling %1").arg(path));

    HttpResult answer = first;
    if (first.statusCode == 401) {
        if (!settings.hasCredentials()) {
            return RpcResult::failure(ErrorKind::AuthMissingCredentials,
                                      QStringLiteral("Device requires authentication, set username and password"),
                                      401);
        }

        const DigestChallenge challenge = parseDigestChallenge(first.authenticate);
        if (!challenge.isValid()) {
            return RpcResult::failure(ErrorKind::AuthBadCredentials,
                                      QStringLiteral("Device sent no usable Digest challenge"),
                                      401);
        }

        ++m_nonceCount;
        const QByteArray authorization = buildDigestAuthorization(challenge,
                                                                  settings.username,
                                                                  settings.password,
                                                                  method,
                                                                  path,
                                                                  m_nonceCount,
                                                                  makeClientNonce());
        answer = request(settings, method, path, payload, authorization, timeoutMs);
        if (answer.timedOut)
            return RpcResult::failure(ErrorKind::TransportTimeout, QStringLiteral("Timeout calling %1").arg(path));
        if (answer.statusCode == 401) {
            return RpcResult::failure(ErrorKind::AuthBadCredentials,
                                      QStringLiteral("Authentication failed, check username and password"),
                                      401);
        }
    }

    if (answer.statusCode == 0) {
        const QString message = answer.error.isEmpty() ? QStringLiteral("Connection failed") : answer.error;
        return RpcResult::failure(ErrorKind::TransportHttpStatus, message, 0);
    }
    if (answer.statusCode != 200) {
        return RpcResult::failure(ErrorKind::TransportHttpStatus,
                                  QStringLiteral("HTTP %1 from device").arg(answer.statusCode),
                                  answer.statusCode);
    }

    RpcResult parsed = parseRpcBody(answer.payload);
    if (!parsed.ok && parsed.error.kind == ErrorKind::TransportInvalidJson)
        qCDebug(adapterLog).noquote() << "invalid JSON from" << path << logSnippet(answer.payload, 120);
    return parsed;
}

bool HttpClient::buildRequest(const ConnectionSettings &settings,
                              const QString &path,
                              bool hasJsonBody,
                              QNetworkRequest *request,
                              QString *error) const
{
    if (!request) {
        if (error)
            *error = QStringLiteral("Request object is null");
        return false;
    }

    const QString host = settings.host.trimmed();
    if (host.isEmpty()) {
        if (error)
            *error = QStringLiteral("Device host is empty");
        return false;
    }

    const int queryStart = path.indexOf(QLatin1Char('?'));
    const QString pathPart = queryStart >= 0 ? path.left(queryStart) : path;

    QUrl url;
    url.setScheme(QStringLiteral("http"));
    url.setHost(host);
    url.setPort(settings.port > 0 ? settings.port : 80);
    url.setPath(pathPart.startsWith(QLatin1Char('/')) ? pathPart : QStringLiteral("/") + pathPart);
    if (queryStart >= 0)
        url.setQuery(path.mid(queryStart + 1), QUrl::TolerantMode);

    QNetworkRequest out(url);
    out.setRawHeader("Accept", "application/json");
    out.setRawHeader("User-Agent", "phi-adapter-refoss-ipc/1.0");
    out.setRawHeader("Connection", "close");
    if (hasJsonBody)
        out.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));

    *request = out;
    if (error)
        error->clear();
    return true;
}

HttpResult HttpClient::request(const ConnectionSettings &settings,
                               const QByteArray &method,
                               const QString &path,
                               const QByteArray &payload,
                               const QByteArray &authorization,
                               int timeoutMs) const
{
    HttpResult result;

    if (!m_manager) {
        result.error = QStringLiteral("Network manager unavailable");
        return result;
    }

    QNetworkRequest requestObj;
    if (!buildRequest(settings, path, method == QByteArrayLiteral("POST"), &requestObj, &result.error))
        return result;
    if (!authorization.isEmpty())
        requestObj.setRawHeader("Authorization", authorization);

    QNetworkReply *reply = nullptr;
    if (method == QByteArrayLiteral("GET"))
        reply = m_manager->get(requestObj);
    else if (method == QByteArrayLiteral("POST"))
        reply = m_manager->post(requestObj, payload);
    else
        reply = m_manager->sendCustomRequest(requestObj, method, payload);

    if (!reply) {
        result.error = QStringLiteral("Failed to create network request");
        return result;
    }

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    bool timedOut = false;

    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timer, &QTimer::timeout, &loop, [&]() {
        timedOut = true;
        loop.quit();
    });

    timer.start(timeoutMs > 0 ? timeoutMs : kDefaultRpcTimeoutMs);
    loop.exec();

    if (timedOut) {
        reply->abort();
        reply->deleteLater();
        result.timedOut = true;
        result.error = QStringLiteral("Request timed out");
        return result;
    }

    result.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    result.payload = reply->readAll();
    result.authenticate = reply->rawHeader("WWW-Authenticate");

    // HTTP-level errors (401, 404, ...) still carry a status code and are
    // classified by the caller.
    if (reply->error() != QNetworkReply::NoError && result.statusCode == 0)
        result.error = reply->errorString();

    reply->deleteLater();
    return result;
}

} // namespace phicore::refoss::ipc
