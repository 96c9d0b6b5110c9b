#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QString>

#include "refoss_rpc.h"

class QNetworkAccessManager;
class QNetworkRequest;

namespace phicore::refoss::ipc {

struct HttpResult {
    int statusCode = 0;
    bool timedOut = false;
    QByteArray payload;
    QByteArray authenticate;
    QString error;
};

class HttpClient final : public RpcCaller
{
public:
    explicit HttpClient(QNetworkAccessManager *manager);

    RpcResult get(const ConnectionSettings &settings,
                  const QString &path,
                  int timeoutMs = kDefaultRpcTimeoutMs);

    RpcResult post(const ConnectionSettings &settings,
                   const QString &path,
                   const QJsonObject &body,
                   int timeoutMs = kDefaultRpcTimeoutMs);

    // GET /rpc/<method>?k=v
    RpcResult call(const ConnectionSettings &settings,
                   const QString &method,
                   const QJsonObject &params = {},
                   int timeoutMs = kDefaultRpcTimeoutMs) override;

    quint32 nonceCount() const { return m_nonceCount; }

    static QString rpcPath(const QString &method, const QJsonObject &params);

private:
    RpcResult exchange(const ConnectionSettings &settings,
                       const QByteArray &method,
                       const QString &path,
                       const QByteArray &payload,
                       int timeoutMs);

    bool buildRequest(const ConnectionSettings &settings,
                      const QString &path,
                      bool hasJsonBody,
                      QNetworkRequest *request,
                      QString *error = nullptr) const;

    HttpResult request(const ConnectionSettings &settings,
                       const QByteArray &method,
                       const QString &path,
                       const QByteArray &payload,
                       const QByteArray &authorization,
                       int timeoutMs) const;

    QNetworkAccessManager *m_manager = nullptr;
    quint32 m_nonceCount = 0;
};

} // namespace phicore::refoss::ipc
