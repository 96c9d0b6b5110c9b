#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QString>

#include "refoss_digest.h"
#include "refoss_rpc.h"

namespace phicore::refoss::ipc {

// JSON-RPC over a short-lived WebSocket connection to /rpc. Used for the
// mutating calls the HTTP endpoint rejects. Every call opens its own
// connection and closes it gracefully, also on failure.
class RpcSocketClient final : public RpcCaller
{
public:
    RpcSocketClient() = default;

    RpcResult call(const ConnectionSettings &settings,
                   const QString &method,
                   const QJsonObject &params = {},
                   int timeoutMs = kDefaultRpcTimeoutMs) override;

    void setCloseGraceMs(int graceMs) { m_closeGraceMs = graceMs; }
    void setSource(const QString &source) { m_source = source; }

    static QByteArray handshakeRequest(const ConnectionSettings &settings,
                                       const QByteArray &key,
                                       const QByteArray &authorization = {});

private:
    struct SessionOutcome {
        RpcResult result;
        int handshakeStatus = 0;
        QByteArray authenticate;
    };

    SessionOutcome runSession(const ConnectionSettings &settings,
                              const QByteArray &message,
                              int requestId,
                              const QByteArray &authorization,
                              int timeoutMs);

    int m_nextId = 1;
    int m_closeGraceMs = 300;
    quint32 m_nonceCount = 0;
    QString m_source = QStringLiteral("phi-adapter-refoss");
};

} // namespace phicore::refoss::ipc
