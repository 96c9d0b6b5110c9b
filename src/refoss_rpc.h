#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>

namespace phicore::refoss::ipc {

inline constexpr int kDefaultRpcTimeoutMs = 8000;

struct ConnectionSettings {
    QString host;
    int port = 80;
    QString username;
    QString password;

    bool hasCredentials() const { return !username.isEmpty(); }
    bool operator==(const ConnectionSettings &other) const;
    bool operator!=(const ConnectionSettings &other) const { return !(*this == other); }
};

enum class ErrorKind {
    None,
    TransportTimeout,
    TransportHttpStatus,
    TransportInvalidJson,
    AuthMissingCredentials,
    AuthBadCredentials,
    DeviceRpc,
    ProtocolHandshakeFailed,
    ProtocolFrameError,
    ProtocolTimeout,
    ProtocolClosedByPeer
};

const char *errorKindName(ErrorKind kind);

struct RpcError {
    ErrorKind kind = ErrorKind::None;
    // HTTP status for transport errors, the device's code for DeviceRpc.
    int code = 0;
    QString message;

    bool isTimeout() const
    {
        return kind == ErrorKind::TransportTimeout || kind == ErrorKind::ProtocolTimeout;
    }
    QString toString() const;
};

struct RpcResult {
    bool ok = false;
    QJsonValue value;
    RpcError error;

    static RpcResult success(const QJsonValue &value);
    static RpcResult failure(ErrorKind kind, const QString &message, int code = 0);
};

// Decodes a device response body. Accepts both error envelopes
// ({error:{code,message}} and the legacy {code<0,message}) and unwraps
// "result" when it is present.
RpcResult parseRpcBody(const QByteArray &body);

class RpcCaller
{
public:
    virtual ~RpcCaller() = default;

    virtual RpcResult call(const ConnectionSettings &settings,
                           const QString &method,
                           const QJsonObject &params = {},
                           int timeoutMs = kDefaultRpcTimeoutMs) = 0;
};

} // namespace phicore::refoss::ipc
