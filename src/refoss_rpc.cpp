#include "refoss_rpc.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

namespace phicore::refoss::ipc {

bool ConnectionSettings::operator==(const ConnectionSettings &other) const
{
    return host == other.host
        && port == other.port
        && username == other.username
        && password == other.password;
}

const char *errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None:
        return "None";
    case ErrorKind::TransportTimeout:
        return "Transport/Timeout";
    case ErrorKind::TransportHttpStatus:
        return "Transport/HttpStatus";
    case ErrorKind::TransportInvalidJson:
        return "Transport/InvalidJson";
    case ErrorKind::AuthMissingCredentials:
        return "Auth/MissingCredentials";
    case ErrorKind::AuthBadCredentials:
        return "Auth/BadCredentials";
    case ErrorKind::DeviceRpc:
        return "DeviceRpc";
    case ErrorKind::ProtocolHandshakeFailed:
        return "Protocol/HandshakeFailed";
    case ErrorKind::ProtocolFrameError:
        return "Protocol/FrameError";
    case ErrorKind::ProtocolTimeout:
        return "Protocol/Timeout";
    case ErrorKind::ProtocolClosedByPeer:
        return "Protocol/ClosedByPeer";
    }
    return "Unknown";
}

QString RpcError::toString() const
{
    QString out = QString::fromLatin1(errorKindName(kind));
    if (code != 0)
        out += QStringLiteral(" (%1)").arg(code);
    if (!message.isEmpty())
        out += QStringLiteral(": ") + message;
    return out;
}

RpcResult RpcResult::success(const QJsonValue &value)
{
    RpcResult out;
    out.ok = true;
    out.value = value;
    return out;
}

RpcResult RpcResult::failure(ErrorKind kind, const QString &message, int code)
{
    RpcResult out;
    out.error.kind = kind;
    out.error.code = code;
    out.error.message = message;
    return out;
}

RpcResult parseRpcBody(const QByteArray &body)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError || doc.isNull()) {
        return RpcResult::failure(ErrorKind::TransportInvalidJson,
                                  QStringLiteral("Invalid JSON from device: %1").arg(parseError.errorString()));
    }

    if (doc.isArray())
        return RpcResult::success(doc.array());

    const QJsonObject root = doc.object();

    const QJsonValue errorValue = root.value(QStringLiteral("error"));
    if (errorValue.isObject()) {
        const QJsonObject err = errorValue.toObject();
        const int code = err.value(QStringLiteral("code")).toInt();
        QString message = err.value(QStringLiteral("message")).toString();
        if (message.isEmpty())
            message = QStringLiteral("Device returned an error");
        return RpcResult::failure(ErrorKind::DeviceRpc, message, code);
    }

    const QJsonValue codeValue = root.value(QStringLiteral("code"));
    if (codeValue.isDouble() && codeValue.toInt() < 0) {
        QString message = root.value(QStringLiteral("message")).toString();
        if (message.isEmpty())
            message = QStringLiteral("Device returned error code %1").arg(codeValue.toInt());
        return RpcResult::failure(ErrorKind::DeviceRpc, message, codeValue.toInt());
    }

    if (root.contains(QStringLiteral("result")))
        return RpcResult::success(root.value(QStringLiteral("result")));

    return RpcResult::success(root);
}

} // namespace phicore::refoss::ipc
