#include "refoss_rpcsocket.h"

#include <algorithm>

#include <QEventLoop>
#include <QJsonDocument>
#include <QRandomGenerator>
#include <QTcpSocket>
#include <QTimer>

#include "refoss_log.h"
#include "refoss_wsframe.h"

namespace phicore::refoss::ipc {

namespace {

constexpr int kMaxHandshakeBytes = 16 * 1024;

QByteArray makeHandshakeKey()
{
    QByteArray raw(16, Qt::Uninitialized);
    for (int i = 0; i < raw.size(); ++i)
        raw[i] = static_cast<char>(QRandomGenerator::global()->bounded(256));
    return raw.toBase64();
}

struct HandshakeResponse {
    int status = 0;
    QByteArray accept;
    QByteArray authenticate;
};

HandshakeResponse parseHandshakeResponse(const QByteArray &head)
{
    HandshakeResponse out;
    const QList<QByteArray> lines = head.split('\n');
    if (lines.isEmpty())
        return out;

    const QList<QByteArray> statusParts = lines.first().trimmed().split(' ');
    if (statusParts.size() >= 2 && statusParts.first().startsWith("HTTP/"))
        out.status = statusParts.at(1).toInt();

    for (int i = 1; i < lines.size(); ++i) {
        const QByteArray line = lines.at(i).trimmed();
        const int colon = line.indexOf(':');
        if (colon <= 0)
            continue;
        const QByteArray name = line.left(colon).trimmed().toLower();
        const QByteArray value = line.mid(colon + 1).trimmed();
        if (name == "sec-websocket-accept")
            out.accept = value;
        else if (name == "www-authenticate")
            out.authenticate = value;
    }
    return out;
}

} // namespace

QByteArray RpcSocketClient::handshakeRequest(const ConnectionSettings &settings,
                                             const QByteArray &key,
                                             const QByteArray &authorization)
{
    const int port = settings.port > 0 ? settings.port : 80;
    QByteArray request;
    request += "GET /rpc HTTP/1.1\r\n";
    request += "Host: " + settings.host.toUtf8();
    if (port != 80)
        request += ':' + QByteArray::number(port);
    request += "\r\n";
    request += "Upgrade: websocket\r\n";
    request += "Connection: Upgrade\r\n";
    request += "Sec-WebSocket-Key: " + key + "\r\n";
    request += "Sec-WebSocket-Version: 13\r\n";
    request += "User-Agent: phi-adapter-refoss-ipc/1.0\r\n";
    if (!authorization.isEmpty())
        request += "Authorization: " + authorization + "\r\n";
    request += "\r\n";
    return request;
}

RpcResult RpcSocketClient::call(const ConnectionSettings &settings,
                                const QString &method,
                                const QJsonObject &params,
                                int timeoutMs)
{
    if (settings.host.trimmed().isEmpty())
        return RpcResult::failure(ErrorKind::ProtocolHandshakeFailed, QStringLiteral("Device host is empty"));

    const int requestId = m_nextId++;

    QJsonObject envelope;
    envelope.insert(QStringLiteral("id"), requestId);
    envelope.insert(QStringLiteral("src"), m_source);
    envelope.insert(QStringLiteral("method"), method);
    envelope.insert(QStringLiteral("params"), params);
    const QByteArray message = QJsonDocument(envelope).toJson(QJsonDocument::Compact);

    SessionOutcome outcome = runSession(settings, message, requestId, {}, timeoutMs);
    if (outcome.handshakeStatus != 401)
        return outcome.result;

    if (!settings.hasCredentials()) {
        return RpcResult::failure(ErrorKind::AuthMissingCredentials,
                                  QStringLiteral("Device requires authentication, set username and password"),
                                  401);
    }

    const DigestChallenge challenge = parseDigestChallenge(outcome.authenticate);
    if (!challenge.isValid()) {
        return RpcResult::failure(ErrorKind::ProtocolHandshakeFailed,
                                  QStringLiteral("WebSocket upgrade rejected without a Digest challenge"),
                                  401);
    }

    ++m_nonceCount;
    const QByteArray authorization = buildDigestAuthorization(challenge,
                                                              settings.username,
                                                              settings.password,
                                                              QByteArrayLiteral("GET"),
                                                              QStringLiteral("/rpc"),
                                                              m_nonceCount,
                                                              makeClientNonce());

    outcome = runSession(settings, message, requestId, authorization, timeoutMs);
    if (outcome.handshakeStatus == 401) {
        return RpcResult::failure(ErrorKind::AuthBadCredentials,
                                  QStringLiteral("Authentication failed, check username and password"),
                                  401);
    }
    return outcome.result;
}

RpcSocketClient::SessionOutcome RpcSocketClient::runSession(const ConnectionSettings &settings,
                                                            const QByteArray &message,
                                                            int requestId,
                                                            const QByteArray &authorization,
                                                            int timeoutMs)
{
    SessionOutcome outcome;

    const QByteArray key = makeHandshakeKey();
    const int port = settings.port > 0 ? settings.port : 80;

    QTcpSocket socket;
    QEventLoop loop;
    QTimer deadline;
    deadline.setSingleShot(true);

    QByteArray head;
    bool upgraded = false;
    bool finished = false;
    bool peerClosed = false;
    bool closeFrameReceived = false;
    QByteArray peerCloseCode;
    ws::FrameDecoder decoder;
    QByteArray partial;
    bool inMessage = false;

    const auto finish = [&](const RpcResult &result) {
        if (finished)
            return;
        finished = true;
        outcome.result = result;
        loop.quit();
    };

    const auto handleMessage = [&](const QByteArray &text) {
        const QJsonDocument doc = QJsonDocument::fromJson(text);
        if (!doc.isObject()) {
            qCDebug(adapterLog).noquote() << "ignoring non-JSON websocket message" << logSnippet(text, 80);
            return;
        }
        const QJsonObject obj = doc.object();
        if (obj.value(QStringLiteral("id")).toInt(-1) != requestId)
            return;

        const QJsonValue errorValue = obj.value(QStringLiteral("error"));
        if (errorValue.isObject()) {
            const QJsonObject err = errorValue.toObject();
            QString errorText = err.value(QStringLiteral("message")).toString();
            if (errorText.isEmpty())
                errorText = QStringLiteral("Device returned an error");
            finish(RpcResult::failure(ErrorKind::DeviceRpc, errorText, err.value(QStringLiteral("code")).toInt()));
            return;
        }
        finish(RpcResult::success(obj.value(QStringLiteral("result"))));
    };

    const auto drainFrames = [&]() {
        ws::Frame frame;
        QString frameError;
        while (!finished) {
            const ws::FrameDecoder::Status status = decoder.next(&frame, &frameError);
            if (status == ws::FrameDecoder::Status::NeedMore)
                return;
            if (status == ws::FrameDecoder::Status::Error) {
                finish(RpcResult::failure(ErrorKind::ProtocolFrameError, frameError));
                return;
            }

            switch (frame.opcode) {
            case ws::Opcode::Ping:
                socket.write(ws::encodeFrame(ws::Opcode::Pong, frame.payload));
                break;
            case ws::Opcode::Pong:
                break;
            case ws::Opcode::Close:
                closeFrameReceived = true;
                peerCloseCode = frame.payload.left(2);
                finish(RpcResult::failure(ErrorKind::ProtocolClosedByPeer,
                                          QStringLiteral("Device closed the connection")));
                break;
            case ws::Opcode::Text:
            case ws::Opcode::Binary:
                if (inMessage) {
                    finish(RpcResult::failure(ErrorKind::ProtocolFrameError,
                                              QStringLiteral("New message started inside a fragmented one")));
                    return;
                }
                if (frame.fin) {
                    handleMessage(frame.payload);
                } else {
                    partial = frame.payload;
                    inMessage = true;
                }
                break;
            case ws::Opcode::Continuation:
                if (!inMessage) {
                    finish(RpcResult::failure(ErrorKind::ProtocolFrameError,
                                              QStringLiteral("Continuation frame without a message")));
                    return;
                }
                partial.append(frame.payload);
                if (partial.size() > ws::kMaxPayloadBytes) {
                    finish(RpcResult::failure(ErrorKind::ProtocolFrameError,
                                              QStringLiteral("Reassembled message too large")));
                    return;
                }
                if (frame.fin) {
                    inMessage = false;
                    const QByteArray complete = partial;
                    partial.clear();
                    handleMessage(complete);
                }
                break;
            }
        }
    };

    QObject::connect(&socket, &QTcpSocket::connected, &loop, [&]() {
        socket.write(handshakeRequest(settings, key, authorization));
    });

    QObject::connect(&socket, &QTcpSocket::readyRead, &loop, [&]() {
        const QByteArray bytes = socket.readAll();
        if (upgraded) {
            decoder.feed(bytes);
            drainFrames();
            return;
        }

        head.append(bytes);
        const int end = head.indexOf("\r\n\r\n");
        if (end < 0) {
            if (head.size() > kMaxHandshakeBytes)
                finish(RpcResult::failure(ErrorKind::ProtocolHandshakeFailed, QStringLiteral("Handshake response too large")));
            return;
        }

        const HandshakeResponse response = parseHandshakeResponse(head.left(end));
        const QByteArray rest = head.mid(end + 4);
        head.clear();
        outcome.handshakeStatus = response.status;

        if (response.status == 401) {
            outcome.authenticate = response.authenticate;
            finish(RpcResult::failure(ErrorKind::ProtocolHandshakeFailed,
                                      QStringLiteral("WebSocket upgrade requires authentication"),
                                      401));
            return;
        }
        if (response.status != 101) {
            finish(RpcResult::failure(ErrorKind::ProtocolHandshakeFailed,
                                      QStringLiteral("WebSocket upgrade failed with HTTP %1").arg(response.status),
                                      response.status));
            return;
        }
        if (!response.accept.isEmpty() && response.accept != ws::acceptKey(key)) {
            finish(RpcResult::failure(ErrorKind::ProtocolHandshakeFailed,
                                      QStringLiteral("Sec-WebSocket-Accept mismatch")));
            return;
        }

        upgraded = true;
        socket.write(ws::encodeFrame(ws::Opcode::Text, message));
        if (!rest.isEmpty()) {
            decoder.feed(rest);
            drainFrames();
        }
    });

    QObject::connect(&socket, &QAbstractSocket::errorOccurred, &loop, [&](QAbstractSocket::SocketError code) {
        if (code == QAbstractSocket::RemoteHostClosedError && upgraded) {
            peerClosed = true;
            finish(RpcResult::failure(ErrorKind::ProtocolClosedByPeer, QStringLiteral("Device closed the connection")));
            return;
        }
        const ErrorKind kind = upgraded ? ErrorKind::ProtocolClosedByPeer : ErrorKind::ProtocolHandshakeFailed;
        finish(RpcResult::failure(kind, socket.errorString()));
    });

    QObject::connect(&deadline, &QTimer::timeout, &loop, [&]() {
        finish(RpcResult::failure(ErrorKind::ProtocolTimeout,
                                  QStringLiteral("Timeout waiting for %1 response").arg(upgraded ? QLatin1String("RPC") : QLatin1String("WebSocket upgrade"))));
    });

    deadline.start(timeoutMs > 0 ? timeoutMs : kDefaultRpcTimeoutMs);
    socket.connectToHost(settings.host.trimmed(), static_cast<quint16>(port));
    if (!finished)
        loop.exec();

    deadline.stop();
    QObject::disconnect(&socket, nullptr, &loop, nullptr);

    if (!outcome.result.ok)
        qCDebug(adapterLog).noquote() << "websocket rpc failed:" << outcome.result.error.toString();

    // Graceful close: send close(1000), or echo the status of a close frame
    // the device sent first, then give the peer a moment to hang up.
    if (upgraded && !peerClosed && socket.state() == QAbstractSocket::ConnectedState) {
        const QByteArray closeBody = closeFrameReceived && peerCloseCode.size() == 2
            ? peerCloseCode
            : ws::closePayload(ws::kCloseNormal);
        socket.write(ws::encodeFrame(ws::Opcode::Close, closeBody));
        socket.flush();

        QEventLoop closeLoop;
        QTimer grace;
        grace.setSingleShot(true);
        QObject::connect(&socket, &QTcpSocket::disconnected, &closeLoop, &QEventLoop::quit);
        QObject::connect(&grace, &QTimer::timeout, &closeLoop, &QEventLoop::quit);
        grace.start(std::max(0, m_closeGraceMs));
        if (socket.state() == QAbstractSocket::ConnectedState)
            closeLoop.exec();
        QObject::disconnect(&socket, nullptr, &closeLoop, nullptr);
    }

    socket.abort();
    return outcome;
}

} // namespace phicore::refoss::ipc
