#include "refoss_push.h"

#include <QNetworkInterface>
#include <QTcpServer>
#include <QTcpSocket>
#include <QTimer>

#include "refoss_log.h"

namespace phicore::refoss::ipc {

namespace {

struct RequestHead {
    QByteArray method;
    QByteArray path;
    qint64 contentLength = 0;
};

RequestHead parseRequestHead(const QByteArray &head)
{
    RequestHead out;
    const QList<QByteArray> lines = head.split('\n');
    if (lines.isEmpty())
        return out;

    const QList<QByteArray> requestLine = lines.first().trimmed().split(' ');
    if (requestLine.size() >= 2) {
        out.method = requestLine.at(0).toUpper();
        out.path = requestLine.at(1);
    }

    for (int i = 1; i < lines.size(); ++i) {
        const QByteArray line = lines.at(i).trimmed();
        const int colon = line.indexOf(':');
        if (colon <= 0)
            continue;
        if (line.left(colon).trimmed().toLower() == "content-length")
            out.contentLength = line.mid(colon + 1).trimmed().toLongLong();
    }
    return out;
}

QString identityFromPath(const QByteArray &path)
{
    static const QByteArray prefix = QByteArrayLiteral("/webhook/");
    QByteArray clean = path;
    const int query = clean.indexOf('?');
    if (query >= 0)
        clean = clean.left(query);
    if (!clean.startsWith(prefix))
        return {};
    const QByteArray identity = clean.mid(prefix.size());
    if (identity.isEmpty() || identity.contains('/'))
        return {};
    return QString::fromUtf8(QByteArray::fromPercentEncoding(identity));
}

} // namespace

PushDispatchServer::PushDispatchServer(QObject *parent)
    : QObject(parent)
    , m_server(new QTcpServer(this))
{
    connect(m_server, &QTcpServer::newConnection, this, &PushDispatchServer::onNewConnection);
}

PushDispatchServer::~PushDispatchServer() = default;

bool PushDispatchServer::listen(quint16 port, const QHostAddress &address, QString *error)
{
    if (m_server->isListening())
        m_server->close();
    if (!m_server->listen(address, port)) {
        if (error)
            *error = QStringLiteral("Cannot listen on port %1: %2").arg(port).arg(m_server->errorString());
        return false;
    }
    qCInfo(adapterLog) << "webhook listener on port" << m_server->serverPort();
    if (error)
        error->clear();
    return true;
}

void PushDispatchServer::close()
{
    m_server->close();
    const QList<QTcpSocket *> sockets = m_pending.keys();
    for (QTcpSocket *socket : sockets)
        socket->abort();
    m_pending.clear();
}

bool PushDispatchServer::isListening() const
{
    return m_server->isListening();
}

quint16 PushDispatchServer::port() const
{
    return m_server->serverPort();
}

void PushDispatchServer::registerHandler(const QString &key, Handler handler)
{
    m_handlers.insert(key.toUpper(), std::move(handler));
    qCDebug(adapterLog) << "push handler registered for" << key.toUpper();
}

void PushDispatchServer::unregisterHandler(const QString &key)
{
    if (m_handlers.remove(key.toUpper()) > 0)
        qCDebug(adapterLog) << "push handler unregistered for" << key.toUpper();
}

bool PushDispatchServer::hasHandler(const QString &key) const
{
    return m_handlers.contains(key.toUpper());
}

void PushDispatchServer::dispatch(const QString &identity, const ChannelReading &reading)
{
    invoke(deviceKey(identity), reading);
    invoke(channelKey(identity, reading.channelId), reading);
}

void PushDispatchServer::dispatchToChannel(const QString &identity, const ChannelReading &reading)
{
    invoke(channelKey(identity, reading.channelId), reading);
}

QString PushDispatchServer::webhookUrl(const QString &localAddress, const QString &identity) const
{
    QString host = localAddress.trimmed();
    if (host.isEmpty())
        host = detectLocalAddress();
    return QStringLiteral("http://%1:%2/webhook/%3").arg(host).arg(port()).arg(deviceKey(identity));
}

QString PushDispatchServer::deviceKey(const QString &identity)
{
    return identity.trimmed().toUpper();
}

QString PushDispatchServer::channelKey(const QString &identity, int channelId)
{
    return QStringLiteral("%1:%2").arg(deviceKey(identity)).arg(channelId);
}

QString PushDispatchServer::detectLocalAddress()
{
    const QList<QHostAddress> addresses = QNetworkInterface::allAddresses();
    for (const QHostAddress &address : addresses) {
        if (address.protocol() == QAbstractSocket::IPv4Protocol && !address.isLoopback())
            return address.toString();
    }
    return QStringLiteral("127.0.0.1");
}

void PushDispatchServer::onNewConnection()
{
    while (m_server->hasPendingConnections()) {
        QTcpSocket *socket = m_server->nextPendingConnection();
        if (!socket)
            continue;
        m_pending.insert(socket, PendingRequest{});
        connect(socket, &QTcpSocket::readyRead, this, [this, socket]() { onReadyRead(socket); });
        connect(socket, &QTcpSocket::disconnected, this, [this, socket]() {
            m_pending.remove(socket);
            socket->deleteLater();
        });

        auto *deadline = new QTimer(socket);
        deadline->setSingleShot(true);
        connect(deadline, &QTimer::timeout, this, [this, socket]() {
            if (m_pending.remove(socket) == 0)
                return;
            qCDebug(adapterLog) << "aborting stalled webhook connection from"
                                << socket->peerAddress().toString();
            socket->abort();
            socket->deleteLater();
        });
        deadline->start(m_readTimeoutMs);
    }
}

void PushDispatchServer::onReadyRead(QTcpSocket *socket)
{
    auto it = m_pending.find(socket);
    if (it == m_pending.end())
        return;
    if (it->answered) {
        socket->readAll();
        return;
    }

    it->buffer.append(socket->readAll());

    const int headerEnd = it->buffer.indexOf("\r\n\r\n");
    if (headerEnd < 0) {
        if (it->buffer.size() > kMaxPushRequestBytes)
            respond(socket, 413, "Payload Too Large", "{\"ok\":false}");
        return;
    }

    const RequestHead head = parseRequestHead(it->buffer.left(headerEnd));
    if (head.contentLength < 0 || head.contentLength > kMaxPushRequestBytes
        || headerEnd + 4 + head.contentLength > kMaxPushRequestBytes) {
        respond(socket, 413, "Payload Too Large", "{\"ok\":false}");
        return;
    }

    const qint64 available = it->buffer.size() - (headerEnd + 4);
    if (available < head.contentLength)
        return;

    const QByteArray body = it->buffer.mid(headerEnd + 4, static_cast<int>(head.contentLength));
    const QString identity = identityFromPath(head.path);
    if (head.method != "POST" || identity.isEmpty()) {
        respond(socket, 404, "Not Found", "{\"ok\":false}");
        return;
    }

    respond(socket, 200, "OK", "{\"ok\":true}");
    QTimer::singleShot(0, this, [this, identity, body]() { handlePush(identity, body); });
}

void PushDispatchServer::respond(QTcpSocket *socket, int status, const QByteArray &reason, const QByteArray &body)
{
    auto it = m_pending.find(socket);
    if (it != m_pending.end()) {
        it->answered = true;
        it->buffer.clear();
    }

    QByteArray response;
    response += "HTTP/1.1 " + QByteArray::number(status) + ' ' + reason + "\r\n";
    response += "Content-Type: application/json\r\n";
    response += "Content-Length: " + QByteArray::number(body.size()) + "\r\n";
    response += "Connection: close\r\n\r\n";
    response += body;
    socket->write(response);
    socket->disconnectFromHost();
}

void PushDispatchServer::handlePush(const QString &identity, const QByteArray &body)
{
    QString error;
    const std::optional<ChannelReading> reading = parseNotifyStatus(body, &error);
    if (!reading) {
        qCWarning(adapterLog).noquote() << "dropping push for" << identity << ":" << error
                                        << logSnippet(body, 120);
        return;
    }

    dispatch(identity, *reading);
    emit pushReceived(deviceKey(identity), reading->channelId);
}

void PushDispatchServer::invoke(const QString &key, const ChannelReading &reading)
{
    // Copy: the handler may unregister itself.
    const Handler handler = m_handlers.value(key);
    if (handler)
        handler(reading);
}

} // namespace phicore::refoss::ipc
