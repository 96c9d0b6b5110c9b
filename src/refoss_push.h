#pragma once

#include <functional>

#include <QByteArray>
#include <QHash>
#include <QHostAddress>
#include <QObject>
#include <QString>

#include "refoss_status.h"

class QTcpServer;
class QTcpSocket;

namespace phicore::refoss::ipc {

inline constexpr quint16 kDefaultWebhookPort = 8741;
inline constexpr int kMaxPushRequestBytes = 64 * 1024;
inline constexpr int kPushReadTimeoutMs = 5000;

// Inbound HTTP listener for device push notifications. Devices POST to
// /webhook/<IDENTITY>; the request is acknowledged first and parsed on the
// next event loop turn.
class PushDispatchServer : public QObject
{
    Q_OBJECT
public:
    using Handler = std::function<void(const ChannelReading &)>;

    explicit PushDispatchServer(QObject *parent = nullptr);
    ~PushDispatchServer() override;

    bool listen(quint16 port = kDefaultWebhookPort,
                const QHostAddress &address = QHostAddress::Any,
                QString *error = nullptr);
    void close();
    bool isListening() const;
    quint16 port() const;

    // Connections still open after this long are aborted.
    void setReadTimeoutMs(int timeoutMs) { m_readTimeoutMs = timeoutMs; }
    int pendingConnections() const { return m_pending.size(); }

    void registerHandler(const QString &key, Handler handler);
    void unregisterHandler(const QString &key);
    bool hasHandler(const QString &key) const;

    // Invokes the device handler and the IDENTITY:<channelId> handler.
    void dispatch(const QString &identity, const ChannelReading &reading);
    // Invokes only the IDENTITY:<channelId> handler.
    void dispatchToChannel(const QString &identity, const ChannelReading &reading);

    QString webhookUrl(const QString &localAddress, const QString &identity) const;

    static QString deviceKey(const QString &identity);
    static QString channelKey(const QString &identity, int channelId);
    static QString detectLocalAddress();

signals:
    void pushReceived(const QString &identity, int channelId);

private slots:
    void onNewConnection();

private:
    struct PendingRequest {
        QByteArray buffer;
        bool answered = false;
    };

    void onReadyRead(QTcpSocket *socket);
    void respond(QTcpSocket *socket, int status, const QByteArray &reason, const QByteArray &body);
    void handlePush(const QString &identity, const QByteArray &body);
    void invoke(const QString &key, const ChannelReading &reading);

    QTcpServer *m_server = nullptr;
    QHash<QTcpSocket *, PendingRequest> m_pending;
    QHash<QString, Handler> m_handlers;
    int m_readTimeoutMs = kPushReadTimeoutMs;
};

} // namespace phicore::refoss::ipc
