#pragma once

#include <QByteArray>
#include <QString>

namespace phicore::refoss::ipc::ws {

enum class Opcode : quint8 {
    Continuation = 0x0,
    Text = 0x1,
    Binary = 0x2,
    Close = 0x8,
    Ping = 0x9,
    Pong = 0xA
};

inline constexpr quint16 kCloseNormal = 1000;
inline constexpr qint64 kMaxPayloadBytes = 16 * 1024 * 1024;

struct Frame {
    bool fin = true;
    Opcode opcode = Opcode::Text;
    bool masked = false;
    QByteArray payload;

    bool isControl() const { return static_cast<quint8>(opcode) & 0x8; }
};

// Client frames carry a random mask key.
QByteArray encodeFrame(Opcode opcode, const QByteArray &payload, bool fin = true, bool mask = true);
QByteArray encodeFrame(Opcode opcode, const QByteArray &payload, bool fin, const QByteArray &maskKey);

QByteArray closePayload(quint16 code, const QByteArray &reason = {});

// Sec-WebSocket-Accept value for a handshake key (RFC 6455 section 4.2.2).
QByteArray acceptKey(const QByteArray &key);

// Incremental decoder for a byte stream. Masked and unmasked frames are
// both accepted; payloads come out unmasked.
class FrameDecoder
{
public:
    enum class Status {
        NeedMore,
        Frame,
        Error
    };

    void feed(const QByteArray &bytes);
    Status next(Frame *frame, QString *error = nullptr);
    void clear();

    qsizetype buffered() const { return m_buffer.size(); }

private:
    QByteArray m_buffer;
};

} // namespace phicore::refoss::ipc::ws
