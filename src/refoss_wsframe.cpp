#include "refoss_wsframe.h"

#include <QCryptographicHash>
#include <QRandomGenerator>

namespace phicore::refoss::ipc::ws {

namespace {

bool isKnownOpcode(quint8 opcode)
{
    switch (opcode) {
    case 0x0:
    case 0x1:
    case 0x2:
    case 0x8:
    case 0x9:
    case 0xA:
        return true;
    default:
        return false;
    }
}

QByteArray randomMaskKey()
{
    const quint32 value = QRandomGenerator::global()->generate();
    QByteArray key(4, Qt::Uninitialized);
    key[0] = static_cast<char>((value >> 24) & 0xFF);
    key[1] = static_cast<char>((value >> 16) & 0xFF);
    key[2] = static_cast<char>((value >> 8) & 0xFF);
    key[3] = static_cast<char>(value & 0xFF);
    return key;
}

} // namespace

QByteArray encodeFrame(Opcode opcode, const QByteArray &payload, bool fin, bool mask)
{
    return encodeFrame(opcode, payload, fin, mask ? randomMaskKey() : QByteArray());
}

QByteArray encodeFrame(Opcode opcode, const QByteArray &payload, bool fin, const QByteArray &maskKey)
{
    const bool masked = maskKey.size() == 4;
    const quint64 len = static_cast<quint64>(payload.size());

    QByteArray frame;
    frame.reserve(static_cast<int>(2 + 8 + 4 + len));
    frame.append(static_cast<char>((fin ? 0x80 : 0x00) | static_cast<quint8>(opcode)));

    const quint8 maskBit = masked ? 0x80 : 0x00;
    if (len <= 125) {
        frame.append(static_cast<char>(maskBit | static_cast<quint8>(len)));
    } else if (len <= 0xFFFF) {
        frame.append(static_cast<char>(maskBit | 126));
        frame.append(static_cast<char>((len >> 8) & 0xFF));
        frame.append(static_cast<char>(len & 0xFF));
    } else {
        frame.append(static_cast<char>(maskBit | 127));
        for (int i = 7; i >= 0; --i)
            frame.append(static_cast<char>((len >> (i * 8)) & 0xFF));
    }

    if (!masked) {
        frame.append(payload);
        return frame;
    }

    frame.append(maskKey);
    const int offset = frame.size();
    frame.append(payload);
    for (int i = 0; i < payload.size(); ++i)
        frame[offset + i] = static_cast<char>(frame.at(offset + i) ^ maskKey.at(i % 4));
    return frame;
}

QByteArray closePayload(quint16 code, const QByteArray &reason)
{
    QByteArray out;
    out.append(static_cast<char>((code >> 8) & 0xFF));
    out.append(static_cast<char>(code & 0xFF));
    out.append(reason.left(123));
    return out;
}

QByteArray acceptKey(const QByteArray &key)
{
    static const QByteArray guid = QByteArrayLiteral("258EAFA5-E914-47DA-95CA-C5AB0DC85B11");
    return QCryptographicHash::hash(key.trimmed() + guid, QCryptographicHash::Sha1).toBase64();
}

void FrameDecoder::feed(const QByteArray &bytes)
{
    m_buffer.append(bytes);
}

FrameDecoder::Status FrameDecoder::next(Frame *frame, QString *error)
{
    if (m_buffer.size() < 2)
        return Status::NeedMore;

    const auto *data = reinterpret_cast<const quint8 *>(m_buffer.constData());
    const quint8 b0 = data[0];
    const quint8 b1 = data[1];

    const bool fin = b0 & 0x80;
    const quint8 opcode = b0 & 0x0F;
    const bool masked = b1 & 0x80;

    if (b0 & 0x70) {
        if (error)
            *error = QStringLiteral("Reserved bits set in frame header");
        return Status::Error;
    }
    if (!isKnownOpcode(opcode)) {
        if (error)
            *error = QStringLiteral("Reserved opcode 0x%1").arg(static_cast<uint>(opcode), 0, 16);
        return Status::Error;
    }

    quint64 len = b1 & 0x7F;
    int headerLen = 2;
    if (len == 126) {
        if (m_buffer.size() < 4)
            return Status::NeedMore;
        len = (static_cast<quint64>(data[2]) << 8) | data[3];
        headerLen = 4;
    } else if (len == 127) {
        if (m_buffer.size() < 10)
            return Status::NeedMore;
        len = 0;
        for (int i = 0; i < 8; ++i)
            len = (len << 8) | data[2 + i];
        headerLen = 10;
    }

    const bool control = opcode & 0x8;
    if (control && (len > 125 || !fin)) {
        if (error)
            *error = QStringLiteral("Invalid control frame");
        return Status::Error;
    }
    if (len > static_cast<quint64>(kMaxPayloadBytes)) {
        if (error)
            *error = QStringLiteral("Frame payload too large (%1 bytes)").arg(len);
        return Status::Error;
    }

    const int maskLen = masked ? 4 : 0;
    const int total = headerLen + maskLen + static_cast<int>(len);
    if (m_buffer.size() < total)
        return Status::NeedMore;

    QByteArray payload = m_buffer.mid(headerLen + maskLen, static_cast<int>(len));
    if (masked) {
        const QByteArray key = m_buffer.mid(headerLen, 4);
        for (int i = 0; i < payload.size(); ++i)
            payload[i] = static_cast<char>(payload.at(i) ^ key.at(i % 4));
    }
    m_buffer.remove(0, total);

    if (frame) {
        frame->fin = fin;
        frame->opcode = static_cast<Opcode>(opcode);
        frame->masked = masked;
        frame->payload = payload;
    }
    return Status::Frame;
}

void FrameDecoder::clear()
{
    m_buffer.clear();
}

} // namespace phicore::refoss::ipc::ws
