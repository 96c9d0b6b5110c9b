#include "refoss_digest.h"

#include <QCryptographicHash>
#include <QRandomGenerator>
#include <QRegularExpression>
#include <QStringList>

namespace phicore::refoss::ipc {

namespace {

QString md5Hex(const QString &input)
{
    return QString::fromLatin1(
        QCryptographicHash::hash(input.toUtf8(), QCryptographicHash::Md5).toHex());
}

QString selectQop(const QString &offered)
{
    if (offered.isEmpty())
        return {};
    const QStringList options = offered.split(QLatin1Char(','), Qt::SkipEmptyParts);
    for (const QString &option : options) {
        if (option.trimmed().compare(QLatin1String("auth"), Qt::CaseInsensitive) == 0)
            return QStringLiteral("auth");
    }
    // auth-int is not supported; fall back to the RFC 2069 form.
    return {};
}

} // namespace

DigestChallenge parseDigestChallenge(const QByteArray &header)
{
    DigestChallenge out;

    QString text = QString::fromLatin1(header).trimmed();
    if (text.startsWith(QLatin1String("Digest"), Qt::CaseInsensitive))
        text = text.mid(6);

    static const QRegularExpression re(QStringLiteral(R"((\w+)\s*=\s*(?:"([^"]*)"|([^\s,]+)))"));
    QRegularExpressionMatchIterator it = re.globalMatch(text);
    while (it.hasNext()) {
        const QRegularExpressionMatch match = it.next();
        const QString key = match.captured(1).toLower();
        const QString value = match.capturedStart(2) >= 0 ? match.captured(2) : match.captured(3);
        if (key == QLatin1String("realm"))
            out.realm = value;
        else if (key == QLatin1String("nonce"))
            out.nonce = value;
        else if (key == QLatin1String("qop"))
            out.qop = selectQop(value);
        else if (key == QLatin1String("opaque"))
            out.opaque = value;
        else if (key == QLatin1String("algorithm"))
            out.algorithm = value;
    }

    return out;
}

QString digestResponse(const DigestChallenge &challenge,
                       const QString &username,
                       const QString &password,
                       const QByteArray &method,
                       const QString &uri,
                       const QString &nonceCount,
                       const QString &clientNonce)
{
    QString ha1 = md5Hex(QStringLiteral("%1:%2:%3").arg(username, challenge.realm, password));
    if (challenge.algorithm.compare(QLatin1String("MD5-sess"), Qt::CaseInsensitive) == 0)
        ha1 = md5Hex(QStringLiteral("%1:%2:%3").arg(ha1, challenge.nonce, clientNonce));

    const QString ha2 = md5Hex(QString::fromLatin1(method) + QLatin1Char(':') + uri);

    if (!challenge.qop.isEmpty()) {
        return md5Hex(QStringList{ha1, challenge.nonce, nonceCount, clientNonce, challenge.qop, ha2}
                          .join(QLatin1Char(':')));
    }
    return md5Hex(QStringList{ha1, challenge.nonce, ha2}.join(QLatin1Char(':')));
}

QByteArray buildDigestAuthorization(const DigestChallenge &challenge,
                                    const QString &username,
                                    const QString &password,
                                    const QByteArray &method,
                                    const QString &uri,
                                    quint32 nonceCount,
                                    const QString &clientNonce)
{
    const QString nc = nonceCountHex(nonceCount);
    const QString response = digestResponse(challenge, username, password, method, uri, nc, clientNonce);

    QString header = QStringLiteral("Digest username=\"%1\", realm=\"%2\", nonce=\"%3\", uri=\"%4\", response=\"%5\"")
                         .arg(username, challenge.realm, challenge.nonce, uri, response);
    if (!challenge.algorithm.isEmpty())
        header += QStringLiteral(", algorithm=%1").arg(challenge.algorithm);
    if (!challenge.qop.isEmpty())
        header += QStringLiteral(", qop=%1, nc=%2, cnonce=\"%3\"").arg(challenge.qop, nc, clientNonce);
    if (!challenge.opaque.isEmpty())
        header += QStringLiteral(", opaque=\"%1\"").arg(challenge.opaque);

    return header.toUtf8();
}

QString makeClientNonce()
{
    QByteArray bytes(8, Qt::Uninitialized);
    for (int i = 0; i < bytes.size(); ++i)
        bytes[i] = static_cast<char>(QRandomGenerator::global()->bounded(256));
    return QString::fromLatin1(bytes.toHex());
}

QString nonceCountHex(quint32 nonceCount)
{
    return QStringLiteral("%1").arg(nonceCount, 8, 16, QLatin1Char('0'));
}

} // namespace phicore::refoss::ipc
