#pragma once

#include <QByteArray>
#include <QString>

namespace phicore::refoss::ipc {

struct DigestChallenge {
    QString realm;
    QString nonce;
    QString qop;
    QString opaque;
    QString algorithm;

    bool isValid() const { return !nonce.isEmpty(); }
};

// Parses a "WWW-Authenticate: Digest ..." header value. When the server
// offers a qop list, "auth" is selected.
DigestChallenge parseDigestChallenge(const QByteArray &header);

QString digestResponse(const DigestChallenge &challenge,
                       const QString &username,
                       const QString &password,
                       const QByteArray &method,
                       const QString &uri,
                       const QString &nonceCount,
                       const QString &clientNonce);

QByteArray buildDigestAuthorization(const DigestChallenge &challenge,
                                    const QString &username,
                                    const QString &password,
                                    const QByteArray &method,
                                    const QString &uri,
                                    quint32 nonceCount,
                                    const QString &clientNonce);

QString makeClientNonce();
QString nonceCountHex(quint32 nonceCount);

} // namespace phicore::refoss::ipc
