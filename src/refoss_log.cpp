#include "refoss_log.h"

namespace phicore::refoss::ipc {

Q_LOGGING_CATEGORY(adapterLog, "phi-core.adapters.refoss");

QString logSnippet(const QByteArray &payload, int maxLength)
{
    const QString text = QString::fromUtf8(payload).simplified();
    if (maxLength <= 0 || text.size() <= maxLength)
        return text;
    return text.left(maxLength) + QStringLiteral("...");
}

} // namespace phicore::refoss::ipc
