#pragma once

#include <QLoggingCategory>

namespace phicore::refoss::ipc {

Q_DECLARE_LOGGING_CATEGORY(adapterLog)

// Shortens device payloads before they end up in a log line.
QString logSnippet(const QByteArray &payload, int maxLength = 200);

} // namespace phicore::refoss::ipc
