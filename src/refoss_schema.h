#pragma once

#include "phi/adapter/sdk/sidecar.h"

namespace phicore::refoss::ipc {

inline constexpr const char kPluginType[] = "refoss";

phicore::adapter::v1::Utf8String displayName();
phicore::adapter::v1::Utf8String description();
phicore::adapter::v1::Utf8String iconSvg();

phicore::adapter::v1::AdapterCapabilities capabilities();
phicore::adapter::v1::JsonText configSchemaJson();

} // namespace phicore::refoss::ipc
