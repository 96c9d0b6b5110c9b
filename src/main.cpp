#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <thread>

#include <QCoreApplication>
#include <QEventLoop>
#include <QLoggingCategory>

#include "refoss_schema.h"
#include "refoss_sidecar.h"
#include "phi/adapter/sdk/sidecar.h"

namespace {

namespace sdk = phicore::adapter::sdk;
namespace v1 = phicore::adapter::v1;

std::atomic_bool g_running{true};

void handleSignal(int)
{
    g_running.store(false);
}

v1::Utf8String socketPathFrom(int argc, char **argv)
{
    if (argc > 1)
        return argv[1];
    if (const char *env = std::getenv("PHI_ADAPTER_SOCKET_PATH"))
        return env;
    return "/tmp/phi-adapter-refoss-ipc.sock";
}

bool debugRequested()
{
    const char *env = std::getenv("PHI_ADAPTER_REFOSS_DEBUG");
    return env && std::strcmp(env, "0") != 0 && env[0] != '\0';
}

class RefossFactory final : public sdk::AdapterFactory
{
public:
    v1::Utf8String pluginType() const override
    {
        return phicore::refoss::ipc::kPluginType;
    }

    std::unique_ptr<sdk::AdapterSidecar> create() const override
    {
        return std::make_unique<phicore::refoss::ipc::RefossSidecar>();
    }
};

} // namespace

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    if (debugRequested())
        QLoggingCategory::setFilterRules(QStringLiteral("phi-core.adapters.refoss.debug=true"));

    const v1::Utf8String socketPath = socketPathFrom(argc, argv);
    std::cerr << "starting phi_adapter_refoss_ipc for pluginType=" << phicore::refoss::ipc::kPluginType
              << " socket=" << socketPath << '\n';

    RefossFactory factory;
    sdk::SidecarHost host(socketPath, factory);

    v1::Utf8String error;
    if (!host.start(&error)) {
        std::cerr << "failed to start sidecar host: " << error << '\n';
        return 1;
    }

    while (g_running.load()) {
        if (!host.pollOnce(std::chrono::milliseconds(100), &error)) {
            std::cerr << "poll failed: " << error << '\n';
            std::this_thread::sleep_for(std::chrono::milliseconds(250));
        }

        auto *adapter = dynamic_cast<phicore::refoss::ipc::RefossSidecar *>(host.adapter());
        if (adapter)
            adapter->tick();

        // Coordinator timers, webhook pushes and RPC replies run on the Qt loop.
        QCoreApplication::processEvents(QEventLoop::AllEvents, 20);
    }

    // Remove the device-side hooks while the event loop can still carry the RPCs.
    if (auto *adapter = dynamic_cast<phicore::refoss::ipc::RefossSidecar *>(host.adapter()))
        adapter->shutdown();

    host.stop();
    std::cerr << "stopping phi_adapter_refoss_ipc" << '\n';
    return 0;
}
