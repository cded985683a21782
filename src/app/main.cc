#include "app/app.h"

#include "core/log.h"

// Program entry point
// Responsible for: reading configuration, creating the app and handing control to its run loop.
// Should NOT do: implement track or train behaviour.
int main() {
    railyard::core::initializeLogLevelFromEnvironment();
    RY_LOGI("main") << "startup";
    railyard::app::App app(railyard::app::loadAppConfigFromEnvironment());

    if (!app.init()) {
        RY_LOGE("main") << "app init failed, exiting";
        return 1;
    }

    app.run();
    app.shutdown();
    RY_LOGI("main") << "exit success";
    return 0;
}
