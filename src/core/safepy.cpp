#include "safepy/safepy.h"
#include <spdlog/spdlog.h>
#include <memory>

namespace safepy {

static std::unique_ptr<Interpreter> g_interpreter;

bool Initialize() {
    if (g_interpreter && g_interpreter->IsInitialized()) {
        spdlog::warn("safepy already initialized");
        return true;
    }

    spdlog::info("Initializing safepy v{}.{}.{}",
                 SAFEPY_VERSION_MAJOR,
                 SAFEPY_VERSION_MINOR,
                 SAFEPY_VERSION_PATCH);

    g_interpreter = std::make_unique<Interpreter>();
    if (!g_interpreter->IsInitialized()) {
        spdlog::error("Embedded Python interpreter failed to start");
        g_interpreter.reset();
        return false;
    }
    return true;
}

void Shutdown() {
    if (!g_interpreter) {
        return;
    }

    spdlog::info("Shutting down safepy");
    g_interpreter.reset();
}

const char* GetVersionString() {
    return "0.1.0";
}

} // namespace safepy
