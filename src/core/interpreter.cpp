#include "safepy/interpreter.h"
#include <pybind11/embed.h>
#include <spdlog/spdlog.h>

namespace py = pybind11;

namespace safepy {

Interpreter::Interpreter() {
    Initialize();
}

Interpreter::~Interpreter() {
    Shutdown();
}

bool Interpreter::Initialize() {
    if (initialized_) {
        return true;
    }

    try {
        // Another Interpreter (or the host application) already started Python
        if (Py_IsInitialized()) {
            spdlog::info("Python interpreter already initialized (reusing existing)");
            initialized_ = true;
            initialized_by_us_ = false;
            return true;
        }

        py::initialize_interpreter();
        spdlog::info("Python interpreter initialized ({})", Py_GetVersion());
        initialized_ = true;
        initialized_by_us_ = true;

        // Worker threads take the GIL themselves; the owning thread gives it up here
        ReleaseGIL();
        spdlog::debug("GIL released for multi-threaded use");

        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize Python: {}", e.what());
        return false;
    }
}

void Interpreter::Shutdown() {
    if (initialized_ && initialized_by_us_) {
        AcquireGIL();
        py::finalize_interpreter();
        initialized_ = false;
        initialized_by_us_ = false;
        main_thread_state_ = nullptr;
        spdlog::info("Python interpreter finalized");
    } else if (initialized_) {
        // Shared interpreter, just mark as not initialized
        initialized_ = false;
    }
}

void Interpreter::ReleaseGIL() {
    if (main_thread_state_ == nullptr) {
        main_thread_state_ = PyEval_SaveThread();
    }
}

void Interpreter::AcquireGIL() {
    if (main_thread_state_ != nullptr) {
        PyEval_RestoreThread(main_thread_state_);
        main_thread_state_ = nullptr;
    }
}

} // namespace safepy
