#pragma once

#include "api_export.h"

#include <Python.h>

namespace safepy {

/**
 * Interpreter - owns the embedded CPython interpreter
 *
 * The first instance initializes Python and immediately releases the GIL so
 * worker threads can acquire it. Instances created while Python is already
 * running reuse it and never finalize it.
 */
class SAFEPY_API Interpreter {
public:
    Interpreter();
    ~Interpreter();

    Interpreter(const Interpreter&) = delete;
    Interpreter& operator=(const Interpreter&) = delete;

    bool Initialize();
    void Shutdown();

    bool IsInitialized() const { return initialized_; }
    bool OwnsInterpreter() const { return initialized_by_us_; }

    // GIL management for multi-threaded use
    // After initialization the GIL is released; call AcquireGIL() before
    // touching Python objects from the owning thread.
    void ReleaseGIL();
    void AcquireGIL();

private:
    bool initialized_ = false;
    bool initialized_by_us_ = false;  // True if we called py::initialize_interpreter()
    PyThreadState* main_thread_state_ = nullptr;  // Saved when releasing GIL
};

} // namespace safepy
