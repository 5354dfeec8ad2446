#include "safepy/cancellation.h"
#include <pybind11/embed.h>
#include <spdlog/spdlog.h>

namespace py = pybind11;

namespace safepy {

bool AsyncInterruptHook::RequestCancel(unsigned long python_thread_id) {
    if (python_thread_id == 0 || !Py_IsInitialized()) {
        return false;
    }

    // The worker releases the GIL every switch interval, so this does not
    // wait on a tight loop for long.
    py::gil_scoped_acquire acquire;
    int affected = PyThreadState_SetAsyncExc(python_thread_id, PyExc_KeyboardInterrupt);
    if (affected == 0) {
        spdlog::debug("Worker thread {} already finished, nothing to interrupt", python_thread_id);
        return false;
    }
    if (affected > 1) {
        // More than one thread state matched; undo to avoid hitting the wrong thread
        PyThreadState_SetAsyncExc(python_thread_id, nullptr);
        spdlog::error("Interrupt matched {} thread states, request revoked", affected);
        return false;
    }

    spdlog::info("KeyboardInterrupt scheduled in worker thread {}", python_thread_id);
    return true;
}

} // namespace safepy
